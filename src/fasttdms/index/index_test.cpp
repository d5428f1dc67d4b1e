// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fasttdms/index/index.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "fasttdms/core/errors.h"
#include "fasttdms/core/object_path.h"

namespace fasttdms {

namespace {

const std::string kA = ChannelPathString("g", "A");
const std::string kB = ChannelPathString("g", "B");
const std::string kC = ChannelPathString("g", "C");

/// Descriptor source over a prepared list
class ListSource final : public SegmentDescriptorSource {
 public:
  explicit ListSource(std::vector<SegmentDescriptor> descriptors)
      : descriptors_(std::move(descriptors)) {}

  absl::StatusOr<std::optional<SegmentDescriptor>> Next() override {
    if (next_ >= descriptors_.size()) {
      return std::nullopt;
    }
    return descriptors_[next_++];
  }

 private:
  std::vector<SegmentDescriptor> descriptors_;
  size_t next_ = 0;
};

ChannelEntry I32(const std::string& path, uint64_t count) {
  return ChannelEntry{.path = path,
                      .data_type = DataType::kI32,
                      .width = 4,
                      .value_count = count};
}

SegmentDescriptor Segment(uint64_t data_offset,
                          std::optional<uint64_t> data_length,
                          LayoutKind layout,
                          std::vector<ChannelEntry> channels) {
  SegmentDescriptor d;
  d.header_offset = data_offset - 28;
  d.raw_data_offset = data_offset;
  d.raw_data_length = data_length;
  if (data_length.has_value()) {
    d.next_segment_offset = data_offset + *data_length;
  }
  d.layout = layout;
  d.channels = std::move(channels);
  return d;
}

absl::StatusOr<Index> BuildIndex(std::vector<SegmentDescriptor> descriptors,
                                 uint64_t file_length) {
  ListSource source(std::move(descriptors));
  return Index::Build(source, file_length);
}

/// Two segments: interleaved A,B x10 then contiguous A,B,C x5
absl::StatusOr<Index> BuildScenarioIndex() {
  std::vector<SegmentDescriptor> segments;
  segments.push_back(Segment(100, 80, LayoutKind::kInterleaved,
                             {I32(kA, 10), I32(kB, 10)}));
  segments.push_back(Segment(300, 60, LayoutKind::kContiguous,
                             {I32(kA, 5), I32(kB, 5), I32(kC, 5)}));
  return BuildIndex(std::move(segments), 360);
}

}  // namespace

// ============================================================================
// Build Tests
// ============================================================================

TEST(IndexBuildTest, RegistersChannelsAndGroups) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  EXPECT_EQ(index->GetSegments().size(), 2u);
  EXPECT_EQ(index->GetChannelCount(), 3u);
  EXPECT_EQ(index->GroupNames(), (std::vector<std::string>{"g"}));

  auto paths = index->ChannelPaths("g");
  ASSERT_TRUE(paths.ok()) << paths.status();
  EXPECT_EQ(*paths, (std::vector<std::string>{kA, kB, kC}));

  EXPECT_EQ(*index->TotalValues(kA), 15u);
  EXPECT_EQ(*index->TotalValues(kB), 15u);
  EXPECT_EQ(*index->TotalValues(kC), 5u);
}

TEST(IndexBuildTest, InterleavedGeometry) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  const SegmentInfo& segment = index->GetSegment(0);
  ASSERT_TRUE(std::holds_alternative<InterleavedLayout>(segment.layout));
  EXPECT_EQ(std::get<InterleavedLayout>(segment.layout).stride, 8u);

  auto locations = index->GetLocations(kB);
  ASSERT_TRUE(locations.ok()) << locations.status();
  ASSERT_EQ(locations->size(), 2u);
  EXPECT_EQ((*locations)[0].element_offset, 4u);
  EXPECT_EQ((*locations)[0].stride, 8u);
  EXPECT_EQ((*locations)[0].value_count, 10u);
}

TEST(IndexBuildTest, ContiguousGeometry) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  auto locations = index->GetLocations(kC);
  ASSERT_TRUE(locations.ok()) << locations.status();
  ASSERT_EQ(locations->size(), 1u);
  EXPECT_EQ((*locations)[0].segment, 1u);
  EXPECT_EQ((*locations)[0].block_offset, 40u);
  EXPECT_EQ((*locations)[0].byte_length, 20u);
}

TEST(IndexBuildTest, UnknownLengthDropsIncompleteRecord) {
  // Interleaved record of 8 bytes; 4 full records plus 7 trailing bytes
  auto index = BuildIndex(
      {Segment(28, std::nullopt, LayoutKind::kInterleaved,
               {I32(kA, 100), I32(kB, 100)})},
      28 + 4 * 8 + 7);
  ASSERT_TRUE(index.ok()) << index.status();

  EXPECT_EQ(*index->TotalValues(kA), 4u);
  EXPECT_EQ(*index->TotalValues(kB), 4u);
  const SegmentInfo& segment = index->GetSegment(0);
  EXPECT_TRUE(segment.length_was_unknown);
  EXPECT_EQ(segment.data_length, 39u);
  EXPECT_EQ(segment.dropped_bytes, 7u);
}

TEST(IndexBuildTest, UnknownLengthContiguousClampsPerChannel) {
  // Chunk of A(3) then B(3); the file ends two values into B
  auto index = BuildIndex(
      {Segment(28, std::nullopt, LayoutKind::kContiguous,
               {I32(kA, 3), I32(kB, 3)})},
      28 + 12 + 8 + 3);
  ASSERT_TRUE(index.ok()) << index.status();

  EXPECT_EQ(*index->TotalValues(kA), 3u);
  EXPECT_EQ(*index->TotalValues(kB), 2u);
  EXPECT_EQ(index->GetSegment(0).dropped_bytes, 3u);
}

TEST(IndexBuildTest, MultipleContiguousChunks) {
  auto index = BuildIndex({Segment(28, 48, LayoutKind::kContiguous,
                                   {I32(kA, 3), I32(kB, 3)})},
                          28 + 48);
  ASSERT_TRUE(index.ok()) << index.status();

  auto locations = index->GetLocations(kB);
  ASSERT_TRUE(locations.ok()) << locations.status();
  ASSERT_EQ(locations->size(), 2u);
  EXPECT_EQ((*locations)[0].block_offset, 12u);
  EXPECT_EQ((*locations)[1].block_offset, 36u);
  EXPECT_EQ(*index->TotalValues(kB), 6u);
}

TEST(IndexBuildTest, DeclaredLengthPastEndOfFileIsFormatError) {
  auto index = BuildIndex(
      {Segment(28, 100, LayoutKind::kContiguous, {I32(kA, 25)})}, 28 + 50);
  ASSERT_FALSE(index.ok());
  EXPECT_TRUE(errors::IsFormatError(index.status())) << index.status();
}

TEST(IndexBuildTest, VariableWidthInterleavedIsFormatError) {
  ChannelEntry text{.path = kB,
                    .data_type = DataType::kString,
                    .width = 0,
                    .value_count = 2,
                    .total_size_bytes = 10};
  auto index = BuildIndex(
      {Segment(28, 18, LayoutKind::kInterleaved, {I32(kA, 2), text})},
      28 + 18);
  ASSERT_FALSE(index.ok());
  EXPECT_TRUE(errors::IsFormatError(index.status())) << index.status();
}

TEST(IndexBuildTest, ChannelWithoutDataIsRegistered) {
  SegmentDescriptor d = Segment(28, 0, LayoutKind::kContiguous, {});
  d.objects.push_back(ObjectUpdate{
      .path = kA, .properties = {{"unit", PropertyValue(std::string("V"))}}});

  auto index = BuildIndex({d}, 28);
  ASSERT_TRUE(index.ok()) << index.status();
  EXPECT_TRUE(index->HasChannel(kA));
  EXPECT_EQ(*index->TotalValues(kA), 0u);

  auto info = index->GetChannelInfo(kA);
  ASSERT_TRUE(info.ok()) << info.status();
  EXPECT_EQ(info->group, "g");
  EXPECT_EQ(info->name, "A");
  EXPECT_EQ(info->location_count, 0u);
}

// ============================================================================
// Lookup Tests
// ============================================================================

TEST(IndexLookupTest, RangeAcrossSegments) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  auto slices = index->Lookup(kA, ValueRange{.start = 8, .count = 5});
  ASSERT_TRUE(slices.ok()) << slices.status();
  ASSERT_EQ(slices->size(), 2u);

  EXPECT_EQ((*slices)[0].location->segment, 0u);
  EXPECT_EQ((*slices)[0].local_start, 8u);
  EXPECT_EQ((*slices)[0].count, 2u);
  EXPECT_EQ((*slices)[0].global_start, 8u);

  EXPECT_EQ((*slices)[1].location->segment, 1u);
  EXPECT_EQ((*slices)[1].local_start, 0u);
  EXPECT_EQ((*slices)[1].count, 3u);
  EXPECT_EQ((*slices)[1].global_start, 10u);
}

TEST(IndexLookupTest, OpenEndedRange) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  auto all = index->Lookup(kA, ValueRange::All());
  ASSERT_TRUE(all.ok()) << all.status();
  uint64_t total = 0;
  for (const auto& slice : *all) {
    total += slice.count;
  }
  EXPECT_EQ(total, 15u);

  auto tail = index->Lookup(kA, ValueRange{.start = 12});
  ASSERT_TRUE(tail.ok()) << tail.status();
  ASSERT_EQ(tail->size(), 1u);
  EXPECT_EQ((*tail)[0].local_start, 2u);
  EXPECT_EQ((*tail)[0].count, 3u);
}

TEST(IndexLookupTest, EmptyRangeHasNoSlices) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  auto slices = index->Lookup(kA, ValueRange{.start = 15, .count = 0});
  ASSERT_TRUE(slices.ok()) << slices.status();
  EXPECT_TRUE(slices->empty());
}

TEST(IndexLookupTest, Errors) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  auto unknown = index->Lookup(ChannelPathString("g", "Z"), ValueRange::All());
  EXPECT_TRUE(errors::IsUnknownChannel(unknown.status())) << unknown.status();

  auto past_start = index->Lookup(kC, ValueRange{.start = 6, .count = 0});
  EXPECT_TRUE(errors::IsRangeOutOfBounds(past_start.status()));

  auto too_long = index->Lookup(kC, ValueRange{.start = 3, .count = 3});
  EXPECT_TRUE(errors::IsRangeOutOfBounds(too_long.status()));
}

// ============================================================================
// Property Tests
// ============================================================================

TEST(IndexPropertiesTest, LaterSegmentOverridesByName) {
  SegmentDescriptor s0 = Segment(28, 4, LayoutKind::kContiguous, {I32(kA, 1)});
  s0.objects.push_back(ObjectUpdate{
      .path = kA,
      .properties = {{"unit", PropertyValue(std::string("V"))},
                     {"gain", PropertyValue(2.0)}}});
  SegmentDescriptor s1 = Segment(60, 4, LayoutKind::kContiguous, {I32(kA, 1)});
  SegmentDescriptor s2 = Segment(92, 4, LayoutKind::kContiguous, {I32(kA, 1)});
  s2.objects.push_back(ObjectUpdate{
      .path = kA, .properties = {{"unit", PropertyValue(std::string("mV"))}}});

  auto index = BuildIndex({s0, s1, s2}, 96);
  ASSERT_TRUE(index.ok()) << index.status();

  auto properties = index->Properties(kA);
  ASSERT_TRUE(properties.ok()) << properties.status();
  EXPECT_EQ(std::get<std::string>(properties->at("unit")), "mV");
  EXPECT_DOUBLE_EQ(std::get<double>(properties->at("gain")), 2.0);
}

TEST(IndexPropertiesTest, RootGroupAndChannelAreIndependent) {
  SegmentDescriptor d = Segment(28, 4, LayoutKind::kContiguous, {I32(kA, 1)});
  d.objects.push_back(ObjectUpdate{
      .path = "/", .properties = {{"name", PropertyValue(std::string("run"))}}});
  d.objects.push_back(ObjectUpdate{
      .path = GroupPathString("g"),
      .properties = {{"unit", PropertyValue(std::string("V"))}}});

  auto index = BuildIndex({d}, 32);
  ASSERT_TRUE(index.ok()) << index.status();

  auto root = index->Properties("/");
  ASSERT_TRUE(root.ok()) << root.status();
  EXPECT_EQ(std::get<std::string>(root->at("name")), "run");

  auto group = index->Properties(GroupPathString("g"));
  ASSERT_TRUE(group.ok()) << group.status();
  EXPECT_EQ(group->count("unit"), 1u);

  auto channel = index->Properties(kA);
  ASSERT_TRUE(channel.ok()) << channel.status();
  EXPECT_TRUE(channel->empty());
}

TEST(IndexPropertiesTest, UnknownObjects) {
  auto index = BuildScenarioIndex();
  ASSERT_TRUE(index.ok()) << index.status();

  auto group = index->Properties(GroupPathString("missing"));
  EXPECT_TRUE(errors::IsUnknownGroup(group.status())) << group.status();

  auto channel = index->Properties(ChannelPathString("g", "missing"));
  EXPECT_TRUE(errors::IsUnknownChannel(channel.status())) << channel.status();

  auto malformed = index->Properties("not a path");
  EXPECT_TRUE(errors::IsFormatError(malformed.status()));
}

}  // namespace fasttdms
