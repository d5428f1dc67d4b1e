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

#include "fasttdms/format/segment_header_decoder.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fasttdms/core/errors.h"
#include "fasttdms/core/object_path.h"
#include "fasttdms/format/constants.h"
#include "fasttdms/testing/segment_builder.h"

namespace fasttdms {
namespace format {

using fasttdms::testing::ObjectSpec;
using fasttdms::testing::SegmentBuilder;

namespace {

const std::string kA = ChannelPathString("g", "a");
const std::string kB = ChannelPathString("g", "b");

/// Drain a stream into a vector, failing on the first error
absl::StatusOr<std::vector<SegmentDescriptor>> DecodeAll(
    const std::vector<uint8_t>& file,
    const OpenOptions& options = OpenOptions()) {
  MemorySource source(file);
  SegmentStream stream(source, file.size(), options);
  std::vector<SegmentDescriptor> out;
  while (true) {
    auto next = stream.Next();
    if (!next.ok()) {
      return next.status();
    }
    if (!next->has_value()) {
      return out;
    }
    out.push_back(**next);
  }
}

}  // namespace

// ============================================================================
// Lead-in Tests
// ============================================================================

TEST(SegmentHeaderDecoderTest, SingleContiguousSegment) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddObject("/")
      .AddObject("/'g'")
      .AddChannel(kA, DataType::kI32, 3)
      .Values<int32_t>({1, 2, 3})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ(segments->size(), 1u);

  const SegmentDescriptor& s = segments->front();
  EXPECT_EQ(s.header_offset, 0u);
  EXPECT_EQ(s.layout, LayoutKind::kContiguous);
  EXPECT_EQ(s.byte_order, ByteOrder::kLittle);
  ASSERT_TRUE(s.raw_data_length.has_value());
  EXPECT_EQ(*s.raw_data_length, 12u);
  EXPECT_EQ(s.raw_data_offset + 12, file.size());
  EXPECT_EQ(s.next_segment_offset, file.size());
  ASSERT_EQ(s.channels.size(), 1u);
  EXPECT_EQ(s.channels[0].path, kA);
  EXPECT_EQ(s.channels[0].data_type, DataType::kI32);
  EXPECT_EQ(s.channels[0].width, 4u);
  EXPECT_EQ(s.channels[0].value_count, 3u);
  EXPECT_EQ(s.objects.size(), 3u);
}

TEST(SegmentHeaderDecoderTest, BigEndianAndInterleavedFlags) {
  std::vector<uint8_t> file;
  SegmentBuilder(ByteOrder::kBig)
      .NewObjectList()
      .Interleaved()
      .AddChannel(kA, DataType::kU16, 2)
      .AddChannel(kB, DataType::kU16, 2)
      .Values<uint16_t>({1, 10, 2, 20})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ(segments->size(), 1u);
  EXPECT_EQ(segments->front().byte_order, ByteOrder::kBig);
  EXPECT_EQ(segments->front().layout, LayoutKind::kInterleaved);
  EXPECT_EQ(segments->front().channels.size(), 2u);
  EXPECT_EQ(*segments->front().raw_data_length, 8u);
}

TEST(SegmentHeaderDecoderTest, BadTag) {
  std::vector<uint8_t> file;
  SegmentBuilder().NewObjectList().AddObject("/").AppendTo(file);
  file[0] = 'X';

  auto segments = DecodeAll(file);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status()))
      << segments.status();
}

TEST(SegmentHeaderDecoderTest, VersionCheck) {
  std::vector<uint8_t> file;
  SegmentBuilder().Version(4711).NewObjectList().AddObject("/").AppendTo(
      file);

  auto strict = DecodeAll(file);
  ASSERT_FALSE(strict.ok());
  EXPECT_TRUE(errors::IsFormatError(strict.status())) << strict.status();

  OpenOptions lenient;
  lenient.strict_version = false;
  auto relaxed = DecodeAll(file, lenient);
  ASSERT_TRUE(relaxed.ok()) << relaxed.status();
  EXPECT_EQ(relaxed->size(), 1u);

  std::vector<uint8_t> old_file;
  SegmentBuilder().Version(4712).NewObjectList().AddObject("/").AppendTo(
      old_file);
  EXPECT_TRUE(DecodeAll(old_file).ok());
}

TEST(SegmentHeaderDecoderTest, MetadataLimit) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddObject("/", {{"description", PropertyValue(std::string(64, 'x'))}})
      .AppendTo(file);

  OpenOptions options;
  options.max_metadata_bytes = 16;
  auto segments = DecodeAll(file, options);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status()));
}

TEST(SegmentHeaderDecoderTest, UnknownLengthSentinel) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .UnknownLength()
      .AddChannel(kA, DataType::kI16, 4)
      .Values<int16_t>({1, 2, 3, 4})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ(segments->size(), 1u);
  EXPECT_FALSE(segments->front().raw_data_length.has_value());
  EXPECT_FALSE(segments->front().next_segment_offset.has_value());
}

TEST(SegmentHeaderDecoderTest, DeclaredLengthPastEndIsTreatedAsUnknown) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kI16, 4)
      .Values<int16_t>({1, 2, 3, 4})
      .AppendTo(file);
  file.resize(file.size() - 3);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ(segments->size(), 1u);
  EXPECT_FALSE(segments->front().raw_data_length.has_value());
}

TEST(SegmentHeaderDecoderTest, IncompleteTrailingLeadInEndsStream) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kU8, 2)
      .Values<uint8_t>({1, 2})
      .AppendTo(file);
  const size_t first_length = file.size();
  SegmentBuilder().WithoutMetadata().Values<uint8_t>({3, 4}).AppendTo(file);
  file.resize(first_length + 10);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  EXPECT_EQ(segments->size(), 1u);
}

// ============================================================================
// Active Channel List Tests
// ============================================================================

TEST(SegmentHeaderDecoderTest, SegmentWithoutMetadataReusesChannels) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kI32, 1)
      .AddChannel(kB, DataType::kI32, 1)
      .Values<int32_t>({1, 2})
      .AppendTo(file);
  SegmentBuilder().WithoutMetadata().Values<int32_t>({3, 4}).AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ(segments->size(), 2u);
  const SegmentDescriptor& second = (*segments)[1];
  ASSERT_EQ(second.channels.size(), 2u);
  EXPECT_EQ(second.channels[0].path, kA);
  EXPECT_EQ(second.channels[1].path, kB);
  EXPECT_TRUE(second.objects.empty());
  EXPECT_EQ(second.header_offset, (*segments)[0].next_segment_offset);
}

TEST(SegmentHeaderDecoderTest, IncrementalMetadataAppendsChannel) {
  const std::string c = ChannelPathString("g", "c");
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kI32, 1)
      .Values<int32_t>({1})
      .AppendTo(file);
  SegmentBuilder()
      .AddChannel(c, DataType::kI32, 1)
      .Values<int32_t>({2, 3})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ((*segments)[1].channels.size(), 2u);
  EXPECT_EQ((*segments)[1].channels[0].path, kA);
  EXPECT_EQ((*segments)[1].channels[1].path, c);
}

TEST(SegmentHeaderDecoderTest, NewObjectListReplacesChannels) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kI32, 1)
      .Values<int32_t>({1})
      .AppendTo(file);
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kB, DataType::kI32, 1)
      .Values<int32_t>({2})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ((*segments)[1].channels.size(), 1u);
  EXPECT_EQ((*segments)[1].channels[0].path, kB);
}

TEST(SegmentHeaderDecoderTest, MatchPreviousReusesFormat) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kDoubleFloat, 2)
      .Values<double>({1.0, 2.0})
      .AppendTo(file);
  SegmentBuilder()
      .NewObjectList()
      .ReuseChannel(kA)
      .Values<double>({3.0, 4.0})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ((*segments)[1].channels.size(), 1u);
  EXPECT_EQ((*segments)[1].channels[0].data_type, DataType::kDoubleFloat);
  EXPECT_EQ((*segments)[1].channels[0].value_count, 2u);
}

TEST(SegmentHeaderDecoderTest, MatchPreviousWithoutHistoryIsFormatError) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .ReuseChannel(kA)
      .Values<int32_t>({1})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status())) << segments.status();
}

TEST(SegmentHeaderDecoderTest, ObjectWithoutDataOnlyUpdatesProperties) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kI32, 1)
      .Values<int32_t>({1})
      .AppendTo(file);
  SegmentBuilder()
      .AddObject(kA, {{"unit", PropertyValue(std::string("mV"))}})
      .Values<int32_t>({2})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  const SegmentDescriptor& second = (*segments)[1];
  ASSERT_EQ(second.channels.size(), 1u);
  EXPECT_EQ(second.channels[0].path, kA);
  ASSERT_EQ(second.objects.size(), 1u);
  ASSERT_EQ(second.objects[0].properties.size(), 1u);
  EXPECT_EQ(second.objects[0].properties[0].first, "unit");
  EXPECT_EQ(std::get<std::string>(second.objects[0].properties[0].second),
            "mV");
}

TEST(SegmentHeaderDecoderTest, MetadataOnlySegmentHasNoChannels) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kI32, 1)
      .Values<int32_t>({1})
      .AppendTo(file);
  SegmentBuilder()
      .AddObject("/", {{"name", PropertyValue(std::string("run"))}})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  ASSERT_EQ(segments->size(), 2u);
  EXPECT_FALSE((*segments)[1].HasRawData());
}

// ============================================================================
// Property Tests
// ============================================================================

TEST(SegmentHeaderDecoderTest, PropertyTypes) {
  const Timestamp when{.seconds = 3'000'000'000, .fractions = 42};
  for (ByteOrder order : {ByteOrder::kLittle, ByteOrder::kBig}) {
    std::vector<uint8_t> file;
    SegmentBuilder(order)
        .NewObjectList()
        .AddObject("/'g'", {{"i8", PropertyValue(int8_t{-8})},
                            {"u64", PropertyValue(uint64_t{1} << 40)},
                            {"f", PropertyValue(1.5f)},
                            {"d", PropertyValue(-2.25)},
                            {"flag", PropertyValue(true)},
                            {"when", PropertyValue(when)},
                            {"text", PropertyValue(std::string("hello"))}})
        .AppendTo(file);

    auto segments = DecodeAll(file);
    ASSERT_TRUE(segments.ok()) << segments.status();
    const auto& props = segments->front().objects[0].properties;
    ASSERT_EQ(props.size(), 7u);
    EXPECT_EQ(std::get<int8_t>(props[0].second), -8);
    EXPECT_EQ(std::get<uint64_t>(props[1].second), uint64_t{1} << 40);
    EXPECT_FLOAT_EQ(std::get<float>(props[2].second), 1.5f);
    EXPECT_DOUBLE_EQ(std::get<double>(props[3].second), -2.25);
    EXPECT_TRUE(std::get<bool>(props[4].second));
    EXPECT_EQ(std::get<Timestamp>(props[5].second), when);
    EXPECT_EQ(std::get<std::string>(props[6].second), "hello");
  }
}

// ============================================================================
// Rejected Layout Tests
// ============================================================================

TEST(SegmentHeaderDecoderTest, DivergentValueCountsAreRejected) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel(kA, DataType::kI32, 2)
      .AddChannel(kB, DataType::kI32, 3)
      .Values<int32_t>({1, 2, 3, 4, 5})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status())) << segments.status();
}

TEST(SegmentHeaderDecoderTest, DimensionOtherThanOneIsRejected) {
  ObjectSpec object;
  object.path = kA;
  object.raw_index = ObjectSpec::RawIndex::kNew;
  object.data_type = DataType::kI32;
  object.dimension = 2;
  object.value_count = 1;

  std::vector<uint8_t> file;
  SegmentBuilder().NewObjectList().Add(object).Values<int32_t>({1}).AppendTo(
      file);

  auto segments = DecodeAll(file);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status())) << segments.status();
}

TEST(SegmentHeaderDecoderTest, DAQmxRawDataIsRejected) {
  ObjectSpec object;
  object.path = kA;
  object.raw_index = ObjectSpec::RawIndex::kCustom;
  object.custom_index = kRawIndexDAQmxFormatChanging;

  std::vector<uint8_t> file;
  SegmentBuilder().NewObjectList().Add(object).Values<int32_t>({1}).AppendTo(
      file);

  auto segments = DecodeAll(file);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status())) << segments.status();
}

TEST(SegmentHeaderDecoderTest, StringInInterleavedSegmentIsRejected) {
  ObjectSpec text;
  text.path = kB;
  text.raw_index = ObjectSpec::RawIndex::kNew;
  text.data_type = DataType::kString;
  text.value_count = 1;
  text.total_size_bytes = 8;

  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .Interleaved()
      .AddChannel(kA, DataType::kI32, 1)
      .Add(text)
      .RawData(std::vector<uint8_t>(12, 0))
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status())) << segments.status();
}

TEST(SegmentHeaderDecoderTest, StringChannelCarriesTotalSize) {
  ObjectSpec text;
  text.path = kA;
  text.raw_index = ObjectSpec::RawIndex::kNew;
  text.data_type = DataType::kString;
  text.value_count = 2;
  text.total_size_bytes = 14;

  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .Add(text)
      .RawData(std::vector<uint8_t>(14, 0))
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_TRUE(segments.ok()) << segments.status();
  const ChannelEntry& entry = segments->front().channels[0];
  EXPECT_TRUE(entry.IsVariableWidth());
  EXPECT_EQ(entry.total_size_bytes, 14u);
  EXPECT_EQ(entry.ChunkBytes(), 14u);
}

TEST(SegmentHeaderDecoderTest, RawDataOnNonChannelObjectIsRejected) {
  std::vector<uint8_t> file;
  SegmentBuilder()
      .NewObjectList()
      .AddChannel("/'g'", DataType::kI32, 1)
      .Values<int32_t>({1})
      .AppendTo(file);

  auto segments = DecodeAll(file);
  ASSERT_FALSE(segments.ok());
  EXPECT_TRUE(errors::IsFormatError(segments.status())) << segments.status();
}

}  // namespace format
}  // namespace fasttdms
