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

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/core/object_path.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {

// ============================================================================
// Index
// ============================================================================

absl::StatusOr<Index> Index::Build(SegmentDescriptorSource& source,
                                   uint64_t file_length) {
  IndexBuilder builder(file_length);

  while (true) {
    DECLARE_ASSIGN_OR_RETURN(
        std::optional<SegmentDescriptor>, descriptor, source.Next(),
        absl::StrFormat("Failed to decode segment %zu",
                        builder.GetSegmentCount()));
    if (!descriptor.has_value()) {
      break;
    }
    RETURN_IF_ERROR(builder.AddSegment(*descriptor),
                    absl::StrFormat("Failed to index segment %zu",
                                    builder.GetSegmentCount()));
  }

  Index index = std::move(builder).Build();
  VLOG(1) << "Indexed " << index.segments_.size() << " segment(s), "
          << index.channels_.size() << " channel(s), "
          << index.groups_.size() << " group(s)";
  return index;
}

const Index::ChannelRecord* Index::FindChannel(std::string_view path) const {
  auto it = channel_ids_.find(std::string(path));
  if (it == channel_ids_.end()) {
    return nullptr;
  }
  return &channels_[it->second];
}

bool Index::HasChannel(std::string_view path) const {
  return FindChannel(path) != nullptr;
}

absl::StatusOr<std::vector<LocationSlice>> Index::Lookup(
    std::string_view path, ValueRange range) const {
  const ChannelRecord* channel = FindChannel(path);
  if (channel == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("%s %s", errors::kUnknownChannel, path));
  }

  const std::vector<uint64_t>& cumulative = channel->cumulative;
  const uint64_t total = cumulative.back();
  if (range.start > total) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        absl::StrFormat("%s start %d beyond %d values of %s",
                        errors::kRangeOutOfBounds, range.start, total, path));
  }

  const uint64_t count =
      range.IsOpenEnded() ? total - range.start : range.count;
  if (count > total - range.start) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        absl::StrFormat("%s [%d, +%d) exceeds %d values of %s",
                        errors::kRangeOutOfBounds, range.start, count, total,
                        path));
  }

  std::vector<LocationSlice> slices;
  if (count == 0) {
    return slices;
  }

  const uint64_t end = range.start + count;
  auto it = std::upper_bound(cumulative.begin(), cumulative.end(), range.start);
  size_t i = static_cast<size_t>(it - cumulative.begin()) - 1;

  for (; i < channel->locations.size() && cumulative[i] < end; ++i) {
    const uint64_t lo = std::max(range.start, cumulative[i]);
    const uint64_t hi = std::min(end, cumulative[i + 1]);
    slices.push_back(LocationSlice{.location = &channel->locations[i],
                                   .local_start = lo - cumulative[i],
                                   .count = hi - lo,
                                   .global_start = lo});
  }
  return slices;
}

absl::StatusOr<PropertyMap> Index::Properties(std::string_view path) const {
  DECLARE_ASSIGN_OR_RETURN(ObjectPath, object, ObjectPath::Parse(path),
                           "Invalid property path");

  if (object.IsRoot()) {
    return root_properties_;
  }

  if (object.IsGroup()) {
    auto it = group_ids_.find(object.group());
    if (it == group_ids_.end()) {
      return MAKE_STATUS(absl::StatusCode::kNotFound,
                         absl::StrFormat("%s %s", errors::kUnknownGroup, path));
    }
    return groups_[it->second].properties;
  }

  const ChannelRecord* channel = FindChannel(object.ToString());
  if (channel == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("%s %s", errors::kUnknownChannel, path));
  }
  return channel->properties;
}

absl::StatusOr<uint64_t> Index::TotalValues(std::string_view path) const {
  const ChannelRecord* channel = FindChannel(path);
  if (channel == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("%s %s", errors::kUnknownChannel, path));
  }
  return channel->cumulative.back();
}

absl::StatusOr<ChannelInfo> Index::GetChannelInfo(std::string_view path) const {
  const ChannelRecord* channel = FindChannel(path);
  if (channel == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("%s %s", errors::kUnknownChannel, path));
  }

  ChannelInfo info;
  info.path = channel->path;
  info.group = channel->group;
  info.name = channel->name;
  info.data_type = channel->locations.empty()
                       ? DataType::kVoid
                       : channel->locations.back().data_type;
  info.total_values = channel->cumulative.back();
  info.location_count = channel->locations.size();
  return info;
}

absl::StatusOr<std::vector<DataLocation>> Index::GetLocations(
    std::string_view path) const {
  const ChannelRecord* channel = FindChannel(path);
  if (channel == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("%s %s", errors::kUnknownChannel, path));
  }
  return channel->locations;
}

std::vector<std::string> Index::GroupNames() const {
  std::vector<std::string> names;
  names.reserve(groups_.size());
  for (const auto& group : groups_) {
    names.push_back(group.name);
  }
  return names;
}

absl::StatusOr<std::vector<std::string>> Index::ChannelPaths(
    std::string_view group) const {
  auto it = group_ids_.find(std::string(group));
  if (it == group_ids_.end()) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("%s %s", errors::kUnknownGroup, group));
  }

  std::vector<std::string> paths;
  for (uint32_t id : groups_[it->second].channel_ids) {
    paths.push_back(channels_[id].path);
  }
  return paths;
}

// ============================================================================
// IndexBuilder
// ============================================================================

IndexBuilder::IndexBuilder(uint64_t file_length) {
  index_.file_length_ = file_length;
}

Index IndexBuilder::Build() && { return std::move(index_); }

uint32_t IndexBuilder::EnsureGroup(const std::string& name) {
  auto it = index_.group_ids_.find(name);
  if (it != index_.group_ids_.end()) {
    return it->second;
  }
  const auto id = static_cast<uint32_t>(index_.groups_.size());
  index_.groups_.push_back(Index::GroupRecord{.name = name});
  index_.group_ids_.emplace(name, id);
  return id;
}

absl::StatusOr<uint32_t> IndexBuilder::EnsureChannel(std::string_view path) {
  auto it = index_.channel_ids_.find(std::string(path));
  if (it != index_.channel_ids_.end()) {
    return it->second;
  }

  DECLARE_ASSIGN_OR_RETURN(ObjectPath, object, ObjectPath::Parse(path),
                           "Invalid channel path");
  if (!object.IsChannel()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("%s '%s' carries raw data but is not a channel path",
                        errors::kFormatError, path));
  }

  // Register under the canonical spelling so lookups are exact
  const std::string canonical = object.ToString();
  it = index_.channel_ids_.find(canonical);
  if (it != index_.channel_ids_.end()) {
    return it->second;
  }

  const auto id = static_cast<uint32_t>(index_.channels_.size());
  Index::ChannelRecord record;
  record.path = canonical;
  record.group = object.group();
  record.name = object.channel();
  index_.channels_.push_back(std::move(record));
  index_.channel_ids_.emplace(canonical, id);

  const uint32_t group_id = EnsureGroup(object.group());
  index_.groups_[group_id].channel_ids.push_back(id);

  VLOG(2) << "Registered channel " << canonical;
  return id;
}

absl::Status IndexBuilder::ApplyObjectUpdate(const ObjectUpdate& update) {
  DECLARE_ASSIGN_OR_RETURN(ObjectPath, object, ObjectPath::Parse(update.path),
                           "Invalid object path");

  PropertyMap* properties = nullptr;
  if (object.IsRoot()) {
    properties = &index_.root_properties_;
  } else if (object.IsGroup()) {
    properties = &index_.groups_[EnsureGroup(object.group())].properties;
  } else {
    DECLARE_ASSIGN_OR_RETURN(uint32_t, id, EnsureChannel(update.path),
                             "Failed to register channel");
    properties = &index_.channels_[id].properties;
  }

  for (const auto& [name, value] : update.properties) {
    (*properties)[name] = value;
  }
  return absl::OkStatus();
}

void IndexBuilder::AppendLocation(uint32_t channel_id,
                                  const DataLocation& location) {
  if (location.value_count == 0) {
    return;
  }
  auto& channel = index_.channels_[channel_id];
  channel.locations.push_back(location);
  channel.cumulative.push_back(channel.cumulative.back() +
                               location.value_count);
}

absl::Status IndexBuilder::AddSegment(const SegmentDescriptor& descriptor) {
  const auto ordinal = static_cast<uint32_t>(index_.segments_.size());

  for (const auto& update : descriptor.objects) {
    RETURN_IF_ERROR(ApplyObjectUpdate(update),
                    absl::StrFormat("Bad object in segment %d", ordinal));
  }

  const uint64_t file_length = index_.file_length_;
  const uint64_t to_end_of_file = file_length > descriptor.raw_data_offset
                                      ? file_length - descriptor.raw_data_offset
                                      : 0;

  SegmentInfo segment{.ordinal = ordinal,
                      .header_offset = descriptor.header_offset,
                      .data_offset = descriptor.raw_data_offset,
                      .data_length = to_end_of_file,
                      .length_was_unknown =
                          !descriptor.raw_data_length.has_value(),
                      .layout = ContiguousLayout{},
                      .byte_order = descriptor.byte_order};

  if (descriptor.raw_data_length.has_value()) {
    if (*descriptor.raw_data_length > to_end_of_file) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("%s segment %d declares %d raw data bytes at offset "
                          "%d but the file ends at %d",
                          errors::kFormatError, ordinal,
                          *descriptor.raw_data_length,
                          descriptor.raw_data_offset, file_length));
    }
    segment.data_length = *descriptor.raw_data_length;
  }

  if (!descriptor.HasRawData()) {
    index_.segments_.push_back(segment);
    return absl::OkStatus();
  }

  std::vector<uint32_t> channel_ids;
  channel_ids.reserve(descriptor.channels.size());
  for (const auto& entry : descriptor.channels) {
    DECLARE_ASSIGN_OR_RETURN(uint32_t, id, EnsureChannel(entry.path),
                             "Failed to register channel");
    channel_ids.push_back(id);
  }

  if (descriptor.layout == LayoutKind::kInterleaved) {
    uint64_t stride = 0;
    for (const auto& entry : descriptor.channels) {
      if (entry.IsVariableWidth()) {
        return MAKE_STATUS(
            absl::StatusCode::kInvalidArgument,
            absl::StrFormat("%s variable-width channel %s in interleaved "
                            "segment %d",
                            errors::kFormatError, entry.path, ordinal));
      }
      stride += entry.width;
    }
    segment.layout = InterleavedLayout{.stride = stride};
    AddInterleavedLocations(descriptor, segment, channel_ids);
  } else {
    AddContiguousLocations(descriptor, segment, channel_ids);
  }

  if (segment.dropped_bytes > 0) {
    if (segment.length_was_unknown) {
      LOG(WARNING) << "Segment " << ordinal << " ends in an incomplete write; "
                   << "dropping " << segment.dropped_bytes
                   << " trailing byte(s)";
    } else {
      VLOG(1) << "Segment " << ordinal << " has " << segment.dropped_bytes
              << " unused raw data byte(s)";
    }
  }

  index_.segments_.push_back(segment);
  return absl::OkStatus();
}

void IndexBuilder::AddInterleavedLocations(
    const SegmentDescriptor& descriptor, SegmentInfo& segment,
    const std::vector<uint32_t>& channel_ids) {
  const uint64_t stride = std::get<InterleavedLayout>(segment.layout).stride;
  if (stride == 0) {
    segment.dropped_bytes = segment.data_length;
    return;
  }

  const uint64_t records = segment.data_length / stride;
  segment.dropped_bytes = segment.data_length - records * stride;

  uint32_t element_offset = 0;
  for (size_t i = 0; i < descriptor.channels.size(); ++i) {
    const auto& entry = descriptor.channels[i];
    AppendLocation(channel_ids[i],
                   DataLocation{.segment = segment.ordinal,
                                .block_offset = 0,
                                .element_offset = element_offset,
                                .width = entry.width,
                                .stride = stride,
                                .data_type = entry.data_type,
                                .value_count = records,
                                .byte_length = records * stride});
    element_offset += entry.width;
  }
}

void IndexBuilder::AddContiguousLocations(
    const SegmentDescriptor& descriptor, SegmentInfo& segment,
    const std::vector<uint32_t>& channel_ids) {
  const uint64_t available = segment.data_length;
  const uint64_t chunk_bytes = descriptor.ChunkBytes();
  if (chunk_bytes == 0) {
    segment.dropped_bytes = available;
    return;
  }

  // A lone channel's chunks are adjacent, so they form a single run.
  if (descriptor.channels.size() == 1) {
    const auto& entry = descriptor.channels.front();
    uint64_t count = 0;
    uint64_t bytes = 0;
    if (entry.IsVariableWidth()) {
      const uint64_t chunks = available / chunk_bytes;
      count = chunks * entry.value_count;
      bytes = chunks * chunk_bytes;
    } else {
      count = available / entry.width;
      bytes = count * entry.width;
    }
    AppendLocation(channel_ids.front(),
                   DataLocation{.segment = segment.ordinal,
                                .block_offset = 0,
                                .element_offset = 0,
                                .width = entry.width,
                                .stride = entry.width,
                                .data_type = entry.data_type,
                                .value_count = count,
                                .byte_length = bytes});
    segment.dropped_bytes = available - bytes;
    return;
  }

  const uint64_t full_chunks = available / chunk_bytes;
  const uint64_t remainder = available % chunk_bytes;
  uint64_t used = full_chunks * chunk_bytes;

  for (uint64_t chunk = 0; chunk < full_chunks; ++chunk) {
    uint64_t offset = chunk * chunk_bytes;
    for (size_t i = 0; i < descriptor.channels.size(); ++i) {
      const auto& entry = descriptor.channels[i];
      AppendLocation(channel_ids[i],
                     DataLocation{.segment = segment.ordinal,
                                  .block_offset = offset,
                                  .element_offset = 0,
                                  .width = entry.width,
                                  .stride = entry.width,
                                  .data_type = entry.data_type,
                                  .value_count = entry.value_count,
                                  .byte_length = entry.ChunkBytes()});
      offset += entry.ChunkBytes();
    }
  }

  // Trailing partial chunk: keep every complete value of each channel
  uint64_t prefix = 0;
  for (size_t i = 0; i < descriptor.channels.size() && remainder > 0; ++i) {
    const auto& entry = descriptor.channels[i];
    const uint64_t channel_bytes = entry.ChunkBytes();
    if (remainder > prefix) {
      const uint64_t present = std::min(remainder - prefix, channel_bytes);
      uint64_t count = 0;
      uint64_t bytes = 0;
      if (entry.IsVariableWidth()) {
        if (present == channel_bytes) {
          count = entry.value_count;
          bytes = channel_bytes;
        }
      } else {
        count = present / entry.width;
        bytes = count * entry.width;
      }
      AppendLocation(channel_ids[i],
                     DataLocation{.segment = segment.ordinal,
                                  .block_offset = full_chunks * chunk_bytes +
                                                  prefix,
                                  .element_offset = 0,
                                  .width = entry.width,
                                  .stride = entry.width,
                                  .data_type = entry.data_type,
                                  .value_count = count,
                                  .byte_length = bytes});
      used += bytes;
    }
    prefix += channel_bytes;
  }

  segment.dropped_bytes = available - used;
}

}  // namespace fasttdms
