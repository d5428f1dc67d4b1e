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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_SEGMENT_DESCRIPTOR_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_SEGMENT_DESCRIPTOR_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fasttdms/core/data_type.h"
#include "fasttdms/core/value.h"

/**
 * @file segment_descriptor.h
 * @brief Decoded header of one segment
 *
 * A SegmentDescriptor is what the header decoder hands to the Index: the
 * byte ranges of the segment, its raw data layout and the fully resolved,
 * ordered list of channels stored in its raw data block. Active-list
 * inheritance between segments has already been applied, so the Index never
 * needs to look at earlier headers.
 */

namespace fasttdms {
namespace core {

/// @brief Physical arrangement of a segment's raw data block
enum class LayoutKind : uint8_t {
  kInterleaved,  ///< One element per channel per record, records repeated
  kContiguous,   ///< Each channel's values as one dense run, back to back
};

/// @brief One channel stored in a segment's raw data block
struct ChannelEntry {
  std::string path;                      ///< Canonical channel path
  DataType data_type = DataType::kVoid;  ///< Element type tag
  uint32_t width = 0;                    ///< Element width (0 = variable width)
  uint64_t value_count = 0;              ///< Values per chunk, as declared

  /// @brief Bytes per chunk for variable-width types (strings)
  uint64_t total_size_bytes = 0;

  /// @brief Bytes this channel occupies in one chunk
  [[nodiscard]] uint64_t ChunkBytes() const {
    return width != 0 ? static_cast<uint64_t>(width) * value_count
                      : total_size_bytes;
  }

  [[nodiscard]] bool IsVariableWidth() const { return width == 0; }
};

/// @brief Property changes for one object mentioned by a segment
struct ObjectUpdate {
  std::string path;  ///< Canonical object path (root, group or channel)
  std::vector<std::pair<std::string, PropertyValue>> properties;
};

/// @brief Decoded segment header
struct SegmentDescriptor {
  /// @brief File offset of the lead-in
  uint64_t header_offset = 0;

  /// @brief File offset of the first raw data byte
  uint64_t raw_data_offset = 0;

  /// @brief Length of the raw data block
  /// @note nullopt is the "unknown length" case: the block extends to the end
  /// of the file (writer crashed or file still open)
  std::optional<uint64_t> raw_data_length;

  /// @brief File offset of the next lead-in (nullopt at the last segment)
  std::optional<uint64_t> next_segment_offset;

  LayoutKind layout = LayoutKind::kContiguous;
  ByteOrder byte_order = ByteOrder::kLittle;

  /// @brief Channels in the raw data block, in storage order
  std::vector<ChannelEntry> channels;

  /// @brief Property updates, in header order
  std::vector<ObjectUpdate> objects;

  /// @brief Whether the segment carries raw data for any channel
  [[nodiscard]] bool HasRawData() const { return !channels.empty(); }

  /// @brief Bytes in one chunk (all channels once)
  [[nodiscard]] uint64_t ChunkBytes() const {
    uint64_t total = 0;
    for (const auto& channel : channels) {
      total += channel.ChunkBytes();
    }
    return total;
  }
};

/// @brief Lazily produced sequence of descriptors in file order
///
/// Headers are chained (each names where the next one starts), so a source
/// can only be consumed front to back.
class SegmentDescriptorSource {
 public:
  virtual ~SegmentDescriptorSource() = default;

  /// @brief Decode the next segment header
  /// @return Descriptor, nullopt once the file is exhausted, or FormatError
  virtual absl::StatusOr<std::optional<SegmentDescriptor>> Next() = 0;
};

}  // namespace core

using core::ChannelEntry;
using core::LayoutKind;
using core::ObjectUpdate;
using core::SegmentDescriptor;
using core::SegmentDescriptorSource;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_SEGMENT_DESCRIPTOR_H_
