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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_SEGMENT_HEADER_DECODER_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_SEGMENT_HEADER_DECODER_H_

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fasttdms/core/data_type.h"
#include "fasttdms/core/segment_descriptor.h"
#include "fasttdms/format/byte_cursor.h"
#include "fasttdms/options.h"
#include "fasttdms/runtime/io/random_access_source.h"

/**
 * @file segment_header_decoder.h
 * @brief Decoding of segment lead-ins and metadata blocks
 *
 * A segment header only describes what changed since the previous segment:
 * objects may reuse their previous raw data index, a segment without
 * metadata reuses the whole previous channel list, and the new-object-list
 * flag starts over. SegmentHeaderDecoder keeps that running state so every
 * SegmentDescriptor it produces is fully resolved.
 */

namespace fasttdms {
namespace format {

/// @brief Stateful decoder of segment headers, fed in file order
class SegmentHeaderDecoder {
 public:
  explicit SegmentHeaderDecoder(OpenOptions options = OpenOptions());

  /// @brief Decode the segment whose lead-in starts at `offset`
  /// @param source Byte source of the file
  /// @param offset File offset of the lead-in
  /// @param file_length Length of the file
  /// @return Descriptor, or nullopt when no complete header starts at
  /// `offset` (end of file, or a header cut short by a crashed writer)
  /// @retval absl::InvalidArgumentError (FormatError) for malformed headers
  absl::StatusOr<std::optional<SegmentDescriptor>> Decode(
      const RandomAccessSource& source, uint64_t offset, uint64_t file_length);

  /// @brief Paths of the channels currently holding raw data, in order
  [[nodiscard]] const std::vector<std::string>& GetActiveChannels() const {
    return active_channels_;
  }

 private:
  struct LeadIn {
    uint32_t toc;
    uint32_t version;
    uint64_t next_segment_offset;  ///< Relative to the end of the lead-in
    uint64_t raw_data_offset;      ///< Relative to the end of the lead-in
    ByteOrder byte_order;

    [[nodiscard]] bool Has(uint32_t flag) const { return (toc & flag) != 0; }
  };

  /// @brief Last raw data index seen for a channel
  struct ChannelFormat {
    DataType data_type;
    uint32_t width;
    uint64_t value_count;
    uint64_t total_size_bytes;
  };

  absl::StatusOr<LeadIn> ParseLeadIn(std::span<const uint8_t> bytes,
                                     uint64_t offset) const;

  absl::Status ParseMetadata(ByteCursor& cursor,
                             SegmentDescriptor& descriptor);

  absl::StatusOr<ChannelFormat> ParseRawDataIndex(ByteCursor& cursor,
                                                  uint32_t index_length,
                                                  const std::string& path);

  absl::Status ParseProperties(ByteCursor& cursor, ObjectUpdate& update);

  absl::Status ResolveChannels(const LeadIn& lead_in,
                               SegmentDescriptor& descriptor) const;

  void Activate(const std::string& path);

  OpenOptions options_;
  std::vector<std::string> active_channels_;
  std::unordered_map<std::string, ChannelFormat> formats_;
};

/// @brief Descriptor source that walks a file's segment chain lazily
///
/// Example usage:
/// ```cpp
/// SegmentStream stream(source, file_length);
/// DECLARE_ASSIGN_OR_RETURN(Index, index,
///                          Index::Build(stream, file_length));
/// ```
class SegmentStream final : public SegmentDescriptorSource {
 public:
  /// @param source Byte source; must outlive the stream
  SegmentStream(const RandomAccessSource& source, uint64_t file_length,
                OpenOptions options = OpenOptions());

  absl::StatusOr<std::optional<SegmentDescriptor>> Next() override;

  /// @brief Number of descriptors produced so far
  [[nodiscard]] uint32_t GetSegmentCount() const { return segment_count_; }

 private:
  const RandomAccessSource& source_;
  uint64_t file_length_;
  std::optional<uint64_t> next_offset_;
  uint32_t segment_count_ = 0;
  SegmentHeaderDecoder decoder_;
};

}  // namespace format

using format::SegmentHeaderDecoder;
using format::SegmentStream;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_SEGMENT_HEADER_DECODER_H_
