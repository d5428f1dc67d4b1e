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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_DATA_LOCATION_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_DATA_LOCATION_H_

#include <cstdint>
#include <variant>
#include <vector>

#include "fasttdms/core/data_type.h"

/**
 * @file data_location.h
 * @brief Where a channel's values live on disk
 *
 * The Index stores SegmentInfo records in one flat array and, per channel,
 * a flat array of DataLocation records that point back into it by segment
 * ordinal. No object owns another; everything is addressed by index.
 */

namespace fasttdms {
namespace core {

/// @brief Interleaved raw data: fixed-size records of one element per channel
struct InterleavedLayout {
  uint64_t stride = 0;  ///< Record size in bytes (sum of all channel widths)
};

/// @brief Contiguous raw data: each channel as one dense run
struct ContiguousLayout {};

/// @brief Closed set of raw data layouts
using RawDataLayout = std::variant<InterleavedLayout, ContiguousLayout>;

/// @brief One segment as recorded by the Index
struct SegmentInfo {
  uint32_t ordinal = 0;             ///< Position in file order
  uint64_t header_offset = 0;       ///< File offset of the lead-in
  uint64_t data_offset = 0;         ///< File offset of the raw data block
  uint64_t data_length = 0;         ///< Usable raw data bytes (after clamping)
  bool length_was_unknown = false;  ///< Declared length was the EOF sentinel
  RawDataLayout layout;
  ByteOrder byte_order = ByteOrder::kLittle;
  uint64_t dropped_bytes = 0;       ///< Trailing bytes of an incomplete write
};

/// @brief Location of one channel's values within one segment
///
/// Element `i` (0 <= i < value_count) starts at file offset
/// `segment.data_offset + block_offset + element_offset + i * stride`.
struct DataLocation {
  uint32_t segment = 0;          ///< Segment ordinal
  uint64_t block_offset = 0;     ///< Start of the run (contiguous) or records
                                 ///< (interleaved) within the raw data block
  uint32_t element_offset = 0;   ///< Offset of this channel inside a record
  uint32_t width = 0;            ///< Element width (0 = variable width)
  uint64_t stride = 0;           ///< Step between consecutive values
  DataType data_type = DataType::kVoid;
  uint64_t value_count = 0;      ///< Complete values stored here
  uint64_t byte_length = 0;      ///< Bytes spanned by the stored values

  [[nodiscard]] bool IsVariableWidth() const { return width == 0; }
};

}  // namespace core

using core::ContiguousLayout;
using core::DataLocation;
using core::InterleavedLayout;
using core::RawDataLayout;
using core::SegmentInfo;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_DATA_LOCATION_H_
