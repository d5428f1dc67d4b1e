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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_READ_PLAN_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_READ_PLAN_H_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "fasttdms/core/data_type.h"

/**
 * @file read_plan.h
 * @brief Raw data read plan (pure metadata, no I/O)
 *
 * A ReadPlan says WHAT to read: an ordered list of disjoint disk reads, each
 * annotated with the channel slices it delivers. Plans are produced by
 * ReadPlanner from the Index alone, which makes them:
 * - Unit testable without a file
 * - Inspectable before any I/O (see Cost)
 * - Executable sequentially or on a worker pool with the same result
 */

namespace fasttdms {
namespace core {

/// @brief Half-open range of global value indices `[start, start + count)`
struct ValueRange {
  /// @brief Count meaning "up to the last recorded value"
  static constexpr uint64_t kToEnd = std::numeric_limits<uint64_t>::max();

  uint64_t start = 0;
  uint64_t count = kToEnd;

  /// @brief The whole recorded range of a channel
  static ValueRange All() { return ValueRange{}; }

  [[nodiscard]] bool IsOpenEnded() const { return count == kToEnd; }

  /// @brief One past the last index (only meaningful when not open-ended)
  [[nodiscard]] uint64_t end() const { return start + count; }

  bool operator==(const ValueRange& other) const {
    return start == other.start && count == other.count;
  }
};

/// @brief Query: channel path -> requested value range
using ReadQuery = std::map<std::string, ValueRange>;

/// @brief One deliverable slice of a channel served by a ReadOperation
struct ReadClaim {
  std::string channel;           ///< Canonical channel path
  uint64_t local_start = 0;      ///< First value index within the segment
  uint64_t count = 0;            ///< Number of values
  uint64_t output_offset = 0;    ///< Position of the first value in the output
  uint64_t relative_offset = 0;  ///< Bytes from the operation start to the
                                 ///< first element
  uint64_t stride = 0;           ///< Step between elements (0 = variable width)
  uint32_t width = 0;            ///< Element width (0 = variable width)
  DataType data_type = DataType::kVoid;
  ByteOrder byte_order = ByteOrder::kLittle;
};

/// @brief Exactly one contiguous disk read
struct ReadOperation {
  uint32_t segment = 0;      ///< Segment ordinal
  uint64_t file_offset = 0;  ///< Absolute byte offset of the read
  uint64_t byte_length = 0;  ///< Bytes to read
  std::vector<ReadClaim> claims;

  /// @brief One past the last byte
  [[nodiscard]] uint64_t end() const { return file_offset + byte_length; }
};

/// @brief Complete read plan for one query
struct ReadPlan {
  /// @brief Resolved request per channel (open ranges replaced by counts)
  std::map<std::string, ValueRange> requests;

  /// @brief Element type per requested channel (kVoid if it has no data)
  std::map<std::string, DataType> data_types;

  /// @brief Operations ordered by (segment, file offset)
  std::vector<ReadOperation> operations;

  /// @brief Estimated cost metrics
  struct Cost {
    uint64_t total_bytes_to_read = 0;  ///< Total I/O in bytes
    size_t total_operations = 0;       ///< Number of disk reads
    size_t total_claims = 0;           ///< Deliverable channel slices
  } cost;

  [[nodiscard]] bool IsEmpty() const { return operations.empty(); }

  [[nodiscard]] size_t GetOperationCount() const { return operations.size(); }
};

}  // namespace core

using core::ReadClaim;
using core::ReadOperation;
using core::ReadPlan;
using core::ReadQuery;
using core::ValueRange;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_READ_PLAN_H_
