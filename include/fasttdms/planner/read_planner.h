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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_PLANNER_READ_PLANNER_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_PLANNER_READ_PLANNER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fasttdms/core/data_location.h"
#include "fasttdms/core/read_plan.h"
#include "fasttdms/index/index.h"

namespace fasttdms {

/// @brief Turns a channel query into the minimal set of disk reads
///
/// Planning is pure: it reads the (immutable) Index and performs no I/O, so
/// several queries may be planned concurrently against one Index.
///
/// Geometry per segment layout:
/// - Contiguous: a claim on values `[a, b)` needs exactly
///   `[base + a*width, base + b*width)`; unrequested channels cost nothing.
/// - Interleaved: a claim on values `[a, b)` needs whole records,
///   `[base + a*stride, base + b*stride)`, whichever channels are requested.
///
/// Byte ranges of one segment are then sorted and every overlapping or
/// adjacent pair is merged into one ReadOperation that keeps all the claims
/// it serves. Operations come out ordered by (segment, offset).
class ReadPlanner {
 public:
  /// @brief Build a read plan
  /// @param index Index of the file
  /// @param query Channel path -> requested value range
  /// @return Plan, or the first error; no partial plans are produced
  /// @retval absl::InvalidArgumentError (EmptyQuery) if no channel is
  /// requested
  /// @retval absl::NotFoundError (UnknownChannel) for an unregistered path
  /// @retval absl::OutOfRangeError (RangeOutOfBounds) for a range beyond the
  /// recorded values
  static absl::StatusOr<ReadPlan> BuildPlan(const Index& index,
                                            const ReadQuery& query);

 private:
  /// @brief A claim together with the byte range it needs
  struct PendingClaim {
    ReadClaim claim;
    uint64_t span_begin;     ///< Absolute offset of the first byte needed
    uint64_t span_end;       ///< One past the last byte needed
    uint64_t first_element;  ///< Absolute offset of the first element
  };

  /// @brief Validate the query shape
  static absl::Status ValidateQuery(const ReadQuery& query);

  /// @brief Compute the byte range a slice needs within its segment
  static PendingClaim CreateClaim(const std::string& channel,
                                  const LocationSlice& slice,
                                  uint64_t output_offset,
                                  const SegmentInfo& segment);

  /// @brief Sort and merge the claims of one segment into operations
  static std::vector<ReadOperation> MergeSegmentClaims(
      uint32_t segment, std::vector<PendingClaim> claims);

  /// @brief Calculate cost estimates for the plan
  static ReadPlan::Cost CalculateCosts(
      const std::vector<ReadOperation>& operations);
};

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_PLANNER_READ_PLANNER_H_
