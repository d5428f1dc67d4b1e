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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_EXECUTOR_READ_EXECUTOR_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_EXECUTOR_READ_EXECUTOR_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fasttdms/core/read_plan.h"
#include "fasttdms/core/value.h"
#include "fasttdms/options.h"
#include "fasttdms/runtime/io/random_access_source.h"

namespace fasttdms {

/// @brief Decoded values per requested channel
///
/// A channel whose values cannot be decoded (UnsupportedType, or a data type
/// that changes between segments) carries its own error; the other channels
/// of the query are unaffected.
using ReadResult = std::map<std::string, absl::StatusOr<ChannelData>>;

/// @brief Executes read plans against a byte source
///
/// Each operation is one positioned read; its claims are decoded from that
/// buffer alone. Operations run on the shared worker pool when the source
/// allows concurrent reads, otherwise sequentially. Results are assembled in
/// plan order, so values always come out in ascending global index order
/// whatever the completion order was.
class ReadExecutor {
 public:
  /// @brief Execute a plan
  /// @param plan Plan built against the Index of `source`
  /// @param source Byte source of the same file
  /// @param options Parallelism and cancellation
  /// @return Channel -> values, or an error that voids the whole query
  /// @retval absl::DataLossError (TruncatedSegment) if the file is shorter
  /// than an operation requires
  /// @retval absl::CancelledError (Cancelled) if cancellation was signalled
  static absl::StatusOr<ReadResult> Execute(
      const ReadPlan& plan, const RandomAccessSource& source,
      const ExecuteOptions& options = ExecuteOptions());

 private:
  /// @brief Decoded claims of one operation, in claim order
  struct OperationOutput {
    std::vector<absl::StatusOr<ChannelData>> claims;
  };

  /// @brief Read one operation's bytes and decode all of its claims
  static absl::StatusOr<OperationOutput> ExecuteOperation(
      const ReadOperation& op, const ReadPlan& plan,
      const RandomAccessSource& source);

  /// @brief Decode one claim out of its operation's buffer
  static absl::StatusOr<ChannelData> DecodeClaim(
      const ReadClaim& claim, std::span<const uint8_t> buffer,
      DataType channel_type);

  /// @brief Number of workers to use (1 = run on the calling thread)
  static size_t GetWorkerCount(const ReadPlan& plan,
                               const RandomAccessSource& source,
                               const ExecuteOptions& options);

  /// @brief Combine operation outputs into per-channel columns
  static ReadResult Assemble(
      const ReadPlan& plan,
      std::vector<std::optional<absl::StatusOr<OperationOutput>>>& outputs);
};

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_EXECUTOR_READ_EXECUTOR_H_
