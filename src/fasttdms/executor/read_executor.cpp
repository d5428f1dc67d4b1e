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

#include "fasttdms/executor/read_executor.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/runtime/io/element_decoder.h"
#include "fasttdms/status/status_macros.h"
#include "fasttdms/utilities/thread_pool_manager.h"

namespace fasttdms {

absl::StatusOr<ReadResult> ReadExecutor::Execute(
    const ReadPlan& plan, const RandomAccessSource& source,
    const ExecuteOptions& options) {
  const size_t op_count = plan.operations.size();
  std::vector<std::optional<absl::StatusOr<OperationOutput>>> outputs(
      op_count);

  std::atomic<size_t> next_op{0};
  std::atomic<bool> failed{false};

  // Workers pull operations in plan order; cancellation and failures are
  // observed between operations.
  auto worker = [&]() {
    for (size_t i = next_op++; i < op_count; i = next_op++) {
      if (failed.load() || options.IsCancelled()) {
        return;
      }
      outputs[i] = ExecuteOperation(plan.operations[i], plan, source);
      if (!outputs[i]->ok()) {
        failed.store(true);
      }
    }
  };

  const size_t workers = GetWorkerCount(plan, source, options);
  if (workers <= 1) {
    worker();
  } else {
    auto& pool = ThreadPoolManager::GetInstance();
    auto futures = pool.submit_sequence(size_t{0}, workers,
                                        [&](size_t /*worker_index*/) {
                                          worker();
                                        });
    futures.wait();
  }

  if (options.IsCancelled()) {
    return MAKE_STATUS(absl::StatusCode::kCancelled,
                       absl::StrFormat("%s query cancelled", errors::kCancelled));
  }

  for (size_t i = 0; i < op_count; ++i) {
    if (outputs[i].has_value() && !outputs[i]->ok()) {
      return status::AddTrace(
          outputs[i]->status(), __func__, __FILE__, __LINE__,
          absl::StrFormat("Read operation %d of %d failed", i, op_count));
    }
  }

  VLOG(1) << "Executed " << op_count << " read(s) on " << workers
          << " worker(s)";
  return Assemble(plan, outputs);
}

absl::StatusOr<ReadExecutor::OperationOutput> ReadExecutor::ExecuteOperation(
    const ReadOperation& op, const ReadPlan& plan,
    const RandomAccessSource& source) {
  DECLARE_ASSIGN_OR_RETURN(
      std::vector<uint8_t>, buffer, source.ReadAt(op.file_offset, op.byte_length),
      absl::StrFormat("Failed to read %d bytes at %d", op.byte_length,
                      op.file_offset));

  if (buffer.size() < op.byte_length) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        absl::StrFormat("%s segment %d needs bytes [%d, %d) but the file "
                        "yielded only %d",
                        errors::kTruncatedSegment, op.segment, op.file_offset,
                        op.end(), buffer.size()));
  }

  OperationOutput output;
  output.claims.reserve(op.claims.size());
  for (const auto& claim : op.claims) {
    auto type_it = plan.data_types.find(claim.channel);
    const DataType channel_type =
        type_it != plan.data_types.end() ? type_it->second : claim.data_type;
    output.claims.push_back(DecodeClaim(claim, buffer, channel_type));
  }
  return output;
}

absl::StatusOr<ChannelData> ReadExecutor::DecodeClaim(
    const ReadClaim& claim, std::span<const uint8_t> buffer,
    DataType channel_type) {
  auto column = core::MakeChannelData(claim.data_type);

  // Tags that differ only by unit (e.g. SingleFloat vs SingleFloatWithUnit)
  // decode into the same column
  if (claim.data_type != channel_type) {
    auto expected = core::MakeChannelData(channel_type);
    if (!column.ok() || !expected.ok() ||
        column->index() != expected->index()) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("%s channel %s changes data type from %s to %s",
                          errors::kFormatError, claim.channel,
                          DataTypeName(claim.data_type),
                          DataTypeName(channel_type)));
    }
  }

  if (!column.ok()) {
    return MAKE_STATUS(
        absl::StatusCode::kUnimplemented,
        absl::StrFormat("%s channel %s stores %s values",
                        errors::kUnsupportedType, claim.channel,
                        DataTypeName(claim.data_type)));
  }

  RETURN_IF_ERROR(
      DecodeElements(buffer, claim.relative_offset, claim.stride, claim.count,
                     claim.data_type, claim.byte_order, *column),
      absl::StrFormat("Failed to decode %s", claim.channel));
  return column;
}

size_t ReadExecutor::GetWorkerCount(const ReadPlan& plan,
                                    const RandomAccessSource& source,
                                    const ExecuteOptions& options) {
  const size_t op_count = plan.operations.size();
  if (op_count <= 1 || options.max_threads == 1 ||
      !source.SupportsConcurrentReads()) {
    return 1;
  }

  size_t workers = options.max_threads;
  if (workers == 0) {
    workers = ThreadPoolManager::GetInstance().get_thread_count();
  }
  return std::max<size_t>(1, std::min(workers, op_count));
}

ReadResult ReadExecutor::Assemble(
    const ReadPlan& plan,
    std::vector<std::optional<absl::StatusOr<OperationOutput>>>& outputs) {
  ReadResult result;
  for (const auto& [channel, range] : plan.requests) {
    auto type_it = plan.data_types.find(channel);
    const DataType type =
        type_it != plan.data_types.end() ? type_it->second : DataType::kVoid;
    auto column = core::MakeChannelData(type);
    // A channel without recorded values has no element type
    result.emplace(channel, column.ok() ? *std::move(column) : ChannelData());
  }

  for (size_t i = 0; i < plan.operations.size(); ++i) {
    const ReadOperation& op = plan.operations[i];
    OperationOutput& output = **outputs[i];

    for (size_t j = 0; j < op.claims.size(); ++j) {
      const ReadClaim& claim = op.claims[j];
      absl::StatusOr<ChannelData>& entry = result[claim.channel];
      if (!entry.ok()) {
        continue;
      }

      absl::StatusOr<ChannelData>& decoded = output.claims[j];
      if (!decoded.ok()) {
        entry = decoded.status();
        continue;
      }

      if (core::ChannelDataSize(*entry) != claim.output_offset) {
        entry = MAKE_STATUS(
            absl::StatusCode::kInternal,
            absl::StrFormat("claim for %s lands at %d but %d values precede "
                            "it",
                            claim.channel, claim.output_offset,
                            core::ChannelDataSize(*entry)));
        continue;
      }

      auto status = core::AppendChannelData(*entry, *std::move(decoded));
      if (!status.ok()) {
        entry = status::AddTrace(status, __func__, __FILE__, __LINE__,
                                 absl::StrFormat("Cannot assemble %s",
                                                 claim.channel));
      }
    }
  }
  return result;
}

}  // namespace fasttdms
