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

#include "fasttdms/planner/read_planner.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {

absl::StatusOr<ReadPlan> ReadPlanner::BuildPlan(const Index& index,
                                                const ReadQuery& query) {
  RETURN_IF_ERROR(ValidateQuery(query), "Query validation failed");

  ReadPlan plan;

  // Segment ordinal -> claims; std::map keeps segments in file order
  std::map<uint32_t, std::vector<PendingClaim>> claims_by_segment;

  for (const auto& [channel, range] : query) {
    DECLARE_ASSIGN_OR_RETURN(
        std::vector<LocationSlice>, slices, index.Lookup(channel, range),
        absl::StrFormat("Cannot plan channel %s", channel));

    uint64_t resolved_count = 0;
    for (const auto& slice : slices) {
      const SegmentInfo& segment = index.GetSegment(slice.location->segment);
      claims_by_segment[segment.ordinal].push_back(
          CreateClaim(channel, slice, slice.global_start - range.start,
                      segment));
      resolved_count += slice.count;
    }
    plan.requests[channel] = ValueRange{.start = range.start,
                                        .count = resolved_count};

    DECLARE_ASSIGN_OR_RETURN(ChannelInfo, info, index.GetChannelInfo(channel),
                             "Cannot describe channel");
    plan.data_types[channel] = info.data_type;
  }

  for (auto& [segment, claims] : claims_by_segment) {
    auto operations = MergeSegmentClaims(segment, std::move(claims));
    for (auto& op : operations) {
      plan.operations.push_back(std::move(op));
    }
  }

  plan.cost = CalculateCosts(plan.operations);

  VLOG(1) << "Planned " << plan.requests.size() << " channel(s) as "
          << plan.cost.total_operations << " read(s) of "
          << plan.cost.total_bytes_to_read << " byte(s) serving "
          << plan.cost.total_claims << " claim(s)";
  return plan;
}

absl::Status ReadPlanner::ValidateQuery(const ReadQuery& query) {
  if (query.empty()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("%s no channels requested", errors::kEmptyQuery));
  }
  return absl::OkStatus();
}

ReadPlanner::PendingClaim ReadPlanner::CreateClaim(
    const std::string& channel, const LocationSlice& slice,
    uint64_t output_offset, const SegmentInfo& segment) {
  const DataLocation& location = *slice.location;
  const uint64_t base = segment.data_offset + location.block_offset;

  PendingClaim pending;
  pending.claim = ReadClaim{.channel = channel,
                            .local_start = slice.local_start,
                            .count = slice.count,
                            .output_offset = output_offset,
                            .relative_offset = 0,
                            .stride = location.stride,
                            .width = location.width,
                            .data_type = location.data_type,
                            .byte_order = segment.byte_order};

  std::visit(
      [&](const auto& layout) {
        using Layout = std::decay_t<decltype(layout)>;
        if constexpr (std::is_same_v<Layout, InterleavedLayout>) {
          // Elements cannot be isolated from their records
          pending.span_begin = base + slice.local_start * layout.stride;
          pending.span_end = pending.span_begin + slice.count * layout.stride;
          pending.first_element = pending.span_begin + location.element_offset;
        } else if constexpr (std::is_same_v<Layout, ContiguousLayout>) {
          if (location.IsVariableWidth()) {
            // No per-element geometry; the whole run is needed
            pending.span_begin = base;
            pending.span_end = base + location.byte_length;
          } else {
            pending.span_begin = base + slice.local_start * location.width;
            pending.span_end = pending.span_begin + slice.count * location.width;
          }
          pending.first_element = pending.span_begin;
        }
      },
      segment.layout);

  return pending;
}

std::vector<ReadOperation> ReadPlanner::MergeSegmentClaims(
    uint32_t segment, std::vector<PendingClaim> claims) {
  std::stable_sort(claims.begin(), claims.end(),
                   [](const PendingClaim& a, const PendingClaim& b) {
                     return a.span_begin < b.span_begin;
                   });

  std::vector<ReadOperation> operations;
  std::vector<std::vector<PendingClaim*>> members;

  for (auto& pending : claims) {
    if (!operations.empty() && pending.span_begin <= operations.back().end()) {
      ReadOperation& op = operations.back();
      const uint64_t end = std::max(op.end(), pending.span_end);
      op.byte_length = end - op.file_offset;
      members.back().push_back(&pending);
      continue;
    }
    operations.push_back(ReadOperation{
        .segment = segment,
        .file_offset = pending.span_begin,
        .byte_length = pending.span_end - pending.span_begin,
        .claims = {}});
    members.push_back({&pending});
  }

  for (size_t i = 0; i < operations.size(); ++i) {
    ReadOperation& op = operations[i];
    op.claims.reserve(members[i].size());
    for (PendingClaim* pending : members[i]) {
      ReadClaim claim = std::move(pending->claim);
      claim.relative_offset = pending->first_element - op.file_offset;
      op.claims.push_back(std::move(claim));
    }
  }
  return operations;
}

ReadPlan::Cost ReadPlanner::CalculateCosts(
    const std::vector<ReadOperation>& operations) {
  ReadPlan::Cost cost;
  cost.total_operations = operations.size();
  for (const auto& op : operations) {
    cost.total_bytes_to_read += op.byte_length;
    cost.total_claims += op.claims.size();
  }
  return cost;
}

}  // namespace fasttdms
