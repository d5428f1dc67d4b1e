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

#include "fasttdms/tdms_file.h"

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/format/segment_header_decoder.h"
#include "fasttdms/planner/read_planner.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {

TdmsFile::TdmsFile(std::shared_ptr<const RandomAccessSource> source,
                   Index index)
    : source_(std::move(source)), index_(std::move(index)) {}

absl::StatusOr<std::unique_ptr<TdmsFile>> TdmsFile::Open(
    const fs::path& path, const OpenOptions& options) {
  DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<FileSource>, source,
                           FileSource::Open(path),
                           absl::StrFormat("Cannot open %s", path.string()));
  return Open(std::shared_ptr<const RandomAccessSource>(std::move(source)),
              options);
}

absl::StatusOr<std::unique_ptr<TdmsFile>> TdmsFile::Open(
    std::shared_ptr<const RandomAccessSource> source,
    const OpenOptions& options) {
  if (source == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Byte source is null");
  }

  DECLARE_ASSIGN_OR_RETURN(uint64_t, file_length, source->GetLength(),
                           "Cannot determine file length");

  SegmentStream stream(*source, file_length, options);
  DECLARE_ASSIGN_OR_RETURN(Index, index, Index::Build(stream, file_length),
                           "Failed to index file");

  VLOG(1) << "Opened TDMS file of " << file_length << " byte(s) with "
          << index.GetChannelCount() << " channel(s)";
  return std::unique_ptr<TdmsFile>(
      new TdmsFile(std::move(source), std::move(index)));
}

absl::StatusOr<ReadPlan> TdmsFile::Plan(const ReadQuery& query) const {
  return ReadPlanner::BuildPlan(index_, query);
}

absl::StatusOr<ReadResult> TdmsFile::Execute(
    const ReadPlan& plan, const ExecuteOptions& options) const {
  return ReadExecutor::Execute(plan, *source_, options);
}

absl::StatusOr<ReadResult> TdmsFile::Read(const ReadQuery& query,
                                          const ExecuteOptions& options) const {
  DECLARE_ASSIGN_OR_RETURN(ReadPlan, plan, Plan(query), "Planning failed");
  return Execute(plan, options);
}

absl::StatusOr<PropertyMap> TdmsFile::Properties(std::string_view path) const {
  return index_.Properties(path);
}

}  // namespace fasttdms
