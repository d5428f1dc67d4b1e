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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_TDMS_FILE_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_TDMS_FILE_H_

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fasttdms/core/property.h"
#include "fasttdms/core/read_plan.h"
#include "fasttdms/executor/read_executor.h"
#include "fasttdms/index/index.h"
#include "fasttdms/options.h"
#include "fasttdms/runtime/io/random_access_source.h"

namespace fs = std::filesystem;

namespace fasttdms {

/// @brief An opened TDMS file: its byte source and its Index
///
/// Opening walks every segment header once to build the Index. After that
/// the file is read-only: plans and executions may run concurrently from
/// several threads.
///
/// Example usage:
/// ```cpp
/// DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<TdmsFile>, file,
///                          TdmsFile::Open("run.tdms"));
/// ReadQuery query{{ChannelPathString("Measured", "Voltage"),
///                  ValueRange{.start = 1000, .count = 500}}};
/// DECLARE_ASSIGN_OR_RETURN(ReadPlan, plan, file->Plan(query));
/// DECLARE_ASSIGN_OR_RETURN(ReadResult, values, file->Execute(plan));
/// ```
class TdmsFile {
 public:
  /// @brief Open a file on disk
  /// @retval absl::NotFoundError if the file cannot be opened
  /// @retval absl::InvalidArgumentError (FormatError) for malformed headers
  static absl::StatusOr<std::unique_ptr<TdmsFile>> Open(
      const fs::path& path, const OpenOptions& options = OpenOptions());

  /// @brief Open an arbitrary byte source
  static absl::StatusOr<std::unique_ptr<TdmsFile>> Open(
      std::shared_ptr<const RandomAccessSource> source,
      const OpenOptions& options = OpenOptions());

  TdmsFile(const TdmsFile&) = delete;
  TdmsFile& operator=(const TdmsFile&) = delete;

  [[nodiscard]] const Index& GetIndex() const { return index_; }

  [[nodiscard]] const RandomAccessSource& GetSource() const {
    return *source_;
  }

  /// @brief Plan a query (no I/O)
  absl::StatusOr<ReadPlan> Plan(const ReadQuery& query) const;

  /// @brief Execute a plan built by Plan()
  absl::StatusOr<ReadResult> Execute(
      const ReadPlan& plan,
      const ExecuteOptions& options = ExecuteOptions()) const;

  /// @brief Plan and execute in one step
  absl::StatusOr<ReadResult> Read(
      const ReadQuery& query,
      const ExecuteOptions& options = ExecuteOptions()) const;

  /// @brief Property snapshot of the root ("/"), a group or a channel
  absl::StatusOr<PropertyMap> Properties(std::string_view path) const;

  [[nodiscard]] std::vector<std::string> GroupNames() const {
    return index_.GroupNames();
  }

  /// @brief Channel paths of a group
  absl::StatusOr<std::vector<std::string>> ChannelPaths(
      std::string_view group) const {
    return index_.ChannelPaths(group);
  }

 private:
  TdmsFile(std::shared_ptr<const RandomAccessSource> source, Index index);

  std::shared_ptr<const RandomAccessSource> source_;
  Index index_;
};

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_TDMS_FILE_H_
