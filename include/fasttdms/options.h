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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_OPTIONS_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_OPTIONS_H_

#include <cstdint>

#include "absl/synchronization/notification.h"

namespace fasttdms {

/// @brief Options for opening and indexing a file
///
/// Example usage:
/// @code
/// OpenOptions options;
/// options.strict_version = false;
///
/// auto file = TdmsFile::Open("run.tdms", options);
/// @endcode
struct OpenOptions {
  /// @brief Reject segments whose version is neither 4712 nor 4713
  ///
  /// When false, unknown versions are decoded with the 4713 rules.
  bool strict_version = true;

  /// @brief Upper bound on one segment's metadata block
  ///
  /// Guards against reading an absurd amount of memory when a corrupt lead-in
  /// declares a huge raw data offset.
  uint64_t max_metadata_bytes = uint64_t{256} * 1024 * 1024;
};

/// @brief Options for executing a read plan
struct ExecuteOptions {
  /// @brief Maximum number of threads for reading operations
  ///
  /// 0 uses the shared pool with its default size, 1 executes sequentially
  /// on the calling thread.
  uint32_t max_threads = 0;

  /// @brief Optional cancellation signal
  ///
  /// Checked between operations; once notified, the query stops with a
  /// Cancelled status and returns no data. Not owned.
  const absl::Notification* cancellation = nullptr;

  [[nodiscard]] bool IsCancelled() const {
    return cancellation != nullptr && cancellation->HasBeenNotified();
  }
};

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_OPTIONS_H_
