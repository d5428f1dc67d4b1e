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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_UTILITIES_THREAD_POOL_MANAGER_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_UTILITIES_THREAD_POOL_MANAGER_H_

#include <cstddef>

#include <BS_thread_pool.hpp>

namespace fasttdms {

/// @brief Process-wide worker pool shared by all plan executions
///
/// The pool is created on first use. Its size comes from the
/// `FASTTDMS_NUM_THREADS` environment variable when set to a non-negative
/// integer, otherwise from the hardware concurrency. Executions that want
/// fewer workers bound themselves (see ExecuteOptions::max_threads) instead
/// of resizing the shared pool.
class ThreadPoolManager {
 public:
  /// @brief Get the shared pool
  static BS::light_thread_pool& GetInstance();

  /// @brief Resize the shared pool
  ///
  /// Waits for running tasks before the pool is reset.
  ///
  /// @param count Number of threads (0 = hardware concurrency)
  static void SetThreadCount(std::size_t count);

 private:
  ThreadPoolManager() = delete;
  ~ThreadPoolManager() = delete;
  ThreadPoolManager(const ThreadPoolManager&) = delete;
  ThreadPoolManager& operator=(const ThreadPoolManager&) = delete;

  static BS::light_thread_pool& GetPool(std::size_t count = 0);
};

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_UTILITIES_THREAD_POOL_MANAGER_H_
