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

#include "fasttdms/utilities/thread_pool_manager.h"

#include <cstddef>
#include <cstdlib>

#include <BS_thread_pool.hpp>

#include "absl/log/log.h"
#include "absl/strings/numbers.h"

namespace fasttdms {

namespace {

constexpr char kThreadCountVariable[] = "FASTTDMS_NUM_THREADS";

/// @brief Thread count requested through the environment (0 = default)
std::size_t GetThreadCountFromEnv() {
  const char* env_value = std::getenv(kThreadCountVariable);
  if (env_value == nullptr) {
    return 0;
  }

  int value = 0;
  if (!absl::SimpleAtoi(env_value, &value) || value < 0) {
    LOG(WARNING) << "Ignoring " << kThreadCountVariable << "=" << env_value
                 << "; expected a non-negative integer";
    return 0;
  }
  return static_cast<std::size_t>(value);
}

}  // namespace

BS::light_thread_pool& ThreadPoolManager::GetInstance() {
  return GetPool(0);
}

void ThreadPoolManager::SetThreadCount(std::size_t count) {
  GetPool(count).reset(count);
}

BS::light_thread_pool& ThreadPoolManager::GetPool(std::size_t count) {
  static const std::size_t env_thread_count = GetThreadCountFromEnv();
  static BS::light_thread_pool pool(count == 0 ? env_thread_count : count);
  return pool;
}

}  // namespace fasttdms
