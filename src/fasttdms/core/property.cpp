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

#include "fasttdms/core/property.h"

#include <string>
#include <type_traits>
#include <variant>

#include "absl/strings/str_format.h"

namespace fasttdms {
namespace core {

std::string PropertyValueToString(const PropertyValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return "\"" + v + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Timestamp>) {
          return absl::StrFormat("%d+%u/2^64s", v.seconds, v.fractions);
        } else if constexpr (std::is_floating_point_v<T>) {
          return absl::StrFormat("%g", v);
        } else {
          // int8_t/uint8_t would otherwise format as characters
          return std::to_string(+v);
        }
      },
      value);
}

}  // namespace core
}  // namespace fasttdms
