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

#include "fasttdms/core/value.h"

#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {
namespace core {

double Timestamp::ToUnixSeconds() const {
  // 2^-64 as a double
  constexpr double kFractionScale = 5.421010862427522170037e-20;
  return static_cast<double>(seconds - kTdmsToUnixEpochSeconds) +
         static_cast<double>(fractions) * kFractionScale;
}

absl::StatusOr<ChannelData> MakeChannelData(DataType type) {
  switch (type) {
    case DataType::kI8:
      return ChannelData(std::vector<int8_t>{});
    case DataType::kI16:
      return ChannelData(std::vector<int16_t>{});
    case DataType::kI32:
      return ChannelData(std::vector<int32_t>{});
    case DataType::kI64:
      return ChannelData(std::vector<int64_t>{});
    case DataType::kU8:
      return ChannelData(std::vector<uint8_t>{});
    case DataType::kU16:
      return ChannelData(std::vector<uint16_t>{});
    case DataType::kU32:
      return ChannelData(std::vector<uint32_t>{});
    case DataType::kU64:
      return ChannelData(std::vector<uint64_t>{});
    case DataType::kSingleFloat:
    case DataType::kSingleFloatWithUnit:
      return ChannelData(std::vector<float>{});
    case DataType::kDoubleFloat:
    case DataType::kDoubleFloatWithUnit:
      return ChannelData(std::vector<double>{});
    case DataType::kBoolean:
      return ChannelData(std::vector<bool>{});
    case DataType::kTimeStamp:
      return ChannelData(std::vector<Timestamp>{});
    default:
      break;
  }
  return MAKE_STATUS(absl::StatusCode::kUnimplemented,
                     absl::StrFormat("%s no decoder for data type %s",
                                     errors::kUnsupportedType,
                                     DataTypeName(type)));
}

size_t ChannelDataSize(const ChannelData& data) {
  return std::visit([](const auto& values) { return values.size(); }, data);
}

std::string ChannelValueToString(const ChannelData& data, size_t row) {
  return std::visit(
      [row](const auto& values) -> std::string {
        using T = typename std::decay_t<decltype(values)>::value_type;
        if (row >= values.size()) {
          return "";
        }
        const T value = values[row];
        if constexpr (std::is_same_v<T, Timestamp>) {
          return absl::StrFormat("%.6f", value.ToUnixSeconds());
        } else if constexpr (std::is_same_v<T, bool>) {
          return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, float>) {
          return absl::StrFormat("%.9g", value);
        } else if constexpr (std::is_same_v<T, double>) {
          return absl::StrFormat("%.17g", value);
        } else {
          return std::to_string(+value);
        }
      },
      data);
}

absl::Status AppendChannelData(ChannelData& head, ChannelData&& tail) {
  if (head.index() != tail.index()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot append columns of different element types");
  }
  std::visit(
      [&tail](auto& values) {
        using VectorType = std::decay_t<decltype(values)>;
        auto& extra = std::get<VectorType>(tail);
        if (values.empty()) {
          values = std::move(extra);
          return;
        }
        values.insert(values.end(), std::make_move_iterator(extra.begin()),
                      std::make_move_iterator(extra.end()));
      },
      head);
  return absl::OkStatus();
}

}  // namespace core
}  // namespace fasttdms
