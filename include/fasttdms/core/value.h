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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_VALUE_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_VALUE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "fasttdms/core/data_type.h"

/**
 * @file value.h
 * @brief Decoded value types
 *
 * Three shapes of decoded data are used across the library:
 * - Value: one primitive element of raw data
 * - PropertyValue: one property value (primitives plus strings)
 * - ChannelData: a typed column of raw data values for one channel
 */

namespace fasttdms {
namespace core {

/// @brief TDMS timestamp
///
/// Seconds since 1904-01-01 00:00:00 UTC plus positive fractions of a second
/// in units of 2^-64 s.
struct Timestamp {
  int64_t seconds = 0;     ///< Whole seconds since the 1904 epoch
  uint64_t fractions = 0;  ///< Fraction of a second, 2^-64 s units

  bool operator==(const Timestamp& other) const {
    return seconds == other.seconds && fractions == other.fractions;
  }

  bool operator!=(const Timestamp& other) const { return !(*this == other); }

  /// @brief Seconds since the Unix epoch (lossy)
  [[nodiscard]] double ToUnixSeconds() const;
};

/// @brief Seconds between the TDMS epoch (1904) and the Unix epoch (1970)
inline constexpr int64_t kTdmsToUnixEpochSeconds = 2082844800;

/// @brief One decoded raw data element
using Value = std::variant<int8_t, int16_t, int32_t, int64_t, uint8_t,
                           uint16_t, uint32_t, uint64_t, float, double, bool,
                           Timestamp>;

/// @brief One decoded property value
using PropertyValue =
    std::variant<int8_t, int16_t, int32_t, int64_t, uint8_t, uint16_t,
                 uint32_t, uint64_t, float, double, bool, Timestamp,
                 std::string>;

/// @brief Typed column of decoded values for one channel
using ChannelData =
    std::variant<std::vector<int8_t>, std::vector<int16_t>,
                 std::vector<int32_t>, std::vector<int64_t>,
                 std::vector<uint8_t>, std::vector<uint16_t>,
                 std::vector<uint32_t>, std::vector<uint64_t>,
                 std::vector<float>, std::vector<double>, std::vector<bool>,
                 std::vector<Timestamp>>;

/// @brief Create an empty column for a raw data type
/// @return Column, or UnsupportedType for types without a decoder
absl::StatusOr<ChannelData> MakeChannelData(DataType type);

/// @brief Number of values held by a column
[[nodiscard]] size_t ChannelDataSize(const ChannelData& data);

/// @brief Render one value of a column as text
///
/// Floats keep enough digits to round-trip; timestamps are Unix seconds with
/// microsecond precision.
/// @return Text, or an empty string when `row` is past the end
std::string ChannelValueToString(const ChannelData& data, size_t row);

/// @brief Append the values of `tail` to `head`
/// @return Ok, or kInvalidArgument when the element types differ
absl::Status AppendChannelData(ChannelData& head, ChannelData&& tail);

/// @brief Typed view of a column
/// @return Pointer to the vector, or nullptr if the column holds another type
template <typename T>
[[nodiscard]] const std::vector<T>* GetValues(const ChannelData& data) {
  return std::get_if<std::vector<T>>(&data);
}

}  // namespace core

using core::ChannelData;
using core::ChannelValueToString;
using core::GetValues;
using core::PropertyValue;
using core::Timestamp;
using core::Value;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_VALUE_H_
