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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_DATA_TYPE_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_DATA_TYPE_H_

#include <cstdint>
#include <optional>
#include <string_view>

/**
 * @file data_type.h
 * @brief TDMS data type tags and byte order
 *
 * The enum values match the binary representation of the type tag in the
 * file, so a tag read from disk can be cast directly and then checked with
 * IsKnownDataType().
 */

namespace fasttdms {
namespace core {

/// @brief Data type tag as stored in raw data indexes and properties
enum class DataType : uint32_t {
  kVoid = 0,
  kI8 = 1,
  kI16 = 2,
  kI32 = 3,
  kI64 = 4,
  kU8 = 5,
  kU16 = 6,
  kU32 = 7,
  kU64 = 8,
  kSingleFloat = 9,
  kDoubleFloat = 10,
  kExtendedFloat = 11,
  kDoubleFloatWithUnit = 12,
  kExtendedFloatWithUnit = 13,
  kSingleFloatWithUnit = 0x19,
  kString = 0x20,
  kBoolean = 0x21,
  kTimeStamp = 0x44,
  kFixedPoint = 0x4F,
  kComplexSingleFloat = 0x0008000C,
  kComplexDoubleFloat = 0x0010000D,
  kDAQmxRawData = 0xFFFFFFFF,
};

/// @brief Byte order of a segment (declared by its lead-in)
enum class ByteOrder : uint8_t {
  kLittle,
  kBig,
};

/// @brief Check whether a raw tag value names one of the DataType values
[[nodiscard]] bool IsKnownDataType(uint32_t tag) noexcept;

/// @brief Element width in bytes
/// @return Width, or nullopt for variable-width types (String, DAQmx, Void)
[[nodiscard]] std::optional<uint32_t> FixedWidth(DataType type) noexcept;

/// @brief Human-readable name of a type (e.g. "I32", "DoubleFloat")
[[nodiscard]] std::string_view DataTypeName(DataType type) noexcept;

}  // namespace core

using core::ByteOrder;
using core::DataType;
using core::DataTypeName;
using core::FixedWidth;
using core::IsKnownDataType;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_DATA_TYPE_H_
