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

#include "fasttdms/core/data_type.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace fasttdms {
namespace core {

bool IsKnownDataType(uint32_t tag) noexcept {
  switch (static_cast<DataType>(tag)) {
    case DataType::kVoid:
    case DataType::kI8:
    case DataType::kI16:
    case DataType::kI32:
    case DataType::kI64:
    case DataType::kU8:
    case DataType::kU16:
    case DataType::kU32:
    case DataType::kU64:
    case DataType::kSingleFloat:
    case DataType::kDoubleFloat:
    case DataType::kExtendedFloat:
    case DataType::kDoubleFloatWithUnit:
    case DataType::kExtendedFloatWithUnit:
    case DataType::kSingleFloatWithUnit:
    case DataType::kString:
    case DataType::kBoolean:
    case DataType::kTimeStamp:
    case DataType::kFixedPoint:
    case DataType::kComplexSingleFloat:
    case DataType::kComplexDoubleFloat:
    case DataType::kDAQmxRawData:
      return true;
  }
  return false;
}

std::optional<uint32_t> FixedWidth(DataType type) noexcept {
  switch (type) {
    case DataType::kI8:
    case DataType::kU8:
    case DataType::kBoolean:
      return 1;
    case DataType::kI16:
    case DataType::kU16:
      return 2;
    case DataType::kI32:
    case DataType::kU32:
    case DataType::kSingleFloat:
    case DataType::kSingleFloatWithUnit:
      return 4;
    case DataType::kI64:
    case DataType::kU64:
    case DataType::kDoubleFloat:
    case DataType::kDoubleFloatWithUnit:
    case DataType::kComplexSingleFloat:
    case DataType::kFixedPoint:
      return 8;
    case DataType::kExtendedFloat:
    case DataType::kExtendedFloatWithUnit:
    case DataType::kTimeStamp:
    case DataType::kComplexDoubleFloat:
      return 16;
    case DataType::kVoid:
    case DataType::kString:
    case DataType::kDAQmxRawData:
      return std::nullopt;
  }
  return std::nullopt;
}

std::string_view DataTypeName(DataType type) noexcept {
  switch (type) {
    case DataType::kVoid:
      return "Void";
    case DataType::kI8:
      return "I8";
    case DataType::kI16:
      return "I16";
    case DataType::kI32:
      return "I32";
    case DataType::kI64:
      return "I64";
    case DataType::kU8:
      return "U8";
    case DataType::kU16:
      return "U16";
    case DataType::kU32:
      return "U32";
    case DataType::kU64:
      return "U64";
    case DataType::kSingleFloat:
      return "SingleFloat";
    case DataType::kDoubleFloat:
      return "DoubleFloat";
    case DataType::kExtendedFloat:
      return "ExtendedFloat";
    case DataType::kDoubleFloatWithUnit:
      return "DoubleFloatWithUnit";
    case DataType::kExtendedFloatWithUnit:
      return "ExtendedFloatWithUnit";
    case DataType::kSingleFloatWithUnit:
      return "SingleFloatWithUnit";
    case DataType::kString:
      return "String";
    case DataType::kBoolean:
      return "Boolean";
    case DataType::kTimeStamp:
      return "TimeStamp";
    case DataType::kFixedPoint:
      return "FixedPoint";
    case DataType::kComplexSingleFloat:
      return "ComplexSingleFloat";
    case DataType::kComplexDoubleFloat:
      return "ComplexDoubleFloat";
    case DataType::kDAQmxRawData:
      return "DAQmxRawData";
  }
  return "Unknown";
}

}  // namespace core
}  // namespace fasttdms
