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

#include "fasttdms/runtime/io/element_decoder.h"

#include <cstdint>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {
namespace runtime {
namespace io {

namespace {

template <typename T>
T LoadElement(const uint8_t* data, ByteOrder order) {
  if constexpr (std::is_same_v<T, bool>) {
    return data[0] != 0;
  } else if constexpr (std::is_same_v<T, Timestamp>) {
    return LoadTimestamp(data, order);
  } else {
    return LoadScalar<T>(data, order);
  }
}

absl::Status UnsupportedType(DataType type) {
  return MAKE_STATUS(absl::StatusCode::kUnimplemented,
                     absl::StrFormat("%s no decoder for data type %s",
                                     errors::kUnsupportedType,
                                     DataTypeName(type)));
}

}  // namespace

Timestamp LoadTimestamp(const uint8_t* data, ByteOrder order) {
  Timestamp ts;
  if (order == ByteOrder::kLittle) {
    ts.fractions = LoadScalar<uint64_t>(data, order);
    ts.seconds = LoadScalar<int64_t>(data + 8, order);
  } else {
    ts.seconds = LoadScalar<int64_t>(data, order);
    ts.fractions = LoadScalar<uint64_t>(data + 8, order);
  }
  return ts;
}

absl::StatusOr<Value> DecodeElement(std::span<const uint8_t> bytes,
                                    DataType type, ByteOrder order) {
  const auto width = FixedWidth(type);
  if (!width.has_value()) {
    return UnsupportedType(type);
  }
  if (bytes.size() < *width) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("%s element needs %d bytes, got %zu",
                        DataTypeName(type), *width, bytes.size()));
  }

  const uint8_t* p = bytes.data();
  switch (type) {
    case DataType::kI8:
      return Value(LoadElement<int8_t>(p, order));
    case DataType::kI16:
      return Value(LoadElement<int16_t>(p, order));
    case DataType::kI32:
      return Value(LoadElement<int32_t>(p, order));
    case DataType::kI64:
      return Value(LoadElement<int64_t>(p, order));
    case DataType::kU8:
      return Value(LoadElement<uint8_t>(p, order));
    case DataType::kU16:
      return Value(LoadElement<uint16_t>(p, order));
    case DataType::kU32:
      return Value(LoadElement<uint32_t>(p, order));
    case DataType::kU64:
      return Value(LoadElement<uint64_t>(p, order));
    case DataType::kSingleFloat:
    case DataType::kSingleFloatWithUnit:
      return Value(LoadElement<float>(p, order));
    case DataType::kDoubleFloat:
    case DataType::kDoubleFloatWithUnit:
      return Value(LoadElement<double>(p, order));
    case DataType::kBoolean:
      return Value(LoadElement<bool>(p, order));
    case DataType::kTimeStamp:
      return Value(LoadElement<Timestamp>(p, order));
    default:
      break;
  }
  return UnsupportedType(type);
}

absl::Status DecodeElements(std::span<const uint8_t> buffer, uint64_t offset,
                            uint64_t stride, uint64_t count, DataType type,
                            ByteOrder order, ChannelData& out) {
  DECLARE_ASSIGN_OR_RETURN(ChannelData, expected, core::MakeChannelData(type),
                           "Cannot decode raw data");
  if (expected.index() != out.index()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Output column does not hold %s values",
                        DataTypeName(type)));
  }
  if (count == 0) {
    return absl::OkStatus();
  }

  const uint32_t width = *FixedWidth(type);
  const uint64_t last = offset + (count - 1) * stride;
  if (last + width > buffer.size()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("%d %s elements at offset %d, stride %d exceed a "
                        "%zu byte buffer",
                        count, DataTypeName(type), offset, stride,
                        buffer.size()));
  }

  std::visit(
      [&](auto& values) {
        using T = typename std::decay_t<decltype(values)>::value_type;
        values.reserve(values.size() + count);
        const uint8_t* p = buffer.data() + offset;
        for (uint64_t i = 0; i < count; ++i, p += stride) {
          values.push_back(LoadElement<T>(p, order));
        }
      },
      out);
  return absl::OkStatus();
}

}  // namespace io
}  // namespace runtime
}  // namespace fasttdms
