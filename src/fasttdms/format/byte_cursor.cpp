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

#include "fasttdms/format/byte_cursor.h"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/runtime/io/element_decoder.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {
namespace format {

absl::Status ByteCursor::Require(uint64_t count) const {
  if (count > remaining()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("%s metadata needs %d more byte(s) at position %d but "
                        "only %d remain",
                        errors::kFormatError, count, position_, remaining()));
  }
  return absl::OkStatus();
}

absl::StatusOr<uint32_t> ByteCursor::ReadU32() {
  RETURN_IF_ERROR(Require(sizeof(uint32_t)), "Cannot read u32");
  const auto value = runtime::io::LoadScalar<uint32_t>(
      bytes_.data() + position_, order_);
  position_ += sizeof(uint32_t);
  return value;
}

absl::StatusOr<uint64_t> ByteCursor::ReadU64() {
  RETURN_IF_ERROR(Require(sizeof(uint64_t)), "Cannot read u64");
  const auto value = runtime::io::LoadScalar<uint64_t>(
      bytes_.data() + position_, order_);
  position_ += sizeof(uint64_t);
  return value;
}

absl::StatusOr<std::string> ByteCursor::ReadString() {
  DECLARE_ASSIGN_OR_RETURN(uint32_t, length, ReadU32(),
                           "Cannot read string length");
  RETURN_IF_ERROR(Require(length),
                  absl::StrFormat("String of %d byte(s) is truncated", length));
  std::string text(reinterpret_cast<const char*>(bytes_.data() + position_),
                   length);
  position_ += length;
  return text;
}

absl::StatusOr<PropertyValue> ByteCursor::ReadPropertyValue(DataType type) {
  if (type == DataType::kString) {
    DECLARE_ASSIGN_OR_RETURN(std::string, text, ReadString(),
                             "Cannot read string property");
    return PropertyValue(std::move(text));
  }

  const auto width = FixedWidth(type);
  if (!width.has_value()) {
    return MAKE_STATUS(
        absl::StatusCode::kUnimplemented,
        absl::StrFormat("%s %s has no property representation",
                        errors::kUnsupportedType, DataTypeName(type)));
  }
  RETURN_IF_ERROR(Require(*width), "Property value is truncated");

  // Decoding first keeps the cursor in place for unsupported types
  DECLARE_ASSIGN_OR_RETURN(
      Value, value,
      runtime::io::DecodeElement(bytes_.subspan(position_, *width), type,
                                 order_),
      "Cannot decode property value");
  position_ += *width;

  return std::visit(
      [](auto&& element) {
        using T = std::decay_t<decltype(element)>;
        return PropertyValue(std::in_place_type<T>, element);
      },
                    value);
}

absl::Status ByteCursor::Skip(uint64_t count) {
  RETURN_IF_ERROR(Require(count), "Cannot skip");
  position_ += count;
  return absl::OkStatus();
}

}  // namespace format
}  // namespace fasttdms
