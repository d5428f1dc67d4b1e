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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_BYTE_CURSOR_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_BYTE_CURSOR_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fasttdms/core/data_type.h"
#include "fasttdms/core/value.h"

/**
 * @file byte_cursor.h
 * @brief Bounds-checked sequential reader over a metadata block
 *
 * Every read checks the remaining length first; running past the end of the
 * block is a FormatError, since a well-formed header never does.
 */

namespace fasttdms {
namespace format {

class ByteCursor {
 public:
  ByteCursor(std::span<const uint8_t> bytes, ByteOrder order)
      : bytes_(bytes), order_(order) {}

  absl::StatusOr<uint32_t> ReadU32();
  absl::StatusOr<uint64_t> ReadU64();

  /// @brief Read a length-prefixed (u32) UTF-8 string
  absl::StatusOr<std::string> ReadString();

  /// @brief Read a property value of the given type
  /// @retval absl::InvalidArgumentError (FormatError) if the block is too
  /// short
  /// @retval absl::UnimplementedError (UnsupportedType) for types that have
  /// no property representation; the cursor does not advance
  absl::StatusOr<PropertyValue> ReadPropertyValue(DataType type);

  /// @brief Advance without decoding
  absl::Status Skip(uint64_t count);

  [[nodiscard]] size_t position() const { return position_; }
  [[nodiscard]] size_t remaining() const { return bytes_.size() - position_; }
  [[nodiscard]] ByteOrder byte_order() const { return order_; }

 private:
  absl::Status Require(uint64_t count) const;

  std::span<const uint8_t> bytes_;
  ByteOrder order_;
  size_t position_ = 0;
};

}  // namespace format
}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_BYTE_CURSOR_H_
