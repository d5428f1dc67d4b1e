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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_RUNTIME_IO_ELEMENT_DECODER_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_RUNTIME_IO_ELEMENT_DECODER_H_

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fasttdms/core/data_type.h"
#include "fasttdms/core/value.h"

/**
 * @file element_decoder.h
 * @brief Primitive element decoding
 *
 * Decodes fixed-width elements of a known type tag and byte order. Both the
 * single-element form and the strided bulk form used by the read executor
 * live here; the bulk form handles contiguous runs (stride == width) and
 * interleaved records (stride == record size) alike.
 */

namespace fasttdms {
namespace runtime {
namespace io {

/// @brief Load a trivially copyable scalar stored in the given byte order
/// @note `data` must hold at least sizeof(T) bytes
template <typename T>
T LoadScalar(const uint8_t* data, ByteOrder order) {
  uint8_t bytes[sizeof(T)];
  std::memcpy(bytes, data, sizeof(T));
  const bool stored_big = order == ByteOrder::kBig;
  const bool native_big = std::endian::native == std::endian::big;
  if (stored_big != native_big) {
    std::reverse(bytes, bytes + sizeof(T));
  }
  T value;
  std::memcpy(&value, bytes, sizeof(T));
  return value;
}

/// @brief Load a 16-byte TDMS timestamp
Timestamp LoadTimestamp(const uint8_t* data, ByteOrder order);

/// @brief Decode one element
/// @param bytes Element bytes (at least the type's width)
/// @param type Type tag
/// @param order Byte order of the segment
/// @return Decoded value
/// @retval absl::UnimplementedError (UnsupportedType) for types without a
/// decoder
/// @retval absl::InvalidArgumentError if `bytes` is shorter than the width
absl::StatusOr<Value> DecodeElement(std::span<const uint8_t> bytes,
                                    DataType type, ByteOrder order);

/// @brief Decode `count` elements spaced `stride` bytes apart
///
/// The first element starts at `buffer[offset]`. Decoded values are
/// appended to `out`, which must hold the column type for `type` (see
/// MakeChannelData).
///
/// @retval absl::UnimplementedError (UnsupportedType) for types without a
/// decoder
/// @retval absl::InvalidArgumentError if the elements exceed the buffer or
/// `out` holds another column type
absl::Status DecodeElements(std::span<const uint8_t> buffer, uint64_t offset,
                            uint64_t stride, uint64_t count, DataType type,
                            ByteOrder order, ChannelData& out);

}  // namespace io
}  // namespace runtime

using runtime::io::DecodeElement;
using runtime::io::DecodeElements;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_RUNTIME_IO_ELEMENT_DECODER_H_
