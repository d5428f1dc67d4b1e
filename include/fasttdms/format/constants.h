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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_CONSTANTS_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_CONSTANTS_H_

#include <array>
#include <cstdint>

namespace fasttdms {
namespace format {

/// @brief Size of a segment lead-in in bytes
inline constexpr uint64_t kLeadInSize = 28;

/// @brief Tag opening every lead-in
inline constexpr std::array<uint8_t, 4> kSegmentTag = {'T', 'D', 'S', 'm'};

/// Table of contents flags (always stored little-endian)
namespace toc {
inline constexpr uint32_t kMetaData = 1u << 1;
inline constexpr uint32_t kNewObjList = 1u << 2;
inline constexpr uint32_t kRawData = 1u << 3;
inline constexpr uint32_t kInterleavedData = 1u << 5;
inline constexpr uint32_t kBigEndian = 1u << 6;
inline constexpr uint32_t kDAQmxRawData = 1u << 7;
}  // namespace toc

inline constexpr uint32_t kVersion4712 = 4712;
inline constexpr uint32_t kVersion4713 = 4713;

/// @brief Next segment offset written while a segment is still open
inline constexpr uint64_t kUnknownSegmentLength = 0xFFFFFFFFFFFFFFFFull;

/// Raw data index markers
inline constexpr uint32_t kRawIndexNoData = 0xFFFFFFFFu;
inline constexpr uint32_t kRawIndexMatchPrevious = 0x00000000u;
inline constexpr uint32_t kRawIndexDAQmxFormatChanging = 0x00001269u;
inline constexpr uint32_t kRawIndexDAQmxDigitalLine = 0x0000126Au;

/// Raw data index lengths (the length field counts itself)
inline constexpr uint32_t kRawIndexFixedLength = 20;
inline constexpr uint32_t kRawIndexStringLength = 28;

}  // namespace format
}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_FORMAT_CONSTANTS_H_
