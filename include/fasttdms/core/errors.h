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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_ERRORS_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_ERRORS_H_

#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/match.h"

/**
 * @file errors.h
 * @brief Error kinds reported by the reader and how they map onto absl::Status
 *
 * Every error is an absl::Status whose code gives the broad category and
 * whose root message starts with one of the kind tags below. The tags let
 * callers tell apart kinds that share a status code (an unknown channel and
 * an unknown group are both kNotFound).
 *
 * | kind             | code             |
 * |------------------|------------------|
 * | FormatError      | kInvalidArgument |
 * | UnknownChannel   | kNotFound        |
 * | UnknownGroup     | kNotFound        |
 * | RangeOutOfBounds | kOutOfRange      |
 * | EmptyQuery       | kInvalidArgument |
 * | TruncatedSegment | kDataLoss        |
 * | UnsupportedType  | kUnimplemented   |
 * | Cancelled        | kCancelled       |
 */

namespace fasttdms {
namespace errors {

inline constexpr std::string_view kFormatError = "FormatError:";
inline constexpr std::string_view kUnknownChannel = "UnknownChannel:";
inline constexpr std::string_view kUnknownGroup = "UnknownGroup:";
inline constexpr std::string_view kRangeOutOfBounds = "RangeOutOfBounds:";
inline constexpr std::string_view kEmptyQuery = "EmptyQuery:";
inline constexpr std::string_view kTruncatedSegment = "TruncatedSegment:";
inline constexpr std::string_view kUnsupportedType = "UnsupportedType:";
inline constexpr std::string_view kCancelled = "Cancelled:";

/// @brief Check whether a status carries the given code and kind tag
[[nodiscard]] inline bool HasKind(const absl::Status& status,
                                  absl::StatusCode code,
                                  std::string_view tag) {
  return status.code() == code && absl::StartsWith(status.message(), absl::string_view(tag.data(), tag.size()));
}

[[nodiscard]] inline bool IsFormatError(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kInvalidArgument, kFormatError);
}

[[nodiscard]] inline bool IsUnknownChannel(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kNotFound, kUnknownChannel);
}

[[nodiscard]] inline bool IsUnknownGroup(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kNotFound, kUnknownGroup);
}

[[nodiscard]] inline bool IsRangeOutOfBounds(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kOutOfRange, kRangeOutOfBounds);
}

[[nodiscard]] inline bool IsEmptyQuery(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kInvalidArgument, kEmptyQuery);
}

[[nodiscard]] inline bool IsTruncatedSegment(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kDataLoss, kTruncatedSegment);
}

[[nodiscard]] inline bool IsUnsupportedType(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kUnimplemented, kUnsupportedType);
}

[[nodiscard]] inline bool IsCancelled(const absl::Status& status) {
  return HasKind(status, absl::StatusCode::kCancelled, kCancelled);
}

}  // namespace errors
}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_ERRORS_H_
