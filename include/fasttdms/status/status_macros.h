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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_STATUS_STATUS_MACROS_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fasttdms::status {

/// Marker that separates the root error text from the appended frames.
inline constexpr std::string_view kFrameMarker = "\n  at ";

/**
 * @brief Formats one trace frame.
 *
 * Produces `  at Function (file.cpp:123) [CODE] - message`.
 */
inline std::string FormatStackFrame(char const* function, char const* file,
                                    int line, absl::StatusCode code,
                                    std::string_view message) {
  std::string s = "  at ";
  s.append(function);
  s.append(" (");
  s.append(file);
  s.push_back(':');
  s.append(std::to_string(line));
  s.append(") [");
  s.append(absl::StatusCodeToString(code));
  s.append("]");
  if (!message.empty()) {
    s.append(" - ");
    s.append(message);
  }
  return s;
}

/**
 * @brief Returns the root error text of a traced message.
 *
 * Everything from the first frame marker onward is dropped.
 */
inline std::string StripStackTrace(std::string_view full_message) {
  if (auto pos = full_message.find(kFrameMarker);
      pos != std::string_view::npos) {
    return std::string(full_message.substr(0, pos));
  }
  return std::string(full_message);
}

/**
 * @brief Appends one frame to a non-OK status.
 *
 * OK statuses are returned unchanged. The status code is preserved, so
 * callers can keep branching on `absl::IsNotFound()` and friends after any
 * number of propagation steps.
 */
inline absl::Status AddTrace(absl::Status const& st, char const* function,
                             char const* file, int line,
                             std::string_view message = {}) {
  if (st.ok()) {
    return st;
  }
  std::string out(st.message());
  out.push_back('\n');
  out += FormatStackFrame(function, file, line, st.code(), message);
  return absl::Status(st.code(), out);
}

template <typename T>
inline absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor,
                                  char const* function, char const* file,
                                  int line, std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTrace(sor.status(), function, file, line, message);
}

}  // namespace fasttdms::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/// @brief Create a traced absl::Status carrying an initial frame.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                       \
  ::fasttdms::status::AddTrace(absl::Status((code), (message)), __func__, \
                               __FILE__, __LINE__)

/// @brief Propagate a non-OK absl::Status, appending this function as a frame.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                           \
  do {                                                                       \
    auto _st = (expr);                                                       \
    if (!_st.ok()) {                                                         \
      return ::fasttdms::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                          (msg));                            \
    }                                                                        \
  } while (0)

/**
 * @brief Unpack a StatusOr<T> into an already declared lhs, or return the
 * traced error.
 *
 * The value is moved out, so move-only types are fine.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                     \
  do {                                                                       \
    auto _sor = (expr);                                                      \
    if (!_sor.ok()) {                                                        \
      return ::fasttdms::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                          __LINE__, ##__VA_ARGS__);          \
    }                                                                        \
    lhs = std::move(_sor).value();                                           \
  } while (0)

/// @brief Declare `type name` and fill it with ASSIGN_OR_RETURN.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_ASSIGN_OR_RETURN(type, name, expr, ...) \
  type name;                                            \
  ASSIGN_OR_RETURN(name, expr, ##__VA_ARGS__)

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_STATUS_STATUS_MACROS_H_
