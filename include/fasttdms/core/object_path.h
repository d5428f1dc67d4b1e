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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_OBJECT_PATH_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_OBJECT_PATH_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/statusor.h"

namespace fasttdms {
namespace core {

/// @brief Path of a TDMS object: the root, a group, or a channel
///
/// Paths are written `/`, `/'group'` and `/'group'/'channel'`. A single quote
/// inside a name is escaped by doubling it.
///
/// Example usage:
/// ```cpp
/// auto path = ObjectPath::Channel("Measured", "Voltage");
/// path.ToString();  // "/'Measured'/'Voltage'"
/// ```
class ObjectPath {
 public:
  /// @brief The file root
  ObjectPath() = default;

  static ObjectPath Root() { return ObjectPath(); }

  static ObjectPath Group(std::string group) {
    return ObjectPath(std::move(group), std::nullopt);
  }

  static ObjectPath Channel(std::string group, std::string channel) {
    return ObjectPath(std::move(group), std::move(channel));
  }

  /// @brief Parse a path string
  /// @retval absl::InvalidArgumentError (FormatError) for malformed paths
  static absl::StatusOr<ObjectPath> Parse(std::string_view text);

  [[nodiscard]] bool IsRoot() const { return !group_.has_value(); }
  [[nodiscard]] bool IsGroup() const {
    return group_.has_value() && !channel_.has_value();
  }
  [[nodiscard]] bool IsChannel() const { return channel_.has_value(); }

  /// @brief Group name (empty for the root)
  [[nodiscard]] const std::string& group() const;

  /// @brief Channel name (empty unless IsChannel())
  [[nodiscard]] const std::string& channel() const;

  /// @brief Path of the owning group (the root for groups)
  [[nodiscard]] ObjectPath Parent() const;

  /// @brief Canonical path string
  [[nodiscard]] std::string ToString() const;

  bool operator==(const ObjectPath& other) const {
    return group_ == other.group_ && channel_ == other.channel_;
  }

 private:
  ObjectPath(std::optional<std::string> group,
             std::optional<std::string> channel)
      : group_(std::move(group)), channel_(std::move(channel)) {}

  std::optional<std::string> group_;
  std::optional<std::string> channel_;
};

/// @brief Canonical path string of a channel
std::string ChannelPathString(std::string_view group, std::string_view channel);

/// @brief Canonical path string of a group
std::string GroupPathString(std::string_view group);

}  // namespace core

using core::ChannelPathString;
using core::GroupPathString;
using core::ObjectPath;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_OBJECT_PATH_H_
