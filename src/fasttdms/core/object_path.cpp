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

#include "fasttdms/core/object_path.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fasttdms/core/errors.h"
#include "fasttdms/status/status_macros.h"

namespace fasttdms {
namespace core {

namespace {

const std::string& EmptyName() {
  static const std::string kEmpty;
  return kEmpty;
}

void AppendQuoted(std::string& out, std::string_view name) {
  out += "/'";
  for (char c : name) {
    if (c == '\'') {
      out += "''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
}

}  // namespace

absl::StatusOr<ObjectPath> ObjectPath::Parse(std::string_view text) {
  if (text == "/") {
    return Root();
  }

  std::vector<std::string> components;
  size_t pos = 0;
  while (pos < text.size()) {
    if (text.substr(pos, 2) != "/'") {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("%s malformed object path '%s' at offset %zu",
                          errors::kFormatError, text, pos));
    }
    pos += 2;

    std::string name;
    bool closed = false;
    while (pos < text.size()) {
      if (text[pos] == '\'') {
        if (pos + 1 < text.size() && text[pos + 1] == '\'') {
          name.push_back('\'');
          pos += 2;
          continue;
        }
        ++pos;
        closed = true;
        break;
      }
      name.push_back(text[pos++]);
    }
    if (!closed) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("%s unterminated name in object path '%s'",
                          errors::kFormatError, text));
    }
    components.push_back(std::move(name));
  }

  switch (components.size()) {
    case 1:
      return Group(std::move(components[0]));
    case 2:
      return Channel(std::move(components[0]), std::move(components[1]));
    default:
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("%s object path '%s' has %zu components",
                          errors::kFormatError, text, components.size()));
  }
}

const std::string& ObjectPath::group() const {
  return group_.has_value() ? *group_ : EmptyName();
}

const std::string& ObjectPath::channel() const {
  return channel_.has_value() ? *channel_ : EmptyName();
}

ObjectPath ObjectPath::Parent() const {
  if (IsChannel()) {
    return Group(*group_);
  }
  return Root();
}

std::string ObjectPath::ToString() const {
  if (IsRoot()) {
    return "/";
  }
  std::string out;
  AppendQuoted(out, *group_);
  if (channel_.has_value()) {
    AppendQuoted(out, *channel_);
  }
  return out;
}

std::string ChannelPathString(std::string_view group,
                              std::string_view channel) {
  return ObjectPath::Channel(std::string(group), std::string(channel))
      .ToString();
}

std::string GroupPathString(std::string_view group) {
  return ObjectPath::Group(std::string(group)).ToString();
}

}  // namespace core
}  // namespace fasttdms
