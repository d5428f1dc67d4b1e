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

#ifndef AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_PROPERTY_H_
#define AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_PROPERTY_H_

#include <map>
#include <string>

#include "fasttdms/core/value.h"

namespace fasttdms {
namespace core {

/// @brief Current property snapshot of one object (name -> value)
using PropertyMap = std::map<std::string, PropertyValue>;

/// @brief Render a property value for logs and diagnostics
std::string PropertyValueToString(const PropertyValue& value);

}  // namespace core

using core::PropertyMap;
using core::PropertyValueToString;

}  // namespace fasttdms

#endif  // AIFO_FASTTDMS_INCLUDE_FASTTDMS_CORE_PROPERTY_H_
