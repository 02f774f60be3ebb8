// Copyright 2024 The Weft Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef WEFT_COMMON_TEXT_CONFIG_UTILS_H_
#define WEFT_COMMON_TEXT_CONFIG_UTILS_H_

#include <functional>
#include <initializer_list>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "weft/common/util/enum-flags.h"

namespace weft {
namespace config {
using ConfigValueSetter = std::function<absl::Status(absl::string_view)>;

struct NVConfigSpec {
  const char *name;
  ConfigValueSetter set_value;
};
}  // namespace config

// Parses name/value pairs from a string and directly sets user values.
//
// The "config_string" contains a list of colon-separated name:value-pairs,
// separated by semicolon or newline, e.g. 'indent_size:2; strict_mode:on'.
// Whitespace around names and values is ignored.
//
// For a parsed name/value pair, the setter associated with that name in
// "spec" is called with the value.  A name not found in "spec" is an error.
// A spec entry with a null setter consumes the value without using it.
//
// Sample call:
// return ParseNameValues(configuration_string,
//                        {{"indent_size", SetInt(&indent_size, 1, 16)},
//                         {"strict_mode", SetBool(&strict_mode)}});
//
// Returns the first setter error (prefixed with the parameter name), or
// absl::OkStatus().
absl::Status ParseNameValues(
    absl::string_view config_string,
    const std::initializer_list<config::NVConfigSpec> &spec);

namespace config {

// Setter factories for ParseNameValues().

// Set an integer value and validate that it is in [minimum...maximum] range.
ConfigValueSetter SetInt(int *value, int minimum, int maximum);
ConfigValueSetter SetBool(bool *value);

// Set an enumeration through its name map.  'names' must outlive the setter.
template <typename EnumType>
ConfigValueSetter SetEnum(EnumType *value, const EnumNameMap<EnumType> &names,
                          absl::string_view type_name) {
  return [value, &names, type_name](absl::string_view v) {
    std::string error;
    if (!names.Parse(v, value, &error, type_name)) {
      return absl::InvalidArgumentError(error);
    }
    return absl::OkStatus();
  };
}

}  // namespace config
}  // namespace weft

#endif  // WEFT_COMMON_TEXT_CONFIG_UTILS_H_
