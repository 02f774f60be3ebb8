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
#include "weft/common/text/config-utils.h"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "weft/common/util/logging.h"

namespace weft {
using absl::string_view;
using config::NVConfigSpec;

absl::Status ParseNameValues(string_view config_string,
                             const std::initializer_list<NVConfigSpec> &spec) {
  if (config_string.empty()) return absl::OkStatus();

  for (const string_view single_config :
       absl::StrSplit(config_string, absl::ByAnyChar(";\n"),
                      absl::SkipWhitespace())) {
    std::pair<string_view, string_view> nv_pair =
        absl::StrSplit(single_config, absl::MaxSplits(':', 1));
    nv_pair.first = absl::StripAsciiWhitespace(nv_pair.first);
    nv_pair.second = absl::StripAsciiWhitespace(nv_pair.second);
    const auto value_config = std::find_if(  // linear search
        spec.begin(), spec.end(),
        [&nv_pair](const NVConfigSpec &s) { return nv_pair.first == s.name; });
    if (value_config == spec.end()) {
      std::string available;
      for (const auto &s : spec) {
        if (!available.empty()) available.append(", ");
        available.append("'").append(s.name).append("'");
      }
      const bool plural = spec.size() > 1;
      return absl::InvalidArgumentError(absl::StrCat(
          nv_pair.first, ": unknown parameter; supported ",
          (plural ? "parameters are " : "parameter is "), available));
    }
    if (!value_config->set_value) continue;  // consume, not use.
    const absl::Status result = value_config->set_value(nv_pair.second);
    if (!result.ok()) {
      // The parameter name goes first so setters only deal with values.
      return absl::InvalidArgumentError(
          absl::StrCat(nv_pair.first, ": ", result.message()));
    }
  }
  return absl::OkStatus();
}

namespace config {
ConfigValueSetter SetInt(int *value, int minimum, int maximum) {
  CHECK(value) << "Must provide pointer to integer to store.";
  return [value, minimum, maximum](string_view v) {
    int parsed_value;
    if (!absl::SimpleAtoi(v, &parsed_value)) {
      return absl::InvalidArgumentError(
          absl::StrCat("'", v, "': Cannot parse integer"));
    }
    if (parsed_value < minimum || parsed_value > maximum) {
      return absl::InvalidArgumentError(absl::StrCat(
          parsed_value, " out of range [", minimum, "...", maximum, "]"));
    }
    *value = parsed_value;
    return absl::OkStatus();
  };
}

ConfigValueSetter SetBool(bool *value) {
  CHECK(value) << "Must provide pointer to boolean to store.";
  return [value](string_view v) {
    if (v.empty() || v == "1" || absl::EqualsIgnoreCase(v, "true") ||
        absl::EqualsIgnoreCase(v, "on")) {
      *value = true;
      return absl::OkStatus();
    }
    if (v == "0" || absl::EqualsIgnoreCase(v, "false") ||
        absl::EqualsIgnoreCase(v, "off")) {
      *value = false;
      return absl::OkStatus();
    }
    return absl::InvalidArgumentError(
        "Boolean value should be one of 'true', 'on' or 'false', 'off'");
  };
}

}  // namespace config
}  // namespace weft
