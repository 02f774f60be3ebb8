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
#ifndef WEFT_COMMON_UTIL_ENUM_FLAGS_H_
#define WEFT_COMMON_UTIL_ENUM_FLAGS_H_

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "weft/common/util/logging.h"

namespace weft {

namespace internal {
// Functor that extracts the first element of a pair and appends it to a string.
// Suitable for use with absl::StrJoin()'s formatter arguments.
struct FirstElementFormatter {
  template <class P>
  void operator()(std::string *out, const P &p) const {
    out->append(p.first.begin(), p.first.end());
  }
};
}  // namespace internal

/**
EnumNameMap provides a consistent way to parse and unparse enumerations with
string/named representations.
This makes enumeration types easy to use with absl flags and with
ParseNameValues() configuration strings.

Usage:

////////////////// .h header file ///////////////////
enum class MyEnumType { ... };

std::ostream& operator<<(std::ostream& stream, MyEnumType p);

bool AbslParseFlag(absl::string_view text, MyEnumType* mode,
                   std::string* error);
std::string AbslUnparseFlag(const MyEnumType& mode);


/////////////// .cc implementation file ////////////////
static const EnumNameMap<MyEnumType> &MyEnumTypeNames() {
  static const EnumNameMap<MyEnumType> kNames({
      {"enum1", MyEnumType::kEnum1},
      {"enum2", MyEnumType::kEnum2},
  });
  return kNames;
}

The enumerations handled here have a handful of values, so lookup is linear.
**/
template <typename EnumType>
class EnumNameMap {
  // String-literals are the only intended source of names, so the views
  // outlive the map.
  using key_type = absl::string_view;
  using entry_type = std::pair<key_type, EnumType>;

 public:
  // Names and values must both be unique, or this will result in a fatal
  // error.
  EnumNameMap(std::initializer_list<entry_type> pairs) : entries_(pairs) {
    for (auto iter = entries_.begin(); iter != entries_.end(); ++iter) {
      for (auto other = iter + 1; other != entries_.end(); ++other) {
        CHECK(iter->first != other->first)
            << "Duplicate enum name: " << iter->first;
        CHECK(iter->second != other->second)
            << "Duplicate enum value for: " << other->first;
      }
    }
  }
  ~EnumNameMap() = default;

  EnumNameMap(const EnumNameMap &) = delete;
  EnumNameMap(EnumNameMap &&) = delete;
  EnumNameMap &operator=(const EnumNameMap &) = delete;
  EnumNameMap &operator=(EnumNameMap &&) = delete;

  // Print a list of string representations of the enums.
  std::ostream &ListNames(std::ostream &stream, absl::string_view sep) const {
    return stream << absl::StrJoin(entries_, sep,
                                   internal::FirstElementFormatter());
  }

  // Converts the name of an enum to its corresponding value.
  // 'type_name' is a text name for the enum type used in diagnostics.
  // This variant write diagnostics to the 'errstream' stream.
  // Returns true if successful.
  bool Parse(key_type text, EnumType *enum_value, std::ostream &errstream,
             absl::string_view type_name) const {
    const auto found =
        std::find_if(entries_.begin(), entries_.end(),
                     [text](const entry_type &e) { return e.first == text; });
    if (found != entries_.end()) {
      *enum_value = found->second;
      return true;
    }
    errstream << "Invalid " << type_name << ": '" << text
              << "'\nValid options are: ";
    ListNames(errstream, ",");
    return false;
  }

  // Converts the name of an enum to its corresponding value.
  // This variant write diagnostics to the 'error' string.
  bool Parse(key_type text, EnumType *enum_value, std::string *error,
             absl::string_view type_name) const {
    std::ostringstream stream;
    const bool success = Parse(text, enum_value, stream, type_name);
    *error += stream.str();
    return success;
  }

  // Returns the string representation of an enum.
  absl::string_view EnumName(EnumType value) const {
    const auto found =
        std::find_if(entries_.begin(), entries_.end(),
                     [value](const entry_type &e) { return e.second == value; });
    if (found == entries_.end()) return "???";
    return found->first;
  }

  // Prints the string representation of an enum to stream.
  std::ostream &Unparse(EnumType value, std::ostream &stream) const {
    return stream << EnumName(value);
  }

 private:
  const std::vector<entry_type> entries_;
};

}  // namespace weft

#endif  // WEFT_COMMON_UTIL_ENUM_FLAGS_H_
