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
#include "weft/common/formatting/basic-format-style.h"

#include <iostream>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "weft/common/text/config-utils.h"
#include "weft/common/util/enum-flags.h"

namespace weft {

// This mapping defines how this enum is displayed and parsed.
static const EnumNameMap<EndOfLineStyle> &EndOfLineStyleStrings() {
  static const EnumNameMap<EndOfLineStyle> kEndOfLineStyleStringMap({
      {"lf", EndOfLineStyle::kLF},
      {"crlf", EndOfLineStyle::kCRLF},
      {"cr", EndOfLineStyle::kCR},
  });
  return kEndOfLineStyleStringMap;
}

std::ostream &operator<<(std::ostream &stream, EndOfLineStyle p) {
  return EndOfLineStyleStrings().Unparse(p, stream);
}

bool AbslParseFlag(absl::string_view text, EndOfLineStyle *mode,
                   std::string *error) {
  return EndOfLineStyleStrings().Parse(text, mode, error, "EndOfLineStyle");
}

std::string AbslUnparseFlag(const EndOfLineStyle &mode) {
  return std::string{EndOfLineStyleStrings().EnumName(mode)};
}

absl::string_view NewlineString(EndOfLineStyle style) {
  switch (style) {
    case EndOfLineStyle::kCRLF:
      return "\r\n";
    case EndOfLineStyle::kCR:
      return "\r";
    case EndOfLineStyle::kLF:
      break;
  }
  return "\n";
}

static const EnumNameMap<MultilineFormatterType> &
MultilineFormatterTypeStrings() {
  static const EnumNameMap<MultilineFormatterType>
      kMultilineFormatterTypeStringMap({
          {"character_width", MultilineFormatterType::kCharacterWidth},
          {"number_of_items", MultilineFormatterType::kNumberOfItems},
      });
  return kMultilineFormatterTypeStringMap;
}

std::ostream &operator<<(std::ostream &stream, MultilineFormatterType p) {
  return MultilineFormatterTypeStrings().Unparse(p, stream);
}

bool AbslParseFlag(absl::string_view text, MultilineFormatterType *mode,
                   std::string *error) {
  return MultilineFormatterTypeStrings().Parse(text, mode, error,
                                               "MultilineFormatterType");
}

std::string AbslUnparseFlag(const MultilineFormatterType &mode) {
  std::ostringstream stream;
  stream << mode;
  return stream.str();
}

absl::Status ParseFormatStyle(absl::string_view config,
                              BasicFormatStyle *style) {
  using config::SetBool;
  using config::SetEnum;
  using config::SetInt;
  // Widths and item counts are bounded to keep column arithmetic far away
  // from overflow.
  constexpr int kMaxWidth = 1 << 20;
  return ParseNameValues(
      config,
      {
          {"indent_size", SetInt(&style->indent_size, 1, 64)},
          {"max_line_length", SetInt(&style->max_line_length, 1, kMaxWidth)},
          {"end_of_line", SetEnum(&style->end_of_line, EndOfLineStyleStrings(),
                                  "EndOfLineStyle")},
          {"space_before_colon", SetBool(&style->space_before_colon)},
          {"space_after_comma", SetBool(&style->space_after_comma)},
          {"space_before_semicolon", SetBool(&style->space_before_semicolon)},
          {"space_after_semicolon", SetBool(&style->space_after_semicolon)},
          {"space_around_delimiter", SetBool(&style->space_around_delimiter)},
          {"space_before_class_constructor",
           SetBool(&style->space_before_class_constructor)},
          {"multiline_block_brackets_on_same_column",
           SetBool(&style->multiline_block_brackets_on_same_column)},
          {"newline_between_type_definition_and_members",
           SetBool(&style->newline_between_type_definition_and_members)},
          {"blank_lines_around_nested_multiline_expressions",
           SetBool(&style->blank_lines_around_nested_multiline_expressions)},
          {"experimental_stroustrup_style",
           SetBool(&style->experimental_stroustrup_style)},
          {"record_multiline_formatter",
           SetEnum(&style->record_multiline_formatter,
                   MultilineFormatterTypeStrings(), "MultilineFormatterType")},
          {"max_record_width", SetInt(&style->max_record_width, 0, kMaxWidth)},
          {"max_record_number_of_items",
           SetInt(&style->max_record_number_of_items, 0, kMaxWidth)},
          {"array_or_list_multiline_formatter",
           SetEnum(&style->array_or_list_multiline_formatter,
                   MultilineFormatterTypeStrings(), "MultilineFormatterType")},
          {"max_array_or_list_width",
           SetInt(&style->max_array_or_list_width, 0, kMaxWidth)},
          {"max_array_or_list_number_of_items",
           SetInt(&style->max_array_or_list_number_of_items, 0, kMaxWidth)},
          {"strict_mode", SetBool(&style->strict_mode)},
      });
}

}  // namespace weft
