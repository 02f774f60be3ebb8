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
#ifndef WEFT_COMMON_FORMATTING_BASIC_FORMAT_STYLE_H_
#define WEFT_COMMON_FORMATTING_BASIC_FORMAT_STYLE_H_

#include <iosfwd>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace weft {

// Line separator written between output lines by Dump().
enum class EndOfLineStyle {
  kLF,
  kCRLF,
  kCR,
};

std::ostream &operator<<(std::ostream &, EndOfLineStyle);

bool AbslParseFlag(absl::string_view text, EndOfLineStyle *mode,
                   std::string *error);

std::string AbslUnparseFlag(const EndOfLineStyle &mode);

// Returns the characters that terminate a line in 'style'.
absl::string_view NewlineString(EndOfLineStyle style);

// How a bracketed construct decides that it no longer fits on one line.
enum class MultilineFormatterType {
  kCharacterWidth,  // compare rendered width against a maximum
  kNumberOfItems,   // compare item count against a maximum
};

std::ostream &operator<<(std::ostream &, MultilineFormatterType);

bool AbslParseFlag(absl::string_view text, MultilineFormatterType *mode,
                   std::string *error);

std::string AbslUnparseFlag(const MultilineFormatterType &mode);

// Style parameters consumed by the layout engine.  Read-only once a Context
// is created.
struct BasicFormatStyle {
  // Each indentation level adds this many spaces.
  int indent_size = 4;

  // Page width: target line length limit.
  int max_line_length = 120;

  EndOfLineStyle end_of_line = EndOfLineStyle::kLF;

  bool space_before_colon = false;
  bool space_after_comma = true;
  bool space_before_semicolon = false;
  bool space_after_semicolon = true;

  // Pad the inside of list, array and record delimiters: "[ 1 ]" vs. "[1]".
  bool space_around_delimiter = true;

  bool space_before_class_constructor = false;

  // Closing brackets of multiline blocks line up with the opening column.
  bool multiline_block_brackets_on_same_column = false;

  bool newline_between_type_definition_and_members = true;

  // Separate multiline items of a sequence with a blank line.
  bool blank_lines_around_nested_multiline_expressions = true;

  // Alternate compact layout for bracketed trailing arguments.
  bool experimental_stroustrup_style = false;

  // Size thresholds, per bracketed-construct kind.
  MultilineFormatterType record_multiline_formatter =
      MultilineFormatterType::kCharacterWidth;
  int max_record_width = 40;
  int max_record_number_of_items = 1;

  MultilineFormatterType array_or_list_multiline_formatter =
      MultilineFormatterType::kCharacterWidth;
  int max_array_or_list_width = 40;
  int max_array_or_list_number_of_items = 1;

  // Ignore trivia (comments, directives, blank lines) entirely.
  bool strict_mode = false;

  // -- Note: when adding new fields, add them in basic-format-style-init.cc
  // and in ParseFormatStyle().
};

// Reads 'name:value' pairs named after the BasicFormatStyle fields into
// 'style', e.g. "indent_size:2;end_of_line:crlf".  On error 'style' may be
// partially updated.
absl::Status ParseFormatStyle(absl::string_view config, BasicFormatStyle *style);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_BASIC_FORMAT_STYLE_H_
