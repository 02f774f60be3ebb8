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
#include "weft/common/formatting/basic-format-style-init.h"

#include "absl/flags/flag.h"
#include "weft/common/formatting/basic-format-style.h"

ABSL_FLAG(int, indent_size, 4, "Each indentation level adds this many spaces.");

ABSL_FLAG(int, max_line_length, 120,
          "Page width: target line length limit to stay under when "
          "formatting.");

ABSL_FLAG(weft::EndOfLineStyle, end_of_line, weft::EndOfLineStyle::kLF,
          "Line terminator written between output lines: lf, crlf, cr.");

ABSL_FLAG(bool, space_before_colon, false,
          "Write a space before a type annotation colon.");

ABSL_FLAG(bool, space_after_comma, true, "Write a space after a comma.");

ABSL_FLAG(bool, space_before_semicolon, false,
          "Write a space before a semicolon.");

ABSL_FLAG(bool, space_after_semicolon, true,
          "Write a space after a semicolon.");

ABSL_FLAG(bool, space_around_delimiter, true,
          "Pad the inside of list, array and record delimiters.");

ABSL_FLAG(bool, space_before_class_constructor, false,
          "Write a space between a class name and its constructor arguments.");

ABSL_FLAG(bool, multiline_block_brackets_on_same_column, false,
          "Align the closing bracket of a multiline block with its opening "
          "column.");

ABSL_FLAG(bool, newline_between_type_definition_and_members, true,
          "Separate a type definition from its members with a blank line.");

ABSL_FLAG(bool, blank_lines_around_nested_multiline_expressions, true,
          "Surround multiline items of a sequence with blank lines.  When "
          "false, items are separated by a single line break.");

ABSL_FLAG(bool, experimental_stroustrup_style, false,
          "Keep the opening bracket of a trailing multiline argument on the "
          "same line.");

ABSL_FLAG(weft::MultilineFormatterType, record_multiline_formatter,
          weft::MultilineFormatterType::kCharacterWidth,
          "Threshold kind that forces records onto multiple lines: "
          "character_width, number_of_items.");

ABSL_FLAG(int, max_record_width, 40,
          "Maximum width of a single-line record (character_width).");

ABSL_FLAG(int, max_record_number_of_items, 1,
          "Maximum number of fields of a single-line record "
          "(number_of_items).");

ABSL_FLAG(weft::MultilineFormatterType, array_or_list_multiline_formatter,
          weft::MultilineFormatterType::kCharacterWidth,
          "Threshold kind that forces lists and arrays onto multiple lines: "
          "character_width, number_of_items.");

ABSL_FLAG(int, max_array_or_list_width, 40,
          "Maximum width of a single-line list or array (character_width).");

ABSL_FLAG(int, max_array_or_list_number_of_items, 1,
          "Maximum number of items of a single-line list or array "
          "(number_of_items).");

ABSL_FLAG(bool, strict_mode, false,
          "Ignore comments, directives and blank lines of the original "
          "source.");

namespace weft {
void InitializeFromFlags(BasicFormatStyle *style) {
#define STYLE_FROM_FLAG(name) style->name = absl::GetFlag(FLAGS_##name)

  // Simply in the sequence as declared in struct BasicFormatStyle
  STYLE_FROM_FLAG(indent_size);
  STYLE_FROM_FLAG(max_line_length);
  STYLE_FROM_FLAG(end_of_line);
  STYLE_FROM_FLAG(space_before_colon);
  STYLE_FROM_FLAG(space_after_comma);
  STYLE_FROM_FLAG(space_before_semicolon);
  STYLE_FROM_FLAG(space_after_semicolon);
  STYLE_FROM_FLAG(space_around_delimiter);
  STYLE_FROM_FLAG(space_before_class_constructor);
  STYLE_FROM_FLAG(multiline_block_brackets_on_same_column);
  STYLE_FROM_FLAG(newline_between_type_definition_and_members);
  STYLE_FROM_FLAG(blank_lines_around_nested_multiline_expressions);
  STYLE_FROM_FLAG(experimental_stroustrup_style);
  STYLE_FROM_FLAG(record_multiline_formatter);
  STYLE_FROM_FLAG(max_record_width);
  STYLE_FROM_FLAG(max_record_number_of_items);
  STYLE_FROM_FLAG(array_or_list_multiline_formatter);
  STYLE_FROM_FLAG(max_array_or_list_width);
  STYLE_FROM_FLAG(max_array_or_list_number_of_items);
  STYLE_FROM_FLAG(strict_mode);

#undef STYLE_FROM_FLAG
}
}  // namespace weft
