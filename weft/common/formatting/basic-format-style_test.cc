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

#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "gtest/gtest.h"

namespace weft {
namespace {

TEST(EndOfLineStyleTest, Print) {
  std::ostringstream stream;
  stream << EndOfLineStyle::kCRLF;
  EXPECT_EQ(stream.str(), "crlf");
}

TEST(EndOfLineStyleTest, ParseAndUnparseFlag) {
  EndOfLineStyle style = EndOfLineStyle::kLF;
  std::string error;
  EXPECT_TRUE(AbslParseFlag("cr", &style, &error));
  EXPECT_EQ(style, EndOfLineStyle::kCR);
  EXPECT_EQ(AbslUnparseFlag(style), "cr");
  EXPECT_TRUE(error.empty());

  EXPECT_FALSE(AbslParseFlag("dos", &style, &error));
  EXPECT_EQ(style, EndOfLineStyle::kCR);
  EXPECT_TRUE(absl::StartsWith(error, "Invalid EndOfLineStyle: 'dos'"))
      << error;
}

TEST(EndOfLineStyleTest, NewlineString) {
  EXPECT_EQ(NewlineString(EndOfLineStyle::kLF), "\n");
  EXPECT_EQ(NewlineString(EndOfLineStyle::kCRLF), "\r\n");
  EXPECT_EQ(NewlineString(EndOfLineStyle::kCR), "\r");
}

TEST(MultilineFormatterTypeTest, ParseAndUnparseFlag) {
  MultilineFormatterType type = MultilineFormatterType::kCharacterWidth;
  std::string error;
  EXPECT_TRUE(AbslParseFlag("number_of_items", &type, &error));
  EXPECT_EQ(type, MultilineFormatterType::kNumberOfItems);
  EXPECT_EQ(AbslUnparseFlag(type), "number_of_items");
  EXPECT_FALSE(AbslParseFlag("lines", &type, &error));
  EXPECT_TRUE(absl::StartsWith(error, "Invalid MultilineFormatterType"))
      << error;
}

TEST(ParseFormatStyleTest, Empty) {
  BasicFormatStyle style;
  EXPECT_TRUE(ParseFormatStyle("", &style).ok());
  EXPECT_EQ(style.indent_size, 4);
  EXPECT_EQ(style.max_line_length, 120);
}

TEST(ParseFormatStyleTest, SetsFields) {
  BasicFormatStyle style;
  const absl::Status status = ParseFormatStyle(
      "indent_size:2; max_line_length: 80;end_of_line:crlf\n"
      "space_around_delimiter:false;experimental_stroustrup_style\n"
      "array_or_list_multiline_formatter:number_of_items;"
      "max_array_or_list_number_of_items:3",
      &style);
  ASSERT_TRUE(status.ok()) << status.message();
  EXPECT_EQ(style.indent_size, 2);
  EXPECT_EQ(style.max_line_length, 80);
  EXPECT_EQ(style.end_of_line, EndOfLineStyle::kCRLF);
  EXPECT_FALSE(style.space_around_delimiter);
  EXPECT_TRUE(style.experimental_stroustrup_style);
  EXPECT_EQ(style.array_or_list_multiline_formatter,
            MultilineFormatterType::kNumberOfItems);
  EXPECT_EQ(style.max_array_or_list_number_of_items, 3);
  // Untouched.
  EXPECT_EQ(style.record_multiline_formatter,
            MultilineFormatterType::kCharacterWidth);
  EXPECT_TRUE(style.space_after_comma);
}

TEST(ParseFormatStyleTest, IndentOutOfRange) {
  BasicFormatStyle style;
  const absl::Status status = ParseFormatStyle("indent_size:0", &style);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(status.message(), "indent_size: 0 out of range [1...64]");
  EXPECT_EQ(style.indent_size, 4);
}

TEST(ParseFormatStyleTest, NotAnInteger) {
  BasicFormatStyle style;
  const absl::Status status = ParseFormatStyle("max_line_length:wide", &style);
  EXPECT_EQ(status.message(),
            "max_line_length: 'wide': Cannot parse integer");
}

TEST(ParseFormatStyleTest, UnknownParameter) {
  BasicFormatStyle style;
  const absl::Status status = ParseFormatStyle("tab_width:8", &style);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_TRUE(absl::StartsWith(
      status.message(), "tab_width: unknown parameter; supported parameters"))
      << status.message();
  EXPECT_TRUE(absl::StrContains(status.message(), "'strict_mode'"));
}

TEST(ParseFormatStyleTest, InvalidEnumValue) {
  BasicFormatStyle style;
  const absl::Status status = ParseFormatStyle("end_of_line:unix", &style);
  EXPECT_TRUE(absl::StartsWith(status.message(),
                               "end_of_line: Invalid EndOfLineStyle: 'unix'"))
      << status.message();
}

TEST(ParseFormatStyleTest, StopsAtFirstError) {
  BasicFormatStyle style;
  EXPECT_FALSE(
      ParseFormatStyle("indent_size:8;space_after_comma:maybe;strict_mode",
                       &style)
          .ok());
  EXPECT_EQ(style.indent_size, 8);
  EXPECT_FALSE(style.strict_mode);
}

}  // namespace
}  // namespace weft
