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

#include "weft/common/strings/utf8.h"

#include <cstring>

#include "gtest/gtest.h"

namespace weft {
namespace {

TEST(UTF8Util, Utf8LenTest) {
  EXPECT_EQ(utf8_len(""), 0);
  EXPECT_EQ(utf8_len("let a = 1"), 9);
  EXPECT_EQ(utf8_len("\n\r\t \v"), 5);

  EXPECT_EQ(strlen("\xc3\xa4"), 2);  // two byte encoding
  EXPECT_EQ(utf8_len("\xc3\xa4\xc3\xa4"), 2);

  EXPECT_EQ(strlen("\xe2\x80\xb1"), 3);  // three byte encoding
  EXPECT_EQ(utf8_len("\xe2\x80\xb1\xe2\x80\xb1"), 2);

  EXPECT_EQ(strlen("\xf0\x9f\x98\x80"), 4);  // four byte encoding
  EXPECT_EQ(utf8_len("\xf0\x9f\x98\x80\xf0\x9f\x98\x80"), 2);
}

}  // namespace
}  // namespace weft
