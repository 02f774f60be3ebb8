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

#include <string>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "gtest/gtest.h"
#include "weft/common/util/enum-flags.h"

namespace weft {
namespace config {
namespace {

TEST(ConfigUtilsTest, EmptyConfigIsOk) {
  EXPECT_TRUE(ParseNameValues("", {{"foo", nullptr}}).ok());
  EXPECT_TRUE(ParseNameValues(" ; ;\n", {{"foo", nullptr}}).ok());
}

TEST(ConfigUtilsTest, ComplainInvalidParameter) {
  absl::Status s;
  s = ParseNameValues("baz:123", {{"foo", nullptr}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(), "baz: unknown parameter; supported parameter is 'foo'");

  s = ParseNameValues("baz:123", {{"foo", nullptr}, {"bar", nullptr}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(),
            "baz: unknown parameter; supported parameters are 'foo', 'bar'");

  s = ParseNameValues("foo:123", {{"foo", nullptr}, {"bar", nullptr}});
  EXPECT_TRUE(s.ok());
}

TEST(ConfigUtilsTest, NullSetterConsumesButContinues) {
  int value = 0;
  const absl::Status s = ParseNameValues(
      "ignored:1;width:7", {{"ignored", nullptr}, {"width", SetInt(&value, 0, 100)}});
  EXPECT_TRUE(s.ok()) << s;
  EXPECT_EQ(value, 7);
}

TEST(ConfigUtilsTest, ParseInteger) {
  absl::Status s;
  int value = -1;
  s = ParseNameValues("width:42", {{"width", SetInt(&value, 0, 100)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(value, 42);

  s = ParseNameValues("width:fourtytwo", {{"width", SetInt(&value, 0, 100)}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(), "width: 'fourtytwo': Cannot parse integer");

  s = ParseNameValues("width:142", {{"width", SetInt(&value, 0, 100)}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(), "width: 142 out of range [0...100]");
  EXPECT_EQ(value, 42);

  s = ParseNameValues("width:-12", {{"width", SetInt(&value, -20, 0)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(value, -12);
}

TEST(ConfigUtilsTest, ParseBool) {
  for (auto config : {"flag", "flag:TrUe", "flag:on", "flag:1"}) {
    bool value = false;
    const absl::Status s = ParseNameValues(config, {{"flag", SetBool(&value)}});
    EXPECT_TRUE(s.ok()) << config;
    EXPECT_TRUE(value) << config;
  }
  for (auto config : {"flag:false", "flag:OFF", "flag:0"}) {
    bool value = true;
    const absl::Status s = ParseNameValues(config, {{"flag", SetBool(&value)}});
    EXPECT_TRUE(s.ok()) << config;
    EXPECT_FALSE(value) << config;
  }
  bool value = true;
  const absl::Status s =
      ParseNameValues("flag:maybe", {{"flag", SetBool(&value)}});
  EXPECT_FALSE(s.ok());
  EXPECT_TRUE(absl::StartsWith(s.message(), "flag: Boolean value"));
}

TEST(ConfigUtilsTest, WhitespaceAndNewlineSeparators) {
  int width = 0;
  bool strict = false;
  const absl::Status s =
      ParseNameValues(" width : 80 \n strict:on ",
                      {{"width", SetInt(&width, 1, 100)},
                       {"strict", SetBool(&strict)}});
  EXPECT_TRUE(s.ok()) << s;
  EXPECT_EQ(width, 80);
  EXPECT_TRUE(strict);
}

enum class Side { kLeft, kRight };

const EnumNameMap<Side> &SideNames() {
  static const EnumNameMap<Side> kNames({
      {"left", Side::kLeft},
      {"right", Side::kRight},
  });
  return kNames;
}

TEST(ConfigUtilsTest, ParseEnum) {
  Side side = Side::kLeft;
  absl::Status s = ParseNameValues(
      "side:right", {{"side", SetEnum(&side, SideNames(), "Side")}});
  EXPECT_TRUE(s.ok()) << s;
  EXPECT_EQ(side, Side::kRight);

  s = ParseNameValues("side:up",
                      {{"side", SetEnum(&side, SideNames(), "Side")}});
  EXPECT_FALSE(s.ok());
  EXPECT_TRUE(absl::StartsWith(s.message(), "side: Invalid Side: 'up'"));
  EXPECT_EQ(side, Side::kRight);
}

}  // namespace
}  // namespace config
}  // namespace weft
