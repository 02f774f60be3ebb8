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


#include "weft/common/formatting/multiline-list.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "weft/common/formatting/basic-format-style.h"
#include "weft/common/formatting/combinators.h"
#include "weft/common/formatting/context.h"

namespace weft {
namespace {

const Step kSingleA = Text("let a = 1");
const Step kSingleB = Text("let b = 2");
const Step kSingleC = Text("let c = 3");
const Step kMultilineB = Seq({Text("let b ="), SepNln, Text("2")});

std::vector<ColMultilineItem> Items(const std::vector<Step> &steps) {
  std::vector<ColMultilineItem> items;
  for (const auto &step : steps) items.push_back({step, SepNln});
  return items;
}

std::string Join(const std::vector<Step> &steps,
                 const Context &ctx = Context()) {
  return Dump(ColWithNlnWhenItemIsMultiline(Items(steps))(ctx));
}

TEST(IsMultilineItemTest, SingleLine) {
  Context next;
  EXPECT_FALSE(IsMultilineItem(kSingleA, Context(), &next));
  EXPECT_EQ(Dump(next), "let a = 1");
}

TEST(IsMultilineItemTest, LineBreak) {
  Context next;
  EXPECT_TRUE(IsMultilineItem(kMultilineB, Context(), &next));
  EXPECT_EQ(Dump(next), "let b =\n2");
}

TEST(IsMultilineItemTest, StringLiteralSpanningLines) {
  Context next;
  EXPECT_TRUE(IsMultilineItem(Text("let s = \"a\nb\""), Context(), &next));
}

TEST(IsMultilineItemTest, OnlyCountsBreaksOfTheItem) {
  const Context ctx = Seq({Text("x"), SepNln, Text("y"), SepNln})(Context());
  Context next;
  EXPECT_FALSE(IsMultilineItem(kSingleA, ctx, &next));
  EXPECT_EQ(Dump(next), "x\ny\nlet a = 1");
}

TEST(IsMultilineItemTest, LeadingCommentIsNotMultiline) {
  const Step commented = Seq({Text("// about a"), SepNln, kSingleA});
  Context next;
  EXPECT_FALSE(IsMultilineItem(commented, Context(), &next));
  EXPECT_EQ(Dump(next), "// about a\nlet a = 1");
}

TEST(IsMultilineItemTest, LineBreakAfterLeadingComment) {
  const Step commented = Seq({Text("// about b"), SepNln, kMultilineB});
  Context next;
  EXPECT_TRUE(IsMultilineItem(commented, Context(), &next));
}

TEST(ColWithNlnWhenItemIsMultilineTest, Empty) {
  const Context ctx = Text("x")(Context());
  const Context joined = ColWithNlnWhenItemIsMultiline({})(ctx);
  EXPECT_EQ(joined.Events().size(), ctx.Events().size());
  EXPECT_EQ(Dump(joined), "x");
}

TEST(ColWithNlnWhenItemIsMultilineTest, SingleItemHasNoSeparator) {
  EXPECT_EQ(Join({kMultilineB}), "let b =\n2");
  EXPECT_EQ(Join({kSingleA}), "let a = 1");
}

TEST(ColWithNlnWhenItemIsMultilineTest, SingleLineItemsStayAdjacent) {
  EXPECT_EQ(Join({kSingleA, kSingleB, kSingleC}),
            "let a = 1\nlet b = 2\nlet c = 3");
}

TEST(ColWithNlnWhenItemIsMultilineTest, BlankLinesAroundMultilineItem) {
  EXPECT_EQ(Join({kSingleA, kMultilineB, kSingleC}),
            "let a = 1\n\nlet b =\n2\n\nlet c = 3");
}

TEST(ColWithNlnWhenItemIsMultilineTest, MultilineFirstItem) {
  EXPECT_EQ(Join({kMultilineB, kSingleA, kSingleC}),
            "let b =\n2\n\nlet a = 1\nlet c = 3");
}

TEST(ColWithNlnWhenItemIsMultilineTest, AdjacentMultilineItems) {
  EXPECT_EQ(Join({kMultilineB, kMultilineB}), "let b =\n2\n\nlet b =\n2");
}

TEST(ColWithNlnWhenItemIsMultilineTest, KeepsExistingBlankLine) {
  const Step ends_with_blank_line = Seq({kSingleA, SepNln, SepNln});
  std::vector<ColMultilineItem> items = {{ends_with_blank_line, SepNln},
                                         {kSingleB, SepNone}};
  EXPECT_EQ(Dump(ColWithNlnWhenItemIsMultiline(items)(Context())),
            "let a = 1\n\nlet b = 2");
}

TEST(ColWithNlnWhenItemIsMultilineTest, LeadingCommentKeepsItemsAdjacent) {
  const Step commented = Seq({Text("// about b"), SepNln, kSingleB});
  EXPECT_EQ(Join({kSingleA, commented}), "let a = 1\n// about b\nlet b = 2");
}

TEST(ColWithNlnWhenItemIsMultilineTest, ItemsAreIndented) {
  const Context ctx = Seq({Text("module M ="), Indent, SepNln})(Context());
  EXPECT_EQ(Join({kSingleA, kMultilineB}, ctx),
            "module M =\n    let a = 1\n\n    let b =\n    2");
}

TEST(ColWithNlnWhenItemIsMultilineUsingConfigTest, Enabled) {
  EXPECT_EQ(Dump(ColWithNlnWhenItemIsMultilineUsingConfig(
                Items({kSingleA, kMultilineB, kSingleC}))(Context())),
            "let a = 1\n\nlet b =\n2\n\nlet c = 3");
}

TEST(ColWithNlnWhenItemIsMultilineUsingConfigTest, Disabled) {
  BasicFormatStyle style;
  style.blank_lines_around_nested_multiline_expressions = false;
  const Context ctx = Context::Create(style, nullptr, {});
  EXPECT_EQ(Dump(ColWithNlnWhenItemIsMultilineUsingConfig(
                Items({kSingleA, kMultilineB, kSingleC}))(ctx)),
            "let a = 1\nlet b =\n2\nlet c = 3");
}

}  // namespace
}  // namespace weft
