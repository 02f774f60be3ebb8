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

#include "weft/common/formatting/trivia.h"

#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "weft/common/strings/line-column-map.h"

namespace weft {
namespace {

using ::testing::ElementsAre;
using ::testing::Pointee;

constexpr NodeType kBinding = 1;
constexpr NodeType kMember = 2;

const LineColumnRange kFirst{{0, 0}, {0, 9}};
const LineColumnRange kSecond{{2, 0}, {3, 4}};

MATCHER_P(HasContent, content, "") { return arg.content == content; }

TEST(TriviaTest, FindTriviaKeepsOrderAndMatchesExactRange) {
  TriviaTable table;
  table[kBinding].push_back(
      {kBinding, kFirst, true, TriviaContent::CommentOnSingleLine("// a")});
  table[kBinding].push_back({kBinding, kSecond, true, TriviaContent::Newline()});
  table[kBinding].push_back(
      {kBinding, kFirst, true, TriviaContent::Directive("#if X")});

  EXPECT_THAT(
      FindTrivia(table, kBinding, kFirst),
      ElementsAre(
          Pointee(HasContent(TriviaContent::CommentOnSingleLine("// a"))),
          Pointee(HasContent(TriviaContent::Directive("#if X")))));
  EXPECT_THAT(FindTrivia(table, kBinding, kSecond),
              ElementsAre(Pointee(HasContent(TriviaContent::Newline()))));
  // Same start, different end.
  EXPECT_TRUE(FindTrivia(table, kBinding, {{0, 0}, {0, 8}}).empty());
  EXPECT_TRUE(FindTrivia(table, kMember, kFirst).empty());
}

TEST(TriviaTest, HasTrivia) {
  TriviaTable table;
  table[kMember].push_back({kMember, kSecond, false,
                            TriviaContent::LineCommentAfterSourceCode("// x")});
  EXPECT_TRUE(HasTrivia(table, kMember, kSecond));
  EXPECT_FALSE(HasTrivia(table, kMember, kFirst));
  EXPECT_FALSE(HasTrivia(table, kBinding, kSecond));
}

TEST(TriviaTest, PrintContent) {
  std::ostringstream stream;
  stream << TriviaContent::BlockComment("(* c *)", true, false) << ' '
         << TriviaContent::Newline();
  EXPECT_EQ(stream.str(), "block-comment(\"(* c *)\") +before newline");
}

TEST(TriviaTest, PrintInstruction) {
  std::ostringstream stream;
  stream << TriviaInstruction{kBinding, kFirst, false,
                              TriviaContent::Directive("#endif")};
  EXPECT_EQ(stream.str(), "after 1 [1:1-1:10): directive(\"#endif\")");
}

}  // namespace
}  // namespace weft
