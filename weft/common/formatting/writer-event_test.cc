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
#include "weft/common/formatting/writer-event.h"

#include <sstream>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace weft {
namespace {

using ::testing::ElementsAre;

TEST(WriterEventTest, Printing) {
  std::ostringstream stream;
  stream << WriterEvent::WriteText("let") << ' ' << WriterEvent::IndentBy(4)
         << ' ' << WriterEvent::BreakLine() << ' '
         << WriterEvent::DeferTextUntilBreak("// c");
  EXPECT_EQ(stream.str(), "write(\"let\") indent(4) break defer(\"// c\")");
}

TEST(WriterEventTest, IsBreak) {
  EXPECT_TRUE(WriterEvent::BreakLine().IsBreak());
  EXPECT_TRUE(WriterEvent::BreakLineInStringLiteral().IsBreak());
  EXPECT_TRUE(WriterEvent::BreakLineInTrivia().IsBreak());
  EXPECT_TRUE(WriterEvent::BreakLineDueToTrivia().IsBreak());
  EXPECT_FALSE(WriterEvent::WriteText("\n").IsBreak());
  EXPECT_FALSE(WriterEvent::DeferTextUntilBreak("// x").IsBreak());
  EXPECT_FALSE(WriterEvent::SetIndent(0).IsBreak());
}

TEST(WriterEventTest, CommentOrDirectiveMarkers) {
  EXPECT_TRUE(IsCommentOrDirective(WriterEvent::WriteText("// line")));
  EXPECT_TRUE(IsCommentOrDirective(WriterEvent::WriteText("(* block *)")));
  EXPECT_TRUE(IsCommentOrDirective(WriterEvent::WriteText("#if DEBUG")));
  EXPECT_TRUE(IsCommentOrDirective(WriterEvent::WriteText("#else")));
  EXPECT_TRUE(IsCommentOrDirective(WriterEvent::WriteText("#endif")));
  EXPECT_FALSE(IsCommentOrDirective(WriterEvent::WriteText("#load")));
  EXPECT_FALSE(IsCommentOrDirective(WriterEvent::WriteText(" // late")));
  EXPECT_FALSE(IsCommentOrDirective(WriterEvent::WriteText("x")));
  // Only text writes qualify.
  EXPECT_FALSE(IsCommentOrDirective(WriterEvent::DeferTextUntilBreak("// c")));
}

TEST(NormalizeWriterEventTest, SingleLineEventsAreUnchanged) {
  for (const auto &event :
       {WriterEvent::WriteText("abc"), WriterEvent::WriteText(""),
        WriterEvent::BreakLine(), WriterEvent::IndentBy(2),
        WriterEvent::DeferTextUntilBreak("a\nb")}) {
    EXPECT_THAT(NormalizeWriterEvent(event), ElementsAre(event));
  }
}

TEST(NormalizeWriterEventTest, StringLiteralSplitsVerbatim) {
  EXPECT_THAT(NormalizeWriterEvent(WriterEvent::WriteText("\"a\n\n  b\"")),
              ElementsAre(WriterEvent::WriteText("\"a"),
                          WriterEvent::BreakLineInStringLiteral(),
                          WriterEvent::WriteText(""),
                          WriterEvent::BreakLineInStringLiteral(),
                          WriterEvent::WriteText("  b\"")));
}

TEST(NormalizeWriterEventTest, CommentSplitsAsTrivia) {
  EXPECT_THAT(NormalizeWriterEvent(WriterEvent::WriteText("(* one\n   two *)")),
              ElementsAre(WriterEvent::WriteText("(* one"),
                          WriterEvent::BreakLineInTrivia(),
                          WriterEvent::WriteText("   two *)")));
}

TEST(NormalizeWriterEventTest, TrailingNewlineYieldsEmptyWrite) {
  EXPECT_THAT(NormalizeWriterEvent(WriterEvent::WriteText("x\n")),
              ElementsAre(WriterEvent::WriteText("x"),
                          WriterEvent::BreakLineInStringLiteral(),
                          WriterEvent::WriteText("")));
}

TEST(NormalizeWriterEventTest, CarriageReturnsAreDropped) {
  EXPECT_EQ(NormalizeWriterEvent(WriterEvent::WriteText("x\r\ny")),
            NormalizeWriterEvent(WriterEvent::WriteText("x\ny")));
  EXPECT_EQ(NormalizeWriterEvent(WriterEvent::WriteText("// a\r\n// b")),
            NormalizeWriterEvent(WriterEvent::WriteText("// a\n// b")));
}

}  // namespace
}  // namespace weft
