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

#include "weft/common/formatting/event-log.h"

#include <sstream>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "weft/common/formatting/writer-event.h"

namespace weft {
namespace {

using ::testing::ElementsAre;

TEST(EventLogTest, EmptyLog) {
  const EventLog log;
  EXPECT_TRUE(log.empty());
  EXPECT_EQ(log.size(), 0);
  EXPECT_EQ(log.NumChunks(), 0);
  EXPECT_TRUE(log.Events().empty());
  EXPECT_TRUE(log.Chunks().empty());
}

TEST(EventLogTest, AppendLeavesOriginalIntact) {
  const EventLog a = EventLog().Append({WriterEvent::WriteText("a")});
  const EventLog b =
      a.Append({WriterEvent::WriteText("b"), WriterEvent::BreakLine()});
  const EventLog c = a.Append({WriterEvent::WriteText("c")});

  EXPECT_EQ(a.size(), 1);
  EXPECT_EQ(a.NumChunks(), 1);
  EXPECT_THAT(a.Events(), ElementsAre(WriterEvent::WriteText("a")));

  EXPECT_EQ(b.size(), 3);
  EXPECT_EQ(b.NumChunks(), 2);
  EXPECT_THAT(b.Events(), ElementsAre(WriterEvent::WriteText("a"),
                                      WriterEvent::WriteText("b"),
                                      WriterEvent::BreakLine()));

  EXPECT_THAT(c.Events(), ElementsAre(WriterEvent::WriteText("a"),
                                      WriterEvent::WriteText("c")));
}

TEST(EventLogTest, ChunksKeepTheirBoundaries) {
  const EventLog log =
      EventLog()
          .Append({WriterEvent::WriteText("x"),
                   WriterEvent::BreakLineInStringLiteral(),
                   WriterEvent::WriteText("y")})
          .Append({WriterEvent::IndentBy(4)});
  const auto chunks = log.Chunks();
  ASSERT_EQ(chunks.size(), 2);
  EXPECT_EQ(chunks[0].size(), 3);
  EXPECT_THAT(chunks[1], ElementsAre(WriterEvent::IndentBy(4)));
}

TEST(EventLogTest, VisitNewestFirstStopsEarly) {
  const EventLog log = EventLog()
                           .Append({WriterEvent::WriteText("1")})
                           .Append({WriterEvent::WriteText("2"),
                                    WriterEvent::WriteText("3")})
                           .Append({WriterEvent::WriteText("4")});
  std::vector<std::string> seen;
  log.VisitNewestFirst([&seen](const WriterEvent &event) {
    seen.push_back(event.text);
    return event.text != "2";
  });
  EXPECT_THAT(seen, ElementsAre("4", "3", "2"));
}

static bool IsPlainBreak(const WriterEvent &event) {
  return event.Is(WriterEventType::kBreakLine);
}

static bool IsLoneCommentOrBreak(const EventLog::Chunk &chunk) {
  return chunk.size() == 1 &&
         (IsCommentOrDirective(chunk[0]) || IsPlainBreak(chunk[0]));
}

static bool NeverSkip(const EventLog::Chunk &) { return false; }

TEST(EventLogTest, SkipExistsIgnoresSkippedLeadingChunks) {
  const EventLog before = EventLog().Append({WriterEvent::BreakLine()});
  const EventLog log = before.Append({WriterEvent::WriteText("// note")})
                           .Append({WriterEvent::BreakLine()})
                           .Append({WriterEvent::WriteText("y")});
  EXPECT_FALSE(log.SkipExists(before.size(), IsPlainBreak,
                              IsLoneCommentOrBreak));
  // The same break counts once it follows real content.
  const EventLog longer = log.Append({WriterEvent::BreakLine()});
  EXPECT_TRUE(longer.SkipExists(before.size(), IsPlainBreak,
                                IsLoneCommentOrBreak));
  // Events before the offset are never looked at.
  EXPECT_FALSE(before.SkipExists(before.size(), IsPlainBreak, NeverSkip));
  EXPECT_TRUE(before.SkipExists(0, IsPlainBreak, NeverSkip));
}

TEST(EventLogTest, SkipExistsWithOffsetInsideChunk) {
  const EventLog log = EventLog().Append(
      {WriterEvent::WriteText("a"), WriterEvent::BreakLine(),
       WriterEvent::WriteText("b")});
  EXPECT_TRUE(log.SkipExists(1, IsPlainBreak, NeverSkip));
  EXPECT_FALSE(log.SkipExists(2, IsPlainBreak, NeverSkip));
}

TEST(EventLogTest, SkipExistsJudgesChunkTailOnItsOwn) {
  const EventLog log = EventLog().Append(
      {WriterEvent::WriteText("a"), WriterEvent::BreakLine()});
  EXPECT_TRUE(log.SkipExists(0, IsPlainBreak, IsLoneCommentOrBreak));
  // After the offset, only a lone break remains, which is skipped.
  EXPECT_FALSE(log.SkipExists(1, IsPlainBreak, IsLoneCommentOrBreak));
}

TEST(EventLogTest, Print) {
  std::ostringstream stream;
  stream << EventLog()
                .Append({WriterEvent::WriteText("a")})
                .Append({WriterEvent::BreakLine()});
  EXPECT_EQ(stream.str(), "[write(\"a\"), break]");
}

}  // namespace
}  // namespace weft
