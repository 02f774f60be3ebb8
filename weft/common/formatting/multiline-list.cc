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

#include <cstddef>
#include <utility>
#include <vector>

#include "weft/common/formatting/combinators.h"
#include "weft/common/formatting/context.h"
#include "weft/common/formatting/event-log.h"
#include "weft/common/formatting/writer-event.h"
#include "weft/common/util/logging.h"

namespace weft {

// Leading newlines and trivia of an item.
static bool IsLeadingTriviaChunk(const EventLog::Chunk &chunk) {
  if (chunk.empty()) return false;
  const WriterEvent &first = chunk.front();
  return IsCommentOrDirective(first) ||
         first.Is(WriterEventType::kBreakLine) ||
         first.Is(WriterEventType::kBreakLineDueToTrivia);
}

bool IsMultilineItem(const Step &expr, const Context &ctx, Context *next) {
  const size_t events_before = ctx.Events().size();
  *next = expr(ctx);
  return next->Events().SkipExists(
      events_before,
      [](const WriterEvent &event) {
        return event.Is(WriterEventType::kBreakLine) ||
               event.Is(WriterEventType::kBreakLineInStringLiteral);
      },
      IsLeadingTriviaChunk);
}

static Context JoinItems(const std::vector<ColMultilineItem> &items,
                         const Context &ctx) {
  if (items.empty()) return ctx;
  if (items.size() == 1) return items.front().expr(ctx);

  Context result;
  bool last_multiline = IsMultilineItem(items.front().expr, ctx, &result);
  for (size_t i = 1; i < items.size(); ++i) {
    const ColMultilineItem &item = items[i];
    // Optimistically render with the separator, as if this item or the
    // previous one was multiline.
    const Context after_separator =
        Seq(IfElseCtx(NewlineBetweenLastWriteEvent, SepNone, SepNln),
            item.sep_nln)(result);
    Context next;
    const bool multiline = IsMultilineItem(item.expr, after_separator, &next);
    if (!multiline && !last_multiline) {
      VLOG(4) << "items " << i - 1 << " and " << i
              << " are single line, rendering item " << i << " again";
      next = Seq(item.sep_nln, item.expr)(result);
    }
    result = std::move(next);
    last_multiline = multiline;
  }
  return result;
}

Step ColWithNlnWhenItemIsMultiline(std::vector<ColMultilineItem> items) {
  return [items = std::move(items)](const Context &ctx) {
    return JoinItems(items, ctx);
  };
}

Step ColWithNlnWhenItemIsMultilineUsingConfig(
    std::vector<ColMultilineItem> items) {
  return [items = std::move(items)](const Context &ctx) {
    if (ctx.Style().blank_lines_around_nested_multiline_expressions) {
      return JoinItems(items, ctx);
    }
    return Col(SepNln, items,
               [](const ColMultilineItem &item) { return item.expr; })(ctx);
  };
}

}  // namespace weft
