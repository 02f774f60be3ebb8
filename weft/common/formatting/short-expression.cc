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

#include "weft/common/formatting/short-expression.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <utility>

#include "weft/common/formatting/basic-format-style.h"
#include "weft/common/formatting/combinators.h"
#include "weft/common/formatting/context.h"
#include "weft/common/formatting/event-log.h"
#include "weft/common/formatting/writer-event.h"
#include "weft/common/util/logging.h"

namespace weft {

// Returns true if 'result', the outcome of a trial, must be discarded.
static bool TrialMustFallBack(const Context &result) {
  // A trial that somehow left trial mode cannot be trusted either.
  return !result.Model().InTrial() || result.TrialFailed();
}

Context ShortExpressionWithFallback(const Step &short_expression,
                                    const Step &fallback, int max_width,
                                    std::optional<int> start_column,
                                    const Context &ctx) {
  if (ctx.TrialFailed()) return ctx;
  const Context result =
      short_expression(ctx.WithShortExpression(max_width, start_column));
  if (TrialMustFallBack(result)) {
    VLOG(3) << "short form over budget (max_width: " << max_width
            << ") at column " << ctx.Column() << ", falling back; "
            << result.Model();
    return fallback(ctx);
  }
  return result.WithModeOf(ctx);
}

Step IsShortExpression(int max_width, Step short_expression, Step fallback) {
  return [max_width, short_expression = std::move(short_expression),
          fallback = std::move(fallback)](const Context &ctx) {
    return ShortExpressionWithFallback(short_expression, fallback, max_width,
                                       std::nullopt, ctx);
  };
}

Step IsShortExpressionOrAddIndentAndNewline(int max_width, Step body) {
  Step fallback = IndentSepNlnUnindent(body);
  return IsShortExpression(max_width, std::move(body), std::move(fallback));
}

Step SepSpaceIfShortExpressionOrAddIndentAndNewline(int max_width,
                                                    Step body) {
  return IsShortExpression(max_width, Seq(SepSpace, body),
                           IndentSepNlnUnindent(body));
}

Step ExpressionFitsOnRestOfLine(Step expression, Step fallback) {
  return [expression = std::move(expression),
          fallback = std::move(fallback)](const Context &ctx) {
    return ShortExpressionWithFallback(expression, fallback, ctx.PageWidth(),
                                       0, ctx);
  };
}

std::ostream &operator<<(std::ostream &stream, const Size &size) {
  switch (size.kind) {
    case Size::Kind::kCharacterWidth:
      return stream << "character-width(" << size.max_width << ')';
    case Size::Kind::kNumberOfItems:
      return stream << "number-of-items(" << size.items << '/'
                    << size.max_items << ')';
  }
  return stream << "???";
}

Size GetListOrArrayExprSize(const Context &ctx, int max_width,
                            int num_items) {
  const BasicFormatStyle &style = ctx.Style();
  switch (style.array_or_list_multiline_formatter) {
    case MultilineFormatterType::kCharacterWidth:
      return Size::CharacterWidth(max_width);
    case MultilineFormatterType::kNumberOfItems:
      return Size::NumberOfItems(num_items,
                                 style.max_array_or_list_number_of_items);
  }
  return Size::CharacterWidth(max_width);
}

Size GetRecordSize(const Context &ctx, int num_fields) {
  const BasicFormatStyle &style = ctx.Style();
  switch (style.record_multiline_formatter) {
    case MultilineFormatterType::kCharacterWidth:
      return Size::CharacterWidth(style.max_record_width);
    case MultilineFormatterType::kNumberOfItems:
      return Size::NumberOfItems(num_fields, style.max_record_number_of_items);
  }
  return Size::CharacterWidth(style.max_record_width);
}

Step IsSmallExpression(Size size, Step small_expression, Step fallback) {
  switch (size.kind) {
    case Size::Kind::kCharacterWidth:
      return IsShortExpression(size.max_width, std::move(small_expression),
                               std::move(fallback));
    case Size::Kind::kNumberOfItems:
      if (size.items > size.max_items) return fallback;
      return ExpressionFitsOnRestOfLine(std::move(small_expression),
                                        std::move(fallback));
  }
  return fallback;
}

std::ostream &operator<<(std::ostream &stream, const LayoutPosition &pos) {
  return stream << '(' << pos.lines << ", " << pos.column << ')';
}

static LayoutPosition PositionOf(const Context &ctx) {
  return {ctx.Model().lines.size(), ctx.Column()};
}

Step LeadingExpressionResult(
    Step leading,
    std::function<Step(const LayoutPosition &, const LayoutPosition &)>
        continuation) {
  return [leading = std::move(leading),
          continuation = std::move(continuation)](const Context &ctx) {
    const LayoutPosition before = PositionOf(ctx);
    const Context after_leading = leading(ctx);
    return continuation(before, PositionOf(after_leading))(after_leading);
  };
}

Step LeadingExpressionLong(int threshold, Step leading,
                           std::function<Step(bool)> continuation) {
  return LeadingExpressionResult(
      std::move(leading),
      [threshold, continuation = std::move(continuation)](
          const LayoutPosition &before, const LayoutPosition &after) {
        return continuation(after.lines > before.lines ||
                            after.column - before.column > threshold);
      });
}

static bool IsEmptyWrite(const WriterEvent &event) {
  return event.IsWriteOf("");
}

// An '#if' ... '#endif' pair with nothing but blank lines in between.
static bool IsEmptyDirectiveBlock(const EventLog::Chunk &chunk) {
  if (chunk.empty()) return false;
  if (!IsCommentOrDirective(chunk.front()) ||
      !IsCommentOrDirective(chunk.back())) {
    return false;
  }
  for (size_t i = 1; i + 1 < chunk.size(); ++i) {
    const WriterEvent &event = chunk[i];
    if (!IsEmptyWrite(event) &&
        !event.Is(WriterEventType::kBreakLineInStringLiteral) &&
        !event.Is(WriterEventType::kBreakLineInTrivia)) {
      return false;
    }
  }
  return true;
}

// Chunks that do not make a leading expression multiline.
static bool IsLeadingTriviaChunk(const EventLog::Chunk &chunk) {
  if (chunk.size() == 1) {
    const WriterEvent &event = chunk.front();
    if (IsCommentOrDirective(event) || event.Is(WriterEventType::kBreakLine) ||
        IsEmptyWrite(event)) {
      return true;
    }
  }
  return IsEmptyDirectiveBlock(chunk);
}

Step LeadingExpressionIsMultiline(Step leading,
                                  std::function<Step(bool)> continuation) {
  return [leading = std::move(leading),
          continuation = std::move(continuation)](const Context &ctx) {
    const size_t events_before = ctx.Events().size();
    const Context after_leading = leading(ctx);
    const bool multiline = after_leading.Events().SkipExists(
        events_before,
        [](const WriterEvent &event) {
          return event.Is(WriterEventType::kBreakLine);
        },
        IsLeadingTriviaChunk);
    return continuation(multiline)(after_leading);
  };
}

Context ExpressionExceedsPageWidth(const Step &before_short,
                                   const Step &after_short,
                                   const Step &before_long,
                                   const Step &after_long, const Step &expr,
                                   const Context &ctx) {
  if (ctx.TrialFailed()) return ctx;
  const Step short_form = Seq({before_short, expr, after_short});
  if (ctx.Model().InTrial()) return short_form(ctx);

  const Context result =
      short_form(ctx.WithShortExpression(ctx.PageWidth(), 0));
  if (TrialMustFallBack(result)) {
    VLOG(3) << "expression exceeds page width at column " << ctx.Column()
            << ", falling back; " << result.Model();
    return Seq({before_long, expr, after_long})(ctx);
  }
  return result.WithModeOf(ctx);
}

// Binds the surrounding steps of ExpressionExceedsPageWidth().
static Step ExceedsPageWidth(Step before_short, Step after_short,
                             Step before_long, Step after_long, Step expr) {
  return [before_short = std::move(before_short),
          after_short = std::move(after_short),
          before_long = std::move(before_long),
          after_long = std::move(after_long),
          expr = std::move(expr)](const Context &ctx) {
    return ExpressionExceedsPageWidth(before_short, after_short, before_long,
                                      after_long, expr, ctx);
  };
}

Step AutoIndentAndNlnIfExpressionExceedsPageWidth(Step expr) {
  return ExceedsPageWidth(SepNone, SepNone, Seq(Indent, SepNln), Unindent,
                          std::move(expr));
}

Step SepSpaceOrIndentAndNlnIfExpressionExceedsPageWidth(Step expr) {
  return ExceedsPageWidth(SepSpace, SepNone, Seq(Indent, SepNln), Unindent,
                          std::move(expr));
}

Step SepSpaceOrDoubleIndentAndNlnIfExpressionExceedsPageWidth(Step expr) {
  return ExceedsPageWidth(SepSpace, SepNone, Seq({Indent, Indent, SepNln}),
                          Seq(Unindent, Unindent), std::move(expr));
}

Step SepSpaceWhenOrIndentAndNlnIfExpressionExceedsPageWidth(
    std::function<bool(const Context &)> add_space, Step expr) {
  return ExceedsPageWidth(IfElseCtx(std::move(add_space), SepSpace, SepNone),
                          SepNone, Seq(Indent, SepNln), Unindent,
                          std::move(expr));
}

Step AutoNlnIfExpressionExceedsPageWidth(Step expr) {
  return ExceedsPageWidth(SepNone, SepNone, SepNln, SepNone, std::move(expr));
}

Step AutoNlnConsideringTriviaIfExpressionExceedsPageWidth(Step sep_nln,
                                                          Step expr) {
  return ExceedsPageWidth(SepNone, SepNone, std::move(sep_nln), SepNone,
                          std::move(expr));
}

Step AutoParenthesisIfExpressionExceedsPageWidth(Step expr) {
  Step parenthesized = Seq({SepOpenT, expr, SepCloseT});
  return ExpressionFitsOnRestOfLine(std::move(expr), std::move(parenthesized));
}

bool FutureNlnCheck(const Step &f, const Context &ctx) {
  if (ctx.IsMeasurement()) return false;
  const Context measured = f(ctx.WithDummy(/*keep_page_width=*/true));
  bool multiline = false;
  measured.Events().VisitNewestFirst([&multiline](const WriterEvent &event) {
    multiline = event.Is(WriterEventType::kBreakLine) ||
                event.Is(WriterEventType::kBreakLineDueToTrivia);
    return !multiline;
  });
  return multiline || measured.Column() > ctx.PageWidth();
}

bool ExceedsWidth(int max_width, const Step &f, const Context &ctx) {
  const Context dummy = ctx.WithDummy(/*keep_page_width=*/true);
  const LayoutPosition before = PositionOf(dummy);
  const LayoutPosition after = PositionOf(f(dummy));
  return after.lines > before.lines ||
         after.column - before.column > max_width ||
         before.column > ctx.PageWidth();
}

}  // namespace weft
