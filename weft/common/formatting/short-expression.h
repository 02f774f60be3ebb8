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

#ifndef WEFT_COMMON_FORMATTING_SHORT_EXPRESSION_H_
#define WEFT_COMMON_FORMATTING_SHORT_EXPRESSION_H_

#include <functional>
#include <iosfwd>
#include <optional>
#include <utility>

#include "weft/common/formatting/combinators.h"
#include "weft/common/formatting/context.h"

namespace weft {

// Speculative rendering.
//
// Renders 'short_expression' as a trial bounded by 'max_width' columns from
// 'start_column' (default: the current column) and by the page width.  If the
// trial breaks a line or runs over a bound, the trial is dropped and
// 'fallback' is rendered from 'ctx' instead.  Otherwise the trial's output is
// kept and 'ctx's mode is restored.
//
// When 'ctx' is itself inside a trial that can no longer succeed, returns
// 'ctx' unchanged: the enclosing trial will fall back anyway.
//
// Both steps may run more than once and must not have side effects.
Context ShortExpressionWithFallback(const Step &short_expression,
                                    const Step &fallback, int max_width,
                                    std::optional<int> start_column,
                                    const Context &ctx);

Step IsShortExpression(int max_width, Step short_expression, Step fallback);

// Renders 'body' as is if it fits in 'max_width', otherwise on an indented
// new line.
Step IsShortExpressionOrAddIndentAndNewline(int max_width, Step body);

// Like IsShortExpressionOrAddIndentAndNewline, with a space before the
// short form.
Step SepSpaceIfShortExpressionOrAddIndentAndNewline(int max_width, Step body);

// Renders 'expression' if it fits on the rest of the current line.
Step ExpressionFitsOnRestOfLine(Step expression, Step fallback);

// Threshold for IsSmallExpression().
struct Size {
  enum class Kind { kCharacterWidth, kNumberOfItems };

  Kind kind = Kind::kCharacterWidth;
  int max_width = 0;  // kCharacterWidth
  int items = 0;      // kNumberOfItems
  int max_items = 0;  // kNumberOfItems

  static Size CharacterWidth(int max_width) {
    return {Kind::kCharacterWidth, max_width, 0, 0};
  }
  static Size NumberOfItems(int items, int max_items) {
    return {Kind::kNumberOfItems, 0, items, max_items};
  }

  bool operator==(const Size &r) const {
    return kind == r.kind && max_width == r.max_width && items == r.items &&
           max_items == r.max_items;
  }
  bool operator!=(const Size &r) const { return !((*this) == r); }
};

std::ostream &operator<<(std::ostream &, const Size &);

// Returns the size threshold for a list or array of 'num_items' elements,
// according to BasicFormatStyle::array_or_list_multiline_formatter.
Size GetListOrArrayExprSize(const Context &ctx, int max_width, int num_items);

// Returns the size threshold for a record of 'num_fields' fields, according
// to BasicFormatStyle::record_multiline_formatter.
Size GetRecordSize(const Context &ctx, int num_fields);

// With Size::kCharacterWidth, this is IsShortExpression().  With
// Size::kNumberOfItems, too many items go straight to 'fallback' and the
// others must fit on the rest of the line.
Step IsSmallExpression(Size size, Step small_expression, Step fallback);

// Leading expression probes.  These render 'leading' once and hand a fact
// about its rendering to a continuation, which produces the step that
// follows.

struct LayoutPosition {
  int lines = 0;
  int column = 0;

  bool operator==(const LayoutPosition &r) const {
    return lines == r.lines && column == r.column;
  }
};

std::ostream &operator<<(std::ostream &, const LayoutPosition &);

Step LeadingExpressionResult(
    Step leading,
    std::function<Step(const LayoutPosition &before,
                       const LayoutPosition &after)>
        continuation);

// Passes true if 'leading' added lines or advanced more than 'threshold'
// columns.
Step LeadingExpressionLong(int threshold, Step leading,
                           std::function<Step(bool)> continuation);

// Passes true if 'leading' broke a line.  Leading comments, directives,
// blank lines and empty directive blocks do not count.
Step LeadingExpressionIsMultiline(Step leading,
                                  std::function<Step(bool)> continuation);

// Tries 'before_short', 'expr', 'after_short' against the page width, and
// falls back to 'before_long', 'expr', 'after_long'.  Inside a trial that is
// still alive, the short form is rendered directly: the enclosing trial
// decides.
Context ExpressionExceedsPageWidth(const Step &before_short,
                                   const Step &after_short,
                                   const Step &before_long,
                                   const Step &after_long, const Step &expr,
                                   const Context &ctx);

// 'expr', or 'expr' on an indented new line.
Step AutoIndentAndNlnIfExpressionExceedsPageWidth(Step expr);

// " expr", or 'expr' on an indented new line.
Step SepSpaceOrIndentAndNlnIfExpressionExceedsPageWidth(Step expr);

// " expr", or 'expr' on a new line indented twice.
Step SepSpaceOrDoubleIndentAndNlnIfExpressionExceedsPageWidth(Step expr);

// Like SepSpaceOrIndentAndNlnIfExpressionExceedsPageWidth, but the space is
// only written when 'add_space' holds.
Step SepSpaceWhenOrIndentAndNlnIfExpressionExceedsPageWidth(
    std::function<bool(const Context &)> add_space, Step expr);

// 'expr', or 'expr' on a new line.
Step AutoNlnIfExpressionExceedsPageWidth(Step expr);

// 'expr', or 'expr' after 'sep_nln', which usually skips the line break
// when trivia before the expression provides one.
Step AutoNlnConsideringTriviaIfExpressionExceedsPageWidth(Step sep_nln,
                                                          Step expr);

// 'expr', or "(expr)" when it does not fit on the rest of the line.
Step AutoParenthesisIfExpressionExceedsPageWidth(Step expr);

// Measures 'f' without rendering it.  Returns true if 'f' would break a
// line or end beyond the page width.  Always false inside a measurement.
bool FutureNlnCheck(const Step &f, const Context &ctx);

// Measures 'f' without rendering it.  Returns true if 'f' would add lines or
// advance more than 'max_width' columns, or if the current column is already
// beyond the page width.
bool ExceedsWidth(int max_width, const Step &f, const Context &ctx);

// Coli() where every item but the first moves to a new line when it does not
// fit on the current one.
template <class Container, class Render>
Step ColAutoNlnSkip0i(Step separator, Container items, Render render) {
  return Coli(std::move(separator), std::move(items),
              [render = std::move(render)](int index, const auto &item) {
                Step step = render(index, item);
                if (index == 0) return step;
                return AutoNlnIfExpressionExceedsPageWidth(std::move(step));
              });
}

template <class Container, class Render>
Step ColAutoNlnSkip0(Step separator, Container items, Render render) {
  return ColAutoNlnSkip0i(
      std::move(separator), std::move(items),
      [render = std::move(render)](int, const auto &item) -> Step {
        return render(item);
      });
}

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_SHORT_EXPRESSION_H_
