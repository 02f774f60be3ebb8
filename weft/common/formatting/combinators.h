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

#ifndef WEFT_COMMON_FORMATTING_COMBINATORS_H_
#define WEFT_COMMON_FORMATTING_COMBINATORS_H_

#include <functional>
#include <initializer_list>
#include <optional>
#include <utility>

#include "absl/strings/string_view.h"
#include "weft/common/formatting/context.h"

// Formatting steps and the ways to put them together.
//
// A Step maps a Context to its successor.  Nullary steps are plain functions
// (SepSpace, SepNln, ...) that convert to Step where one is expected;
// parameterized steps are returned by factories (Text, Seq, Col, ...).
// Steps never modify their argument.

namespace weft {

// Runs 'first', then 'second' unless the result of 'first' belongs to a trial
// that already confirmed an overflow.  The output of such a trial is thrown
// away, so there is no point in producing more of it.
Step Seq(Step first, Step second);

// Seq() over any number of steps, left to right.
Step Seq(std::initializer_list<Step> steps);

// Writes 's' verbatim.  Newlines inside 's' are split into line breaks.
Step Text(absl::string_view s);

// Writes 's' on a fresh line, unless the current line is still blank.
Step TextOnNewLineIfNeeded(absl::string_view s);

// Separators and tokens.

Context SepNone(const Context &ctx);
Context SepDot(const Context &ctx);

// Writes a single space, unless the last text on the current line already
// ends with whitespace or nothing was written on the current line yet.
// Measurements always write the space.
Context SepSpace(const Context &ctx);

// Writes spaces up to 'target_column', if it is beyond the current column.
Step AddFixedSpaces(int target_column);

Context SepNln(const Context &ctx);

// Like SepNln, but marks the break as caused by trivia.  Such breaks do not
// make an item multiline for ColWithNlnWhenItemIsMultiline().
Context SepNlnForTrivia(const Context &ctx);

Context SepNlnUnlessLastEventIsNewline(const Context &ctx);
Context SepNlnUnlessLastEventIsNewlineOrStroustrup(const Context &ctx);

Context SepStar(const Context &ctx);
Context SepStarFixed(const Context &ctx);
Context SepEq(const Context &ctx);
Context SepEqFixed(const Context &ctx);
Context SepArrow(const Context &ctx);
Context SepArrowFixed(const Context &ctx);
Context SepArrowRev(const Context &ctx);
Context SepWild(const Context &ctx);
Context SepBar(const Context &ctx);

// Brackets.  The non-fixed variants pad the inside with a space when
// BasicFormatStyle::space_around_delimiter is set.
Context SepOpenL(const Context &ctx);
Context SepCloseL(const Context &ctx);
Context SepOpenLFixed(const Context &ctx);
Context SepCloseLFixed(const Context &ctx);
Context SepOpenA(const Context &ctx);
Context SepCloseA(const Context &ctx);
Context SepOpenAFixed(const Context &ctx);
Context SepCloseAFixed(const Context &ctx);
Context SepOpenS(const Context &ctx);
Context SepCloseS(const Context &ctx);
Context SepOpenSFixed(const Context &ctx);
Context SepCloseSFixed(const Context &ctx);
Context SepOpenAnonRecd(const Context &ctx);
Context SepCloseAnonRecd(const Context &ctx);
Context SepOpenAnonRecdFixed(const Context &ctx);
Context SepCloseAnonRecdFixed(const Context &ctx);
Context SepOpenT(const Context &ctx);
Context SepCloseT(const Context &ctx);

Context WordAnd(const Context &ctx);
Context WordAndFixed(const Context &ctx);
Context WordOr(const Context &ctx);
Context WordOf(const Context &ctx);

// Writes ": " or " : " according to BasicFormatStyle::space_before_colon.
// Never doubles a space that is already there.
Context SepColon(const Context &ctx);
Context SepColonFixed(const Context &ctx);
Context SepColonWithSpacesFixed(const Context &ctx);

Context SepComma(const Context &ctx);
Context SepCommaFixed(const Context &ctx);
Context SepSemi(const Context &ctx);

Context SepSpaceBeforeClassConstructor(const Context &ctx);

// The following react to a trailing comment waiting for the next line break
// (see WriterEventType::kDeferTextUntilBreak).  Code written after it on the
// same line would end up inside the comment.
Step SepNlnWhenWriteBeforeNewlineNotEmpty(Step fallback);
Context SepSpaceUnlessWriteBeforeNewlineNotEmpty(const Context &ctx);
Step AutoIndentAndNlnWhenWriteBeforeNewlineNotEmpty(Step body);

// Indentation.

// Indents or unindents by BasicFormatStyle::indent_size.
Context Indent(const Context &ctx);
Context Unindent(const Context &ctx);

Step IncrIndent(int amount);
Step DecrIndent(int amount);

// Indent, line break, 'body', unindent.
Step IndentSepNlnUnindent(Step body);

// When the alignment column is at or beyond the current column, pads the
// current line so that the next text starts one indentation level past the
// alignment column.  Otherwise runs 'body'.
Step IndentIfNeeded(Step body);

// Conditionals.

Step IfElse(bool condition, Step then_step, Step else_step);
Step IfElseCtx(std::function<bool(const Context &)> condition, Step then_step,
               Step else_step);
Step IfStroustrupElse(Step then_step, Step else_step);
Step IfStroustrup(Step then_step);
Step IfAlignBrackets(Step then_step, Step else_step);
Step OnlyIf(bool condition, Step body);
Step OnlyIfCtx(std::function<bool(const Context &)> condition, Step body);
Step OnlyIfNot(bool condition, Step body);

// Runs 'body' only for indentation sizes below 3.
Step WhenShortIndent(Step body);

Step Rep(int count, Step body);

// Collections.  'items' is copied into the returned step.  'render' maps an
// item (and for the *i variants, its index) to a Step.

// Renders every item, with 'separator' between consecutive items.
template <class Container, class Render>
Step Col(Step separator, Container items, Render render) {
  return [separator = std::move(separator), items = std::move(items),
          render = std::move(render)](const Context &ctx) {
    Context result = ctx;
    bool first = true;
    for (const auto &item : items) {
      if (!first) result = separator(result);
      first = false;
      result = render(item)(result);
    }
    return result;
  };
}

// Col() that passes the 0-based index of each item to 'render'.
template <class Container, class Render>
Step Coli(Step separator, Container items, Render render) {
  return [separator = std::move(separator), items = std::move(items),
          render = std::move(render)](const Context &ctx) {
    Context result = ctx;
    int index = 0;
    for (const auto &item : items) {
      if (index > 0) result = separator(result);
      result = render(index, item)(result);
      ++index;
    }
    return result;
  };
}

// Coli() whose separator also receives the index of the following item.
template <class Container, class Separator, class Render>
Step Colii(Separator separator, Container items, Render render) {
  return [separator = std::move(separator), items = std::move(items),
          render = std::move(render)](const Context &ctx) {
    Context result = ctx;
    int index = 0;
    for (const auto &item : items) {
      if (index > 0) result = separator(index)(result);
      result = render(index, item)(result);
      ++index;
    }
    return result;
  };
}

// Col() whose separator also receives the following item.
template <class Container, class Separator, class Render>
Step ColEx(Separator separator, Container items, Render render) {
  return [separator = std::move(separator), items = std::move(items),
          render = std::move(render)](const Context &ctx) {
    Context result = ctx;
    bool first = true;
    for (const auto &item : items) {
      if (!first) result = separator(item)(result);
      first = false;
      result = render(item)(result);
    }
    return result;
  };
}

// Col() followed by 'post', only if there are items.
template <class Container, class Render>
Step ColPost(Step post, Step separator, Container items, Render render) {
  if (items.empty()) return SepNone;
  return Seq(Col(std::move(separator), std::move(items), std::move(render)),
             std::move(post));
}

// Col() preceded by 'pre', only if there are items.
template <class Container, class Render>
Step ColPre(Step pre, Step separator, Container items, Render render) {
  if (items.empty()) return SepNone;
  return Seq(std::move(pre),
             Col(std::move(separator), std::move(items), std::move(render)));
}

template <class Container, class Separator, class Render>
Step ColPreEx(Step pre, Separator separator, Container items, Render render) {
  if (items.empty()) return SepNone;
  return Seq(std::move(pre), ColEx(std::move(separator), std::move(items),
                                   std::move(render)));
}

// Col() surrounded by 'start' and 'end', only if there is more than one
// item.
template <class Container, class Render>
Step ColSurr(Step start, Step end, Step separator, Container items,
             Render render) {
  if (items.empty()) return SepNone;
  const bool surround = items.size() > 1;
  Step body = Col(std::move(separator), std::move(items), std::move(render));
  if (!surround) return body;
  return Seq({std::move(start), std::move(body), std::move(end)});
}

// Optional values.

// Renders the value of 'value' followed by 'post', if there is one.
template <class T, class Render>
Step Opt(Step post, std::optional<T> value, Render render) {
  if (!value.has_value()) return SepNone;
  return Seq(render(*value), std::move(post));
}

template <class T, class Render>
Step OptSingle(std::optional<T> value, Render render) {
  if (!value.has_value()) return SepNone;
  return render(*value);
}

// Renders 'pre', the value of 'value' and 'post', if there is one.
template <class T, class Render>
Step OptPre(Step pre, Step post, std::optional<T> value, Render render) {
  if (!value.has_value()) return SepNone;
  return Seq({std::move(pre), render(*value), std::move(post)});
}

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_COMBINATORS_H_
