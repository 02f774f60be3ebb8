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

#include "weft/common/formatting/combinators.h"

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "weft/common/formatting/context.h"
#include "weft/common/formatting/writer-event.h"

namespace weft {

Step Seq(Step first, Step second) {
  return [first = std::move(first),
          second = std::move(second)](const Context &ctx) {
    Context result = first(ctx);
    if (result.HasConfirmedOverflow()) return result;
    return second(result);
  };
}

Step Seq(std::initializer_list<Step> steps) {
  return [steps = std::vector<Step>(steps)](const Context &ctx) {
    Context result = ctx;
    for (const auto &step : steps) {
      if (result.HasConfirmedOverflow()) break;
      result = step(result);
    }
    return result;
  };
}

Step Text(absl::string_view s) {
  return [text = std::string(s)](const Context &ctx) {
    return ctx.Emit(WriterEvent::WriteText(text));
  };
}

Step TextOnNewLineIfNeeded(absl::string_view s) {
  return [text = std::string(s)](const Context &ctx) {
    const bool blank_line = ForallCharsOnLastLine(
        [](char c) { return absl::ascii_isspace(static_cast<unsigned char>(c)); },
        ctx);
    const Context next = blank_line ? ctx : SepNln(ctx);
    return next.Emit(WriterEvent::WriteText(text));
  };
}

static Context Write(const Context &ctx, absl::string_view s) {
  return ctx.Emit(WriterEvent::WriteText(s));
}

Context SepNone(const Context &ctx) { return ctx; }
Context SepDot(const Context &ctx) { return Write(ctx, "."); }

Context SepSpace(const Context &ctx) {
  if (ctx.IsMeasurement()) return Write(ctx, " ");
  const std::optional<std::string> last = LastWriteEventOnLastLine(ctx);
  if (!last.has_value()) return ctx;
  if (absl::EndsWith(*last, " ") || absl::EndsWith(*last, "\n")) return ctx;
  return Write(ctx, " ");
}

Step AddFixedSpaces(int target_column) {
  return [target_column](const Context &ctx) {
    const int delta = target_column - ctx.Column();
    if (delta <= 0) return ctx;
    return Write(ctx, std::string(delta, ' '));
  };
}

Context SepNln(const Context &ctx) {
  return ctx.Emit(WriterEvent::BreakLine());
}

Context SepNlnForTrivia(const Context &ctx) {
  return ctx.Emit(WriterEvent::BreakLineDueToTrivia());
}

Context SepNlnUnlessLastEventIsNewline(const Context &ctx) {
  if (LastWriteEventIsNewline(ctx)) return ctx;
  return SepNln(ctx);
}

Context SepNlnUnlessLastEventIsNewlineOrStroustrup(const Context &ctx) {
  if (LastWriteEventIsNewline(ctx) ||
      ctx.Style().experimental_stroustrup_style) {
    return ctx;
  }
  return SepNln(ctx);
}

Context SepStar(const Context &ctx) { return Seq(SepSpace, Text("* "))(ctx); }
Context SepStarFixed(const Context &ctx) { return Write(ctx, "* "); }
Context SepEq(const Context &ctx) { return Write(ctx, " ="); }
Context SepEqFixed(const Context &ctx) { return Write(ctx, "="); }
Context SepArrow(const Context &ctx) { return Write(ctx, " -> "); }
Context SepArrowFixed(const Context &ctx) { return Write(ctx, "->"); }
Context SepArrowRev(const Context &ctx) { return Write(ctx, " <- "); }
Context SepWild(const Context &ctx) { return Write(ctx, "_"); }
Context SepBar(const Context &ctx) { return Write(ctx, "| "); }

// Writes 'spaced' or 'tight' according to the delimiter spacing option.
static Context Delimiter(const Context &ctx, absl::string_view spaced,
                         absl::string_view tight) {
  return Write(ctx, ctx.Style().space_around_delimiter ? spaced : tight);
}

Context SepOpenL(const Context &ctx) { return Delimiter(ctx, "[ ", "["); }
Context SepCloseL(const Context &ctx) { return Delimiter(ctx, " ]", "]"); }
Context SepOpenLFixed(const Context &ctx) { return Write(ctx, "["); }
Context SepCloseLFixed(const Context &ctx) { return Write(ctx, "]"); }
Context SepOpenA(const Context &ctx) { return Delimiter(ctx, "[| ", "[|"); }
Context SepCloseA(const Context &ctx) { return Delimiter(ctx, " |]", "|]"); }
Context SepOpenAFixed(const Context &ctx) { return Write(ctx, "[|"); }
Context SepCloseAFixed(const Context &ctx) { return Write(ctx, "|]"); }
Context SepOpenS(const Context &ctx) { return Delimiter(ctx, "{ ", "{"); }
Context SepCloseS(const Context &ctx) { return Delimiter(ctx, " }", "}"); }
Context SepOpenSFixed(const Context &ctx) { return Write(ctx, "{"); }
Context SepCloseSFixed(const Context &ctx) { return Write(ctx, "}"); }
Context SepOpenAnonRecd(const Context &ctx) {
  return Delimiter(ctx, "{| ", "{|");
}
Context SepCloseAnonRecd(const Context &ctx) {
  return Delimiter(ctx, " |}", "|}");
}
Context SepOpenAnonRecdFixed(const Context &ctx) { return Write(ctx, "{|"); }
Context SepCloseAnonRecdFixed(const Context &ctx) { return Write(ctx, "|}"); }
Context SepOpenT(const Context &ctx) { return Write(ctx, "("); }
Context SepCloseT(const Context &ctx) { return Write(ctx, ")"); }

Context WordAnd(const Context &ctx) { return Seq(SepSpace, Text("and "))(ctx); }
Context WordAndFixed(const Context &ctx) { return Write(ctx, "and"); }
Context WordOr(const Context &ctx) { return Seq(SepSpace, Text("or "))(ctx); }
Context WordOf(const Context &ctx) { return Seq(SepSpace, Text("of "))(ctx); }

Context SepColon(const Context &ctx) {
  const absl::string_view preferred =
      ctx.Style().space_before_colon ? " : " : ": ";
  if (ctx.IsMeasurement()) return Write(ctx, preferred);
  const std::optional<std::string> last = LastWriteEventOnLastLine(ctx);
  if (!last.has_value() || absl::EndsWith(*last, " ")) return Write(ctx, ": ");
  return Write(ctx, preferred);
}

Context SepColonFixed(const Context &ctx) { return Write(ctx, ":"); }
Context SepColonWithSpacesFixed(const Context &ctx) {
  return Write(ctx, " : ");
}

Context SepComma(const Context &ctx) {
  return Write(ctx, ctx.Style().space_after_comma ? ", " : ",");
}

Context SepCommaFixed(const Context &ctx) { return Write(ctx, ","); }

Context SepSemi(const Context &ctx) {
  const BasicFormatStyle &style = ctx.Style();
  std::string semi = ";";
  if (style.space_before_semicolon) semi.insert(0, " ");
  if (style.space_after_semicolon) semi.append(" ");
  return Write(ctx, semi);
}

Context SepSpaceBeforeClassConstructor(const Context &ctx) {
  if (!ctx.Style().space_before_class_constructor) return ctx;
  return SepSpace(ctx);
}

Step SepNlnWhenWriteBeforeNewlineNotEmpty(Step fallback) {
  return [fallback = std::move(fallback)](const Context &ctx) {
    if (ctx.HasPendingSuffix()) return SepNln(ctx);
    return fallback(ctx);
  };
}

Context SepSpaceUnlessWriteBeforeNewlineNotEmpty(const Context &ctx) {
  if (ctx.HasPendingSuffix()) return ctx;
  return SepSpace(ctx);
}

Step AutoIndentAndNlnWhenWriteBeforeNewlineNotEmpty(Step body) {
  return [body = std::move(body)](const Context &ctx) {
    if (ctx.HasPendingSuffix()) return IndentSepNlnUnindent(body)(ctx);
    return body(ctx);
  };
}

Context Indent(const Context &ctx) {
  return ctx.Emit(WriterEvent::IndentBy(ctx.Style().indent_size));
}

Context Unindent(const Context &ctx) {
  return ctx.Emit(WriterEvent::UnindentBy(ctx.Style().indent_size));
}

Step IncrIndent(int amount) {
  return [amount](const Context &ctx) {
    return ctx.Emit(WriterEvent::IndentBy(amount));
  };
}

Step DecrIndent(int amount) {
  return [amount](const Context &ctx) {
    return ctx.Emit(WriterEvent::UnindentBy(amount));
  };
}

Step IndentSepNlnUnindent(Step body) {
  return Seq({Indent, SepNln, std::move(body), Unindent});
}

Step IndentIfNeeded(Step body) {
  return [body = std::move(body)](const Context &ctx) {
    const int align_column = ctx.Model().align_column;
    if (align_column < ctx.Column()) return body(ctx);
    // The next text must start strictly right of the aligned expression.
    const int missing = align_column - ctx.FinalizeModel().Column() +
                        ctx.Style().indent_size;
    return AtIndentLevel(true, align_column,
                         Text(std::string(std::max(missing, 0), ' ')))(ctx);
  };
}

Step IfElse(bool condition, Step then_step, Step else_step) {
  return condition ? then_step : else_step;
}

Step IfElseCtx(std::function<bool(const Context &)> condition, Step then_step,
               Step else_step) {
  return [condition = std::move(condition), then_step = std::move(then_step),
          else_step = std::move(else_step)](const Context &ctx) {
    return condition(ctx) ? then_step(ctx) : else_step(ctx);
  };
}

static bool IsStroustrup(const Context &ctx) {
  return ctx.Style().experimental_stroustrup_style;
}

Step IfStroustrupElse(Step then_step, Step else_step) {
  return IfElseCtx(IsStroustrup, std::move(then_step), std::move(else_step));
}

Step IfStroustrup(Step then_step) {
  return IfElseCtx(IsStroustrup, std::move(then_step), SepNone);
}

Step IfAlignBrackets(Step then_step, Step else_step) {
  return IfElseCtx(
      [](const Context &ctx) {
        return ctx.Style().multiline_block_brackets_on_same_column;
      },
      std::move(then_step), std::move(else_step));
}

Step OnlyIf(bool condition, Step body) {
  return condition ? body : Step(SepNone);
}

Step OnlyIfCtx(std::function<bool(const Context &)> condition, Step body) {
  return IfElseCtx(std::move(condition), std::move(body), SepNone);
}

Step OnlyIfNot(bool condition, Step body) {
  return OnlyIf(!condition, std::move(body));
}

Step WhenShortIndent(Step body) {
  return OnlyIfCtx(
      [](const Context &ctx) { return ctx.Style().indent_size < 3; },
      std::move(body));
}

Step Rep(int count, Step body) {
  return [count, body = std::move(body)](const Context &ctx) {
    Context result = ctx;
    for (int i = 0; i < count; ++i) result = body(result);
    return result;
  };
}

}  // namespace weft
