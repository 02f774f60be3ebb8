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

#include "weft/common/formatting/trivia-printer.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "weft/common/formatting/combinators.h"
#include "weft/common/formatting/context.h"
#include "weft/common/formatting/short-expression.h"
#include "weft/common/formatting/trivia.h"
#include "weft/common/formatting/writer-event.h"
#include "weft/common/strings/line-column-map.h"

namespace weft {

Step PrintTriviaContent(const TriviaContent &content) {
  return [content](const Context &ctx) {
    const std::string &current_line = ctx.Model().lines.CurrentLine();
    const bool has_content =
        !absl::StripAsciiWhitespace(current_line).empty();
    const bool needs_space =
        !current_line.empty() &&
        !absl::ascii_isspace(static_cast<unsigned char>(current_line.back()));

    switch (content.kind) {
      case TriviaKind::kLineCommentAfterSourceCode:
        return ctx.Emit(WriterEvent::DeferTextUntilBreak(
            needs_space ? " " + content.text : content.text));
      case TriviaKind::kBlockComment:
        return Seq({OnlyIf(content.newline_before && has_content,
                           SepNlnForTrivia),
                    SepSpace, Text(content.text), SepSpace,
                    OnlyIf(content.newline_after, SepNlnForTrivia)})(ctx);
      case TriviaKind::kNewline:
        if (has_content) return Seq(SepNlnForTrivia, SepNlnForTrivia)(ctx);
        return SepNlnForTrivia(ctx);
      case TriviaKind::kDirective:
      case TriviaKind::kCommentOnSingleLine:
        return Seq({OnlyIf(has_content, SepNlnForTrivia), Text(content.text),
                    SepNlnForTrivia})(ctx);
    }
    return ctx;
  };
}

Step PrintTriviaInstructions(
    const std::vector<const TriviaInstruction *> &instructions) {
  std::vector<TriviaContent> contents;
  contents.reserve(instructions.size());
  for (const auto *instruction : instructions) {
    contents.push_back(instruction->content);
  }
  return Col(SepNone, std::move(contents), PrintTriviaContent);
}

Step EnterNodeFor(NodeType node_type, const LineColumnRange &range) {
  return [node_type, range](const Context &ctx) {
    const auto found = FindTrivia(ctx.TriviaBefore(), node_type, range);
    if (found.empty()) return ctx;
    return PrintTriviaInstructions(found)(ctx);
  };
}

Step LeaveNodeFor(NodeType node_type, const LineColumnRange &range) {
  return [node_type, range](const Context &ctx) {
    const auto found = FindTrivia(ctx.TriviaAfter(), node_type, range);
    if (found.empty()) return ctx;
    return PrintTriviaInstructions(found)(ctx);
  };
}

Step SepConsideringTriviaContentBeforeForMainNode(
    Step separator, NodeType node_type, const LineColumnRange &range) {
  return [separator = std::move(separator), node_type,
          range](const Context &ctx) {
    if (ctx.HasContentBefore(node_type, range)) return ctx;
    return separator(ctx);
  };
}

Step SepNlnConsideringTriviaContentBeforeFor(NodeType node_type,
                                             const LineColumnRange &range) {
  return SepConsideringTriviaContentBeforeForMainNode(SepNln, node_type,
                                                      range);
}

Step SepNlnTypeAndMembers(
    NodeType keyword_node_type,
    const std::optional<LineColumnRange> &keyword_range,
    const LineColumnRange &first_member_range, NodeType member_node_type) {
  return [=](const Context &ctx) {
    if (keyword_range.has_value()) {
      const auto found =
          FindTrivia(ctx.TriviaBefore(), keyword_node_type, *keyword_range);
      if (!found.empty()) return PrintTriviaInstructions(found)(ctx);
    }
    if (!ctx.Style().newline_between_type_definition_and_members) return ctx;
    return SepNlnConsideringTriviaContentBeforeFor(member_node_type,
                                                   first_member_range)(ctx);
  };
}

Step AddExtraNewlineIfLeadingWasMultiline(Step leading, Step sep_nln,
                                          Step continuation) {
  return LeadingExpressionIsMultiline(
      std::move(leading),
      [sep_nln = std::move(sep_nln),
       continuation = std::move(continuation)](bool multiline) {
        return Seq({SepNln, OnlyIf(multiline, sep_nln), continuation});
      });
}

}  // namespace weft
