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
#include "weft/common/formatting/context.h"

#include <algorithm>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "weft/common/formatting/basic-format-style.h"
#include "weft/common/formatting/event-log.h"
#include "weft/common/formatting/trivia.h"
#include "weft/common/formatting/writer-event.h"
#include "weft/common/formatting/writer-model.h"
#include "weft/common/strings/line-column-map.h"
#include "weft/common/util/logging.h"

namespace weft {

SourceText::SourceText(std::string text)
    : text_(std::move(text)), line_column_map_(text_) {}

absl::string_view SourceText::GetContentAt(const LineColumnRange &range) const {
  return line_column_map_.Slice(text_, range);
}

static std::shared_ptr<const TriviaTable> EmptyTriviaTable() {
  static const auto *const kEmpty =
      new std::shared_ptr<const TriviaTable>(std::make_shared<TriviaTable>());
  return *kEmpty;
}

Context::Context()
    : style_(std::make_shared<const BasicFormatStyle>()),
      trivia_before_(EmptyTriviaTable()),
      trivia_after_(EmptyTriviaTable()) {}

Context Context::Create(const BasicFormatStyle &style,
                        std::shared_ptr<const SourceText> source,
                        const std::vector<TriviaInstruction> &trivia) {
  Context ctx;
  ctx.style_ = std::make_shared<const BasicFormatStyle>(style);
  if (style.strict_mode) return ctx;

  auto before = std::make_shared<TriviaTable>();
  auto after = std::make_shared<TriviaTable>();
  for (const auto &instruction : trivia) {
    TriviaTable &table = instruction.add_before ? *before : *after;
    table[instruction.node_type].push_back(instruction);
  }
  VLOG(2) << "trivia tables: " << before->size() << " node types before, "
          << after->size() << " after";
  ctx.trivia_before_ = std::move(before);
  ctx.trivia_after_ = std::move(after);
  ctx.source_ = std::move(source);
  return ctx;
}

Context Context::Emit(const WriterEvent &event) const {
  std::vector<WriterEvent> normalized = NormalizeWriterEvent(event);
  Context next(*this);
  for (const auto &e : normalized) {
    next.model_ = next.model_.Apply(e, PageWidth());
  }
  next.events_ = events_.Append(std::move(normalized));
  return next;
}

Context Context::WithDummy(bool keep_page_width) const {
  Context dummy(*this);
  if (!keep_page_width) {
    // Unlimited width reveals the worst case.
    auto style = std::make_shared<BasicFormatStyle>(*style_);
    style->max_line_length = std::numeric_limits<int>::max();
    dummy.style_ = std::move(style);
  }
  dummy.model_.mode = WriterMode::kMeasurement;
  dummy.model_.trial_budgets.clear();
  dummy.model_.lines = LineBuffer(std::string(model_.column, ' '));
  dummy.model_.pending_suffix.clear();
  dummy.events_ = EventLog();
  return dummy;
}

Context Context::WithShortExpression(int max_width,
                                     std::optional<int> start_column) const {
  const TrialBudget budget{max_width, start_column.value_or(model_.column),
                           false};
  Context next(*this);
  if (model_.mode == WriterMode::kTrial) {
    const auto &budgets = model_.trial_budgets;
    if (std::find(budgets.begin(), budgets.end(), budget) != budgets.end()) {
      return next;
    }
    next.model_.trial_budgets.push_back(budget);
  } else {
    next.model_.mode = WriterMode::kTrial;
    next.model_.trial_budgets = {budget};
  }
  return next;
}

Context Context::WithModeOf(const Context &original) const {
  Context next(*this);
  next.model_.mode = original.model_.mode;
  next.model_.trial_budgets = original.model_.trial_budgets;
  return next;
}

Context Context::FinalizeModel() const {
  if (!HasPendingSuffix()) return *this;
  return Emit(WriterEvent::WriteText(model_.pending_suffix));
}

bool Context::HasContentBefore(NodeType node_type,
                               const LineColumnRange &range) const {
  return HasTrivia(*trivia_before_, node_type, range);
}

bool Context::HasContentAfter(NodeType node_type,
                              const LineColumnRange &range) const {
  return HasTrivia(*trivia_after_, node_type, range);
}

std::optional<std::string> Context::FromSourceText(
    const LineColumnRange &range) const {
  if (source_ == nullptr) return std::nullopt;
  return std::string(source_->GetContentAt(range));
}

std::string Dump(const Context &ctx, bool is_selection) {
  const Context final_ctx = ctx.FinalizeModel();
  CHECK(!final_ctx.Model().InTrial())
      << "Unfinished trial at the end of the document: " << final_ctx.Model();
  std::vector<std::string> lines = final_ctx.Model().lines.Lines();
  // Always trim the last line.
  absl::StripTrailingAsciiWhitespace(&lines.back());
  auto first = lines.begin();
  if (!is_selection) {
    first = std::find_if(lines.begin(), lines.end(),
                         [](const std::string &line) { return !line.empty(); });
  }
  return absl::StrJoin(first, lines.end(),
                       NewlineString(ctx.Style().end_of_line));
}

static bool EndsLine(const WriterEvent &event) {
  return event.Is(WriterEventType::kBreakLine) ||
         event.Is(WriterEventType::kBreakLineDueToTrivia) ||
         event.Is(WriterEventType::kBreakLineInStringLiteral);
}

std::vector<std::string> WriteEventsOnLastLine(const Context &ctx) {
  std::vector<std::string> writes;
  ctx.Events().VisitNewestFirst([&writes](const WriterEvent &event) {
    if (EndsLine(event)) return false;
    if (event.Is(WriterEventType::kWriteText) && !event.text.empty()) {
      writes.push_back(event.text);
    }
    return true;
  });
  return writes;
}

std::optional<std::string> LastWriteEventOnLastLine(const Context &ctx) {
  std::optional<std::string> last;
  ctx.Events().VisitNewestFirst([&last](const WriterEvent &event) {
    if (EndsLine(event)) return false;
    if (event.Is(WriterEventType::kWriteText) && !event.text.empty()) {
      last = event.text;
      return false;
    }
    return true;
  });
  return last;
}

bool LastWriteEventIsNewline(const Context &ctx) {
  bool result = false;
  ctx.Events().VisitNewestFirst([&result](const WriterEvent &event) {
    switch (event.type) {
      case WriterEventType::kRestoreIndent:
      case WriterEventType::kRestoreAlignColumn:
      case WriterEventType::kUnindentBy:
        return true;
      case WriterEventType::kWriteText:
        if (event.text.empty()) return true;
        break;
      case WriterEventType::kBreakLine:
      case WriterEventType::kBreakLineDueToTrivia:
        result = true;
        break;
      default:
        break;
    }
    return false;
  });
  return result;
}

bool NewlineBetweenLastWriteEvent(const Context &ctx) {
  int line_breaks = 0;
  ctx.Events().VisitNewestFirst([&line_breaks](const WriterEvent &event) {
    switch (event.type) {
      case WriterEventType::kBreakLine:
        ++line_breaks;
        return true;
      case WriterEventType::kWriteText:
        return event.text.empty();
      case WriterEventType::kIndentBy:
      case WriterEventType::kUnindentBy:
      case WriterEventType::kSetIndent:
      case WriterEventType::kRestoreIndent:
      case WriterEventType::kSetAlignColumn:
      case WriterEventType::kRestoreAlignColumn:
        return true;
      default:
        return false;
    }
  });
  return line_breaks > 1;
}

bool ForallCharsOnLastLine(const std::function<bool(char)> &pred,
                           const Context &ctx) {
  for (const auto &text : WriteEventsOnLastLine(ctx)) {
    if (!std::all_of(text.begin(), text.end(), pred)) return false;
  }
  return true;
}

Step AtIndentLevel(bool also_set_indent, int level, Step body) {
  CHECK_GE(level, 0) << "The indent level cannot be negative.";
  return [also_set_indent, level, body](const Context &ctx) {
    const int saved_indent = ctx.Model().indent;
    const int saved_align_column = ctx.Model().align_column;
    Context next = ctx.Emit(WriterEvent::SetAlignColumn(level));
    if (also_set_indent) next = next.Emit(WriterEvent::SetIndent(level));
    next = body(next);
    return next.Emit(WriterEvent::RestoreAlignColumn(saved_align_column))
        .Emit(WriterEvent::RestoreIndent(saved_indent));
  };
}

Step AtCurrentColumn(Step body) {
  return [body](const Context &ctx) {
    return AtIndentLevel(false, ctx.Column(), body)(ctx);
  };
}

Step AtCurrentColumnWithPrepend(Step prepend, Step body) {
  return [prepend, body](const Context &ctx) {
    const int column = ctx.Column();
    return AtIndentLevel(false, column, body)(prepend(ctx));
  };
}

Step AtCurrentColumnIndent(Step body) {
  return [body](const Context &ctx) {
    return AtIndentLevel(true, ctx.Column(), body)(ctx);
  };
}

}  // namespace weft
