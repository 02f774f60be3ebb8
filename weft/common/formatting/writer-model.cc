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
#include "weft/common/formatting/writer-model.h"

#include <algorithm>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "weft/common/formatting/writer-event.h"
#include "weft/common/strings/utf8.h"
#include "weft/common/util/logging.h"

namespace weft {

LineBuffer::Node::Node(std::string t, std::shared_ptr<const Node> p)
    : text(std::move(t)), prev(std::move(p)), count(prev ? prev->count + 1 : 1) {}

LineBuffer::Node::~Node() {
  std::shared_ptr<const Node> next = std::move(prev);
  while (next != nullptr && next.use_count() == 1) {
    next = std::move(next->prev);
  }
}

LineBuffer::LineBuffer(std::string first_line)
    : last_(std::make_shared<const Node>(std::move(first_line), nullptr)) {}

LineBuffer LineBuffer::WithCurrentLine(std::string line) const {
  return LineBuffer(std::make_shared<const Node>(std::move(line), last_->prev));
}

LineBuffer LineBuffer::AddLine(std::string line) const {
  return LineBuffer(std::make_shared<const Node>(std::move(line), last_));
}

std::vector<std::string> LineBuffer::Lines() const {
  std::vector<std::string> lines;
  lines.reserve(size());
  for (const Node *node = last_.get(); node != nullptr;
       node = node->prev.get()) {
    lines.push_back(node->text);
  }
  std::reverse(lines.begin(), lines.end());
  return lines;
}

std::ostream &operator<<(std::ostream &stream, WriterMode mode) {
  switch (mode) {
    case WriterMode::kNormal:
      return stream << "normal";
    case WriterMode::kMeasurement:
      return stream << "measurement";
    case WriterMode::kTrial:
      return stream << "trial";
  }
  return stream << "???";
}

std::ostream &operator<<(std::ostream &stream, const TrialBudget &budget) {
  stream << "{max_width: " << budget.max_width
         << ", start_column: " << budget.start_column;
  if (budget.confirmed_overflow) stream << ", overflow";
  return stream << '}';
}

bool WriterModel::HasConfirmedOverflow() const {
  return std::any_of(trial_budgets.begin(), trial_budgets.end(),
                     [](const TrialBudget &b) { return b.confirmed_overflow; });
}

bool WriterModel::TrialFailed(int page_width) const {
  if (mode != WriterMode::kTrial) return false;
  return std::any_of(trial_budgets.begin(), trial_budgets.end(),
                     [this, page_width](const TrialBudget &b) {
                       return b.confirmed_overflow ||
                              b.IsTooLong(page_width, column);
                     });
}

// Starts a new line indented to max(indent, align_column).  The finished
// line receives the pending suffix and loses trailing whitespace.
static void BreakLine(WriterModel *model) {
  model->indent = std::max(model->indent, model->align_column);
  const std::string finished = absl::StrCat(model->lines.CurrentLine(),
                                            model->pending_suffix);
  model->lines =
      model->lines
          .WithCurrentLine(std::string(absl::StripTrailingAsciiWhitespace(finished)))
          .AddLine(std::string(model->indent, ' '));
  model->pending_suffix.clear();
  model->column = model->indent;
}

// Applies 'event' regardless of mode.
static void ApplyUnconditionally(const WriterEvent &event,
                                 WriterModel *model) {
  switch (event.type) {
    case WriterEventType::kBreakLine:
    case WriterEventType::kBreakLineDueToTrivia:
      BreakLine(model);
      break;
    case WriterEventType::kBreakLineInStringLiteral:
      model->lines = model->lines.AddLine("");
      model->column = 0;
      break;
    case WriterEventType::kBreakLineInTrivia: {
      const absl::string_view current = model->lines.CurrentLine();
      model->lines =
          model->lines
              .WithCurrentLine(
                  std::string(absl::StripTrailingAsciiWhitespace(current)))
              .AddLine("");
      model->column = 0;
      break;
    }
    case WriterEventType::kWriteText:
      model->lines = model->lines.WithCurrentLine(
          absl::StrCat(model->lines.CurrentLine(), event.text));
      model->column += utf8_len(event.text);
      break;
    case WriterEventType::kDeferTextUntilBreak:
      model->pending_suffix = event.text;
      break;
    case WriterEventType::kIndentBy:
      // An alignment floor deeper than the requested indentation wins.
      model->indent = model->align_column >= model->indent + event.amount
                          ? model->align_column + event.amount
                          : model->indent + event.amount;
      break;
    case WriterEventType::kUnindentBy:
      model->indent =
          std::max(model->align_column, model->indent - event.amount);
      break;
    case WriterEventType::kSetIndent:
    case WriterEventType::kRestoreIndent:
      model->indent = event.amount;
      break;
    case WriterEventType::kSetAlignColumn:
    case WriterEventType::kRestoreAlignColumn:
      model->align_column = event.amount;
      break;
  }
}

// Returns true if 'event' would start a new line of user content.
static bool CausesMultiline(const WriterEvent &event,
                            const WriterModel &model) {
  switch (event.type) {
    case WriterEventType::kBreakLine:
    case WriterEventType::kBreakLineDueToTrivia:
    case WriterEventType::kBreakLineInStringLiteral:
    case WriterEventType::kBreakLineInTrivia:
      return true;
    case WriterEventType::kWriteText:
      // The pending suffix is only flushed by a line break.
      return !model.pending_suffix.empty();
    default:
      return false;
  }
}

WriterModel WriterModel::Apply(const WriterEvent &event,
                               int page_width) const {
  WriterModel next(*this);
  switch (mode) {
    case WriterMode::kNormal:
    case WriterMode::kMeasurement:
      ApplyUnconditionally(event, &next);
      break;
    case WriterMode::kTrial: {
      // A doomed trial records nothing more.
      if (HasConfirmedOverflow()) break;
      const bool multiline = CausesMultiline(event, *this);
      bool overflow = false;
      for (auto &budget : next.trial_budgets) {
        budget.confirmed_overflow =
            multiline || budget.IsTooLong(page_width, column);
        overflow |= budget.confirmed_overflow;
      }
      if (overflow) {
        VLOG(5) << "trial overflow at column " << column << " on " << event;
        break;
      }
      ApplyUnconditionally(event, &next);
      break;
    }
  }
  return next;
}

std::ostream &operator<<(std::ostream &stream, const WriterModel &model) {
  stream << "mode: " << model.mode;
  for (const auto &budget : model.trial_budgets) stream << ' ' << budget;
  stream << ", indent: " << model.indent
         << ", align_column: " << model.align_column
         << ", column: " << model.column << ", lines: " << model.lines.size();
  if (!model.pending_suffix.empty()) {
    stream << ", pending: \"" << model.pending_suffix << '"';
  }
  return stream;
}

}  // namespace weft
