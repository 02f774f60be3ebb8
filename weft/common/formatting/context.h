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
#ifndef WEFT_COMMON_FORMATTING_CONTEXT_H_
#define WEFT_COMMON_FORMATTING_CONTEXT_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "weft/common/formatting/basic-format-style.h"
#include "weft/common/formatting/event-log.h"
#include "weft/common/formatting/trivia.h"
#include "weft/common/formatting/writer-event.h"
#include "weft/common/formatting/writer-model.h"
#include "weft/common/strings/line-column-map.h"

namespace weft {

// The original text of the document being formatted.
class SourceText {
 public:
  explicit SourceText(std::string text);

  SourceText(const SourceText &) = delete;
  SourceText &operator=(const SourceText &) = delete;

  absl::string_view Contents() const { return text_; }

  // Returns the text covered by 'range'.
  absl::string_view GetContentAt(const LineColumnRange &range) const;

 private:
  const std::string text_;
  const LineColumnMap line_column_map_;
};

// Context is the state of one document being laid out: the style, the
// accumulated text, the log of every event, and the trivia to splice in at
// node boundaries.
//
// Context is a value.  Every layout function takes a Context and returns a
// new one; nothing is modified in place.  Copies are cheap: the text, the
// log, the style and the trivia tables are shared, not duplicated.  This is
// what makes speculative rendering (see short-expression.h) a matter of
// keeping or dropping a Context.
class Context {
 public:
  // An empty document with the default style and no trivia.
  Context();

  // Starts a document.  Trivia instructions are split into the before and
  // after tables by TriviaInstruction::add_before.  With style.strict_mode,
  // both 'source' and 'trivia' are ignored.
  static Context Create(const BasicFormatStyle &style,
                        std::shared_ptr<const SourceText> source,
                        const std::vector<TriviaInstruction> &trivia);

  const BasicFormatStyle &Style() const { return *style_; }
  const WriterModel &Model() const { return model_; }
  const EventLog &Events() const { return events_; }
  const TriviaTable &TriviaBefore() const { return *trivia_before_; }
  const TriviaTable &TriviaAfter() const { return *trivia_after_; }

  // Page width in effect for this context.  Unlimited during most
  // measurements.
  int PageWidth() const { return style_->max_line_length; }

  int Column() const { return model_.column; }

  // Returns the context after 'event': the event is normalized, logged as
  // one chunk, and folded into the model.
  Context Emit(const WriterEvent &event) const;

  // Returns an independent context in WriterMode::kMeasurement that starts
  // at the current column with an empty log.  Its page width is unlimited
  // unless 'keep_page_width'.  Nothing done to it affects this context.
  Context WithDummy(bool keep_page_width = false) const;

  // Returns this context with a trial budget of 'max_width' columns from
  // 'start_column' (default: the current column) pushed onto the mode
  // stack.  An identical budget already on the stack is not pushed again.
  Context WithShortExpression(int max_width,
                              std::optional<int> start_column = {}) const;

  // Returns this context with the mode and trial budgets of 'original'.
  // Used to commit a successful trial.
  Context WithModeOf(const Context &original) const;

  // Returns true if an enclosing trial has already failed at this point.
  bool TrialFailed() const { return model_.TrialFailed(PageWidth()); }

  // Returns true if any trial budget already confirmed an overflow.
  bool HasConfirmedOverflow() const { return model_.HasConfirmedOverflow(); }

  bool IsMeasurement() const { return model_.IsMeasurement(); }

  // Returns true if a trailing comment waits for the next line break.
  bool HasPendingSuffix() const { return !model_.pending_suffix.empty(); }

  // Returns the context with a pending suffix written out.
  Context FinalizeModel() const;

  bool HasContentBefore(NodeType node_type,
                        const LineColumnRange &range) const;
  bool HasContentAfter(NodeType node_type, const LineColumnRange &range) const;

  // Returns the original text of 'range', if the source is available.
  std::optional<std::string> FromSourceText(const LineColumnRange &range) const;

 private:
  std::shared_ptr<const BasicFormatStyle> style_;
  WriterModel model_;
  EventLog events_;
  std::shared_ptr<const TriviaTable> trivia_before_;
  std::shared_ptr<const TriviaTable> trivia_after_;
  std::shared_ptr<const SourceText> source_;  // may be null
};

// A layout step.  Steps must be pure: the trial engine and the list joiner
// may run a step more than once and keep only one of the results.
using Step = std::function<Context(const Context &)>;

// Returns the final text: pending suffix flushed, trailing whitespace of the
// last line removed, lines joined by the style's end of line.  Unless
// 'is_selection', leading empty lines are dropped.
// It is a fatal error to dump a context that is still inside a trial.
std::string Dump(const Context &ctx, bool is_selection = false);

// Event-log queries, looking back from the newest event.

// Returns the non-empty texts written since the last line break, newest
// first.
std::vector<std::string> WriteEventsOnLastLine(const Context &ctx);

// Returns the newest non-empty text written since the last line break.
std::optional<std::string> LastWriteEventOnLastLine(const Context &ctx);

// Returns true if the newest event, ignoring indentation restores and empty
// writes, is kBreakLine or kBreakLineDueToTrivia.
bool LastWriteEventIsNewline(const Context &ctx);

// Returns true if the log ends with a full blank line: at least two
// kBreakLine after the last non-empty write (indentation events and empty
// writes in between are ignored).
bool NewlineBetweenLastWriteEvent(const Context &ctx);

// Returns true if every character written since the last line break
// satisfies 'pred'.
bool ForallCharsOnLastLine(const std::function<bool(char)> &pred,
                           const Context &ctx);

// Returns a step that runs 'body' with the alignment floor (and with
// 'also_set_indent', the indentation) set to 'level', and restores both
// afterwards.  It is a fatal error to request a negative 'level'.
Step AtIndentLevel(bool also_set_indent, int level, Step body);

// AtIndentLevel(false) at the current column: lines broken inside 'body'
// start no further left than here.
Step AtCurrentColumn(Step body);

// Like AtCurrentColumn(), with the column taken before 'prepend' runs.
Step AtCurrentColumnWithPrepend(Step prepend, Step body);

// AtIndentLevel(true) at the current column: indentation inside 'body' is
// relative to here.
Step AtCurrentColumnIndent(Step body);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_CONTEXT_H_
