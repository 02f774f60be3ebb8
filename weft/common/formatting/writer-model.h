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
#ifndef WEFT_COMMON_FORMATTING_WRITER_MODEL_H_
#define WEFT_COMMON_FORMATTING_WRITER_MODEL_H_

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "weft/common/formatting/writer-event.h"

namespace weft {

// LineBuffer is a persistent sequence of output lines.  The last line is the
// one being written.  All operations return a new buffer that shares the
// completed lines with this one.
class LineBuffer {
 public:
  // A buffer with one empty line.
  LineBuffer() : LineBuffer(std::string()) {}

  // A buffer with one line holding 'first_line'.
  explicit LineBuffer(std::string first_line);

  int size() const { return last_->count; }

  // Returns the line being written.
  const std::string &CurrentLine() const { return last_->text; }

  // Returns a buffer whose current line is replaced by 'line'.
  LineBuffer WithCurrentLine(std::string line) const;

  // Returns a buffer with 'line' started after the current line.
  LineBuffer AddLine(std::string line) const;

  // Returns all lines, oldest first.  O(N).
  std::vector<std::string> Lines() const;

 private:
  struct Node {
    std::string text;
    // Mutable only so the destructor can unlink long chains iteratively.
    mutable std::shared_ptr<const Node> prev;
    int count;  // lines in this node and all predecessors

    Node(std::string t, std::shared_ptr<const Node> p);
    ~Node();
  };

  explicit LineBuffer(std::shared_ptr<const Node> last)
      : last_(std::move(last)) {}

  // Never null.
  std::shared_ptr<const Node> last_;
};

// How a WriterModel treats incoming events.
enum class WriterMode {
  kNormal,       // the real document
  kMeasurement,  // a throw-away copy used to measure a rendering
  kTrial,        // speculative rendering bounded by trial budgets
};

std::ostream &operator<<(std::ostream &, WriterMode);

// One outstanding bet that a speculative rendering fits within 'max_width'
// columns measured from 'start_column', and within the page width.
struct TrialBudget {
  int max_width = 0;
  int start_column = 0;
  // Monotone: once set it stays set for the lifetime of the trial.
  bool confirmed_overflow = false;

  bool IsTooLong(int page_width, int current_column) const {
    return current_column - start_column > max_width ||
           current_column > page_width;
  }

  bool operator==(const TrialBudget &r) const {
    return max_width == r.max_width && start_column == r.start_column &&
           confirmed_overflow == r.confirmed_overflow;
  }
  bool operator!=(const TrialBudget &r) const { return !((*this) == r); }
};

std::ostream &operator<<(std::ostream &, const TrialBudget &);

// WriterModel accumulates events into lines of text.
// Invariant: 'column' is the width of the current line in characters.
struct WriterModel {
  LineBuffer lines;

  // Current indentation.
  int indent = 0;

  // Indentation floor: after the next line break the indentation is
  // max(indent, align_column).
  int align_column = 0;

  // Text written at the end of the current line once it breaks.
  std::string pending_suffix;

  WriterMode mode = WriterMode::kNormal;

  // Active budgets, innermost last.  Only non-empty in WriterMode::kTrial.
  std::vector<TrialBudget> trial_budgets;

  int column = 0;

  bool IsMeasurement() const { return mode == WriterMode::kMeasurement; }
  bool InTrial() const { return mode == WriterMode::kTrial; }

  // Returns true if any trial budget already confirmed an overflow.
  bool HasConfirmedOverflow() const;

  // Returns true if the current trial can no longer succeed: a budget
  // confirmed an overflow, or the current column is beyond a budget.
  // Always false outside of kTrial.
  bool TrialFailed(int page_width) const;

  // Returns the state after 'event', a normalized event (see
  // NormalizeWriterEvent()).  In kTrial mode, budgets are re-evaluated
  // before the event and a failed trial stops accumulating text.
  WriterModel Apply(const WriterEvent &event, int page_width) const;
};

// Human-readable form, for debugging.
std::ostream &operator<<(std::ostream &, const WriterModel &);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_WRITER_MODEL_H_
