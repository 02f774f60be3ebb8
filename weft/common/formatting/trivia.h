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
#ifndef WEFT_COMMON_FORMATTING_TRIVIA_H_
#define WEFT_COMMON_FORMATTING_TRIVIA_H_

#include <iosfwd>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "weft/common/strings/line-column-map.h"

namespace weft {

enum class TriviaKind {
  kLineCommentAfterSourceCode,  // "x = 1 // note": stays on its line
  kBlockComment,                // "(* ... *)", possibly on its own lines
  kCommentOnSingleLine,         // a line comment alone on its line
  kNewline,                     // a blank line of the original source
  kDirective,                   // "#if DEBUG"
};

std::ostream &operator<<(std::ostream &, TriviaKind);

// Source content that is not part of the syntax tree.
struct TriviaContent {
  TriviaKind kind = TriviaKind::kNewline;

  // Verbatim text.  Empty for kNewline.
  std::string text;

  // Only for kBlockComment: the comment started on a fresh line /
  // the code after it started on a fresh line.
  bool newline_before = false;
  bool newline_after = false;

  static TriviaContent LineCommentAfterSourceCode(absl::string_view s) {
    return {TriviaKind::kLineCommentAfterSourceCode, std::string(s), false,
            false};
  }
  static TriviaContent BlockComment(absl::string_view s, bool newline_before,
                                    bool newline_after) {
    return {TriviaKind::kBlockComment, std::string(s), newline_before,
            newline_after};
  }
  static TriviaContent CommentOnSingleLine(absl::string_view s) {
    return {TriviaKind::kCommentOnSingleLine, std::string(s), false, false};
  }
  static TriviaContent Newline() {
    return {TriviaKind::kNewline, "", false, false};
  }
  static TriviaContent Directive(absl::string_view s) {
    return {TriviaKind::kDirective, std::string(s), false, false};
  }

  bool operator==(const TriviaContent &r) const {
    return kind == r.kind && text == r.text &&
           newline_before == r.newline_before &&
           newline_after == r.newline_after;
  }
  bool operator!=(const TriviaContent &r) const { return !((*this) == r); }
};

std::ostream &operator<<(std::ostream &, const TriviaContent &);

// Language-specific node type tag, as assigned by the tree walker.
using NodeType = int;

// Trivia attached to the syntax node of type 'node_type' that covers
// 'range' in the original source, printed before or after that node.
struct TriviaInstruction {
  NodeType node_type = 0;
  LineColumnRange range = {{0, 0}, {0, 0}};
  bool add_before = true;
  TriviaContent content;
};

std::ostream &operator<<(std::ostream &, const TriviaInstruction &);

// Trivia instructions grouped by node type, in collection order.
using TriviaTable = absl::flat_hash_map<NodeType, std::vector<TriviaInstruction>>;

// Returns the instructions of 'table' for 'node_type' whose range equals
// 'range', in order.
std::vector<const TriviaInstruction *> FindTrivia(const TriviaTable &table,
                                                  NodeType node_type,
                                                  const LineColumnRange &range);

// Returns true if FindTrivia() would find anything.
bool HasTrivia(const TriviaTable &table, NodeType node_type,
               const LineColumnRange &range);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_TRIVIA_H_
