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
#include "weft/common/formatting/trivia.h"

#include <algorithm>
#include <ostream>
#include <vector>

#include "weft/common/strings/line-column-map.h"

namespace weft {

std::ostream &operator<<(std::ostream &stream, TriviaKind kind) {
  switch (kind) {
    case TriviaKind::kLineCommentAfterSourceCode:
      return stream << "line-comment-after-code";
    case TriviaKind::kBlockComment:
      return stream << "block-comment";
    case TriviaKind::kCommentOnSingleLine:
      return stream << "line-comment";
    case TriviaKind::kNewline:
      return stream << "newline";
    case TriviaKind::kDirective:
      return stream << "directive";
  }
  return stream << "???";
}

std::ostream &operator<<(std::ostream &stream, const TriviaContent &content) {
  stream << content.kind;
  if (!content.text.empty()) stream << "(\"" << content.text << "\")";
  if (content.newline_before) stream << " +before";
  if (content.newline_after) stream << " +after";
  return stream;
}

std::ostream &operator<<(std::ostream &stream, const TriviaInstruction &ti) {
  return stream << (ti.add_before ? "before " : "after ") << ti.node_type
                << ' ' << ti.range << ": " << ti.content;
}

std::vector<const TriviaInstruction *> FindTrivia(
    const TriviaTable &table, NodeType node_type,
    const LineColumnRange &range) {
  std::vector<const TriviaInstruction *> result;
  const auto found = table.find(node_type);
  if (found == table.end()) return result;
  for (const auto &instruction : found->second) {
    if (instruction.range == range) result.push_back(&instruction);
  }
  return result;
}

bool HasTrivia(const TriviaTable &table, NodeType node_type,
               const LineColumnRange &range) {
  const auto found = table.find(node_type);
  if (found == table.end()) return false;
  return std::any_of(found->second.begin(), found->second.end(),
                     [&range](const TriviaInstruction &instruction) {
                       return instruction.range == range;
                     });
}

}  // namespace weft
