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

#ifndef WEFT_COMMON_FORMATTING_TRIVIA_PRINTER_H_
#define WEFT_COMMON_FORMATTING_TRIVIA_PRINTER_H_

#include <optional>
#include <vector>

#include "weft/common/formatting/context.h"
#include "weft/common/formatting/trivia.h"
#include "weft/common/strings/line-column-map.h"

namespace weft {

// Renders one piece of trivia at the current position:
//
//   * a comment after code is deferred to the end of the current line;
//   * a block comment is surrounded by single spaces, and put on fresh
//     lines as it was in the source;
//   * a blank line of the source adds a blank line, or ends the current line
//     when it has content;
//   * a line comment or directive gets a line of its own.
Step PrintTriviaContent(const TriviaContent &content);

// Renders each instruction's content in order.  The contents are copied.
Step PrintTriviaInstructions(
    const std::vector<const TriviaInstruction *> &instructions);

// Renders the trivia registered before / after the node of type 'node_type'
// covering exactly 'range'.  Nothing happens for a node without trivia.
Step EnterNodeFor(NodeType node_type, const LineColumnRange &range);
Step LeaveNodeFor(NodeType node_type, const LineColumnRange &range);

// Runs 'separator' unless trivia is registered before the node.  That trivia
// is expected to provide its own line breaks.
Step SepConsideringTriviaContentBeforeForMainNode(Step separator,
                                                  NodeType node_type,
                                                  const LineColumnRange &range);

Step SepNlnConsideringTriviaContentBeforeFor(NodeType node_type,
                                             const LineColumnRange &range);

// Separates a type definition from its members.  Trivia before the keyword
// that introduces the members (if there is one) replaces the separator.
// Otherwise, with BasicFormatStyle::newline_between_type_definition_and_members
// a line break is added unless the first member brings trivia of its own.
Step SepNlnTypeAndMembers(
    NodeType keyword_node_type,
    const std::optional<LineColumnRange> &keyword_range,
    const LineColumnRange &first_member_range, NodeType member_node_type);

// Renders 'leading', a line break, then 'continuation'.  When 'leading' was
// multiline, 'sep_nln' adds a blank line in between.
Step AddExtraNewlineIfLeadingWasMultiline(Step leading, Step sep_nln,
                                          Step continuation);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_TRIVIA_PRINTER_H_
