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
#ifndef WEFT_COMMON_FORMATTING_WRITER_EVENT_H_
#define WEFT_COMMON_FORMATTING_WRITER_EVENT_H_

#include <iosfwd>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace weft {

// The closed set of layout instructions.
enum class WriterEventType {
  kWriteText,      // append text to the current line
  kBreakLine,      // end the line, next line starts at the indentation
  kBreakLineInStringLiteral,  // line break inside a multi-line literal, the
                              // finished line is kept verbatim
  kBreakLineInTrivia,         // line break inside multi-line trivia, the
                              // finished line is right-trimmed
  kDeferTextUntilBreak,       // text appended only once the line breaks
  kBreakLineDueToTrivia,      // like kBreakLine, but caused by trivia
  kIndentBy,
  kUnindentBy,
  kSetIndent,
  kRestoreIndent,
  kSetAlignColumn,
  kRestoreAlignColumn,
};

std::ostream &operator<<(std::ostream &, WriterEventType);

// One atomic layout instruction.  Only kWriteText and kDeferTextUntilBreak
// carry 'text', only the indentation and alignment events carry 'amount'.
struct WriterEvent {
  WriterEventType type = WriterEventType::kWriteText;
  std::string text;
  int amount = 0;

  static WriterEvent WriteText(absl::string_view s) {
    return {WriterEventType::kWriteText, std::string(s), 0};
  }
  static WriterEvent BreakLine() { return {WriterEventType::kBreakLine, "", 0}; }
  static WriterEvent BreakLineInStringLiteral() {
    return {WriterEventType::kBreakLineInStringLiteral, "", 0};
  }
  static WriterEvent BreakLineInTrivia() {
    return {WriterEventType::kBreakLineInTrivia, "", 0};
  }
  static WriterEvent DeferTextUntilBreak(absl::string_view s) {
    return {WriterEventType::kDeferTextUntilBreak, std::string(s), 0};
  }
  static WriterEvent BreakLineDueToTrivia() {
    return {WriterEventType::kBreakLineDueToTrivia, "", 0};
  }
  static WriterEvent IndentBy(int n) {
    return {WriterEventType::kIndentBy, "", n};
  }
  static WriterEvent UnindentBy(int n) {
    return {WriterEventType::kUnindentBy, "", n};
  }
  static WriterEvent SetIndent(int n) {
    return {WriterEventType::kSetIndent, "", n};
  }
  static WriterEvent RestoreIndent(int n) {
    return {WriterEventType::kRestoreIndent, "", n};
  }
  static WriterEvent SetAlignColumn(int n) {
    return {WriterEventType::kSetAlignColumn, "", n};
  }
  static WriterEvent RestoreAlignColumn(int n) {
    return {WriterEventType::kRestoreAlignColumn, "", n};
  }

  bool Is(WriterEventType t) const { return type == t; }

  // Returns true for every line-breaking variant.
  bool IsBreak() const;

  // Returns true for kWriteText with exactly the text 's'.
  bool IsWriteOf(absl::string_view s) const {
    return type == WriterEventType::kWriteText && text == s;
  }

  // Comparison is only really used for testing.
  bool operator==(const WriterEvent &r) const {
    return type == r.type && text == r.text && amount == r.amount;
  }
  bool operator!=(const WriterEvent &r) const { return !((*this) == r); }
};

// Human-readable form, for debugging.
std::ostream &operator<<(std::ostream &, const WriterEvent &);

// Returns true for a kWriteText whose text starts like a comment or a
// preprocessor directive: "//", "(*", "#if", "#else", "#endif".
bool IsCommentOrDirective(const WriterEvent &event);

// Splits a kWriteText that contains newlines into a sequence of kWriteText
// separated by breaks.  Carriage returns are removed first.  The break is
// kBreakLineInTrivia for comments and directives (see
// IsCommentOrDirective()), kBreakLineInStringLiteral otherwise.  Any other
// event yields itself.
std::vector<WriterEvent> NormalizeWriterEvent(const WriterEvent &event);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_WRITER_EVENT_H_
