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
#include "weft/common/formatting/writer-event.h"

#include <ostream>
#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

namespace weft {

std::ostream &operator<<(std::ostream &stream, WriterEventType t) {
  switch (t) {
    case WriterEventType::kWriteText:
      return stream << "write";
    case WriterEventType::kBreakLine:
      return stream << "break";
    case WriterEventType::kBreakLineInStringLiteral:
      return stream << "break-in-string";
    case WriterEventType::kBreakLineInTrivia:
      return stream << "break-in-trivia";
    case WriterEventType::kDeferTextUntilBreak:
      return stream << "defer";
    case WriterEventType::kBreakLineDueToTrivia:
      return stream << "break-for-trivia";
    case WriterEventType::kIndentBy:
      return stream << "indent";
    case WriterEventType::kUnindentBy:
      return stream << "unindent";
    case WriterEventType::kSetIndent:
      return stream << "set-indent";
    case WriterEventType::kRestoreIndent:
      return stream << "restore-indent";
    case WriterEventType::kSetAlignColumn:
      return stream << "set-align";
    case WriterEventType::kRestoreAlignColumn:
      return stream << "restore-align";
  }
  return stream << "???";
}

bool WriterEvent::IsBreak() const {
  switch (type) {
    case WriterEventType::kBreakLine:
    case WriterEventType::kBreakLineInStringLiteral:
    case WriterEventType::kBreakLineInTrivia:
    case WriterEventType::kBreakLineDueToTrivia:
      return true;
    default:
      return false;
  }
}

std::ostream &operator<<(std::ostream &stream, const WriterEvent &event) {
  stream << event.type;
  switch (event.type) {
    case WriterEventType::kWriteText:
    case WriterEventType::kDeferTextUntilBreak:
      return stream << "(\"" << event.text << "\")";
    case WriterEventType::kIndentBy:
    case WriterEventType::kUnindentBy:
    case WriterEventType::kSetIndent:
    case WriterEventType::kRestoreIndent:
    case WriterEventType::kSetAlignColumn:
    case WriterEventType::kRestoreAlignColumn:
      return stream << '(' << event.amount << ')';
    default:
      return stream;
  }
}

bool IsCommentOrDirective(const WriterEvent &event) {
  if (event.type != WriterEventType::kWriteText) return false;
  for (const absl::string_view marker : {"//", "#if", "#else", "#endif", "(*"}) {
    if (absl::StartsWith(event.text, marker)) return true;
  }
  return false;
}

std::vector<WriterEvent> NormalizeWriterEvent(const WriterEvent &event) {
  if (event.type != WriterEventType::kWriteText ||
      !absl::StrContains(event.text, "\n")) {
    return {event};
  }
  const WriterEvent line_break = IsCommentOrDirective(event)
                                     ? WriterEvent::BreakLineInTrivia()
                                     : WriterEvent::BreakLineInStringLiteral();
  // Multi-line text of the original source may carry \r.  Output line
  // terminators are decided by Dump().
  const std::string text = absl::StrReplaceAll(event.text, {{"\r", ""}});
  std::vector<WriterEvent> result;
  for (const absl::string_view part : absl::StrSplit(text, '\n')) {
    if (!result.empty()) result.push_back(line_break);
    result.push_back(WriterEvent::WriteText(part));
  }
  return result;
}

}  // namespace weft
