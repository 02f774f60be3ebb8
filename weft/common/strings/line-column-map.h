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
// LineColumnMap translates between byte offsets and line:column positions of
// a source text.  Trivia instructions are keyed by LineColumnRange.
//
// usage:
// absl::string_view text = ...;
// LineColumnMap lcmap(text);
// int offset = lcmap.OffsetAt(text, position);
// absl::string_view original = lcmap.Slice(text, range);

#ifndef WEFT_COMMON_STRINGS_LINE_COLUMN_MAP_H_
#define WEFT_COMMON_STRINGS_LINE_COLUMN_MAP_H_

#include <iosfwd>
#include <vector>

#include "absl/strings/string_view.h"

namespace weft {

// Pair: line number and column number.
struct LineColumn {
  int line;    // 0-based index
  int column;  // 0-based index, in characters

  constexpr bool operator==(const LineColumn &r) const {
    return line == r.line && column == r.column;
  }
  constexpr bool operator!=(const LineColumn &r) const { return !(*this == r); }
};

std::ostream &operator<<(std::ostream &, const LineColumn &);

// A complete range.
struct LineColumnRange {
  LineColumn start;  // Inclusive
  LineColumn end;    // Exclusive

  constexpr bool operator==(const LineColumnRange &r) const {
    return start == r.start && end == r.end;
  }
  constexpr bool operator!=(const LineColumnRange &r) const {
    return !(*this == r);
  }
};

std::ostream &operator<<(std::ostream &, const LineColumnRange &);

// Fast mapping of substring position to human-useful line/column
class LineColumnMap {
 public:
  explicit LineColumnMap(absl::string_view text);

  // Returns the byte offset of 'pos', whose column counts UTF-8 characters.
  // Positions past the end of a line are clamped to the end of that line,
  // positions past the last line to the end of 'base'.
  int OffsetAt(absl::string_view base, const LineColumn &pos) const;

  // Returns the text covered by 'range'.
  absl::string_view Slice(absl::string_view base,
                          const LineColumnRange &range) const;

 private:
  // Index: line number, Value: byte offset that starts the line.
  // The first value will always be 0 because the beginning of the first line
  // has offset 0.
  std::vector<int> beginning_of_line_offsets_;
};

}  // namespace weft

#endif  // WEFT_COMMON_STRINGS_LINE_COLUMN_MAP_H_
