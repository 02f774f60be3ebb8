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
#include "weft/common/strings/line-column-map.h"

#include <algorithm>
#include <cstddef>
#include <iostream>

#include "absl/strings/string_view.h"

namespace weft {

// Print to the user as 1-based index because that is how lines
// and columns are indexed in every file diagnostic tool.
std::ostream &operator<<(std::ostream &out, const LineColumn &line_column) {
  return out << line_column.line + 1 << ':' << line_column.column + 1;
}

std::ostream &operator<<(std::ostream &out, const LineColumnRange &r) {
  return out << '[' << r.start << '-' << r.end << ')';
}

// Records locations of line breaks, which can then be used to translate
// offsets into line:column numbers.
LineColumnMap::LineColumnMap(absl::string_view text) {
  beginning_of_line_offsets_.push_back(0);
  auto offset = text.find('\n');
  while (offset != absl::string_view::npos) {
    beginning_of_line_offsets_.push_back(offset + 1);
    offset = text.find('\n', offset + 1);
  }
}

int LineColumnMap::OffsetAt(absl::string_view base,
                            const LineColumn &pos) const {
  if (pos.line < 0) return 0;
  if (static_cast<size_t>(pos.line) >= beginning_of_line_offsets_.size()) {
    return base.length();
  }
  const int line_begin = beginning_of_line_offsets_[pos.line];
  const size_t next_line = pos.line + 1;
  const int line_end = next_line < beginning_of_line_offsets_.size()
                           ? beginning_of_line_offsets_[next_line] - 1
                           : static_cast<int>(base.length());
  // Step over 'column' characters, skipping UTF-8 continuation bytes.
  int offset = line_begin;
  for (int remaining = pos.column; remaining > 0 && offset < line_end;
       --remaining) {
    ++offset;
    while (offset < line_end && (base[offset] & 0xc0) == 0x80) ++offset;
  }
  return offset;
}

absl::string_view LineColumnMap::Slice(absl::string_view base,
                                       const LineColumnRange &range) const {
  const int begin = OffsetAt(base, range.start);
  const int end = std::max(begin, OffsetAt(base, range.end));
  return base.substr(begin, end - begin);
}

}  // namespace weft
