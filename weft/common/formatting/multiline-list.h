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

#ifndef WEFT_COMMON_FORMATTING_MULTILINE_LIST_H_
#define WEFT_COMMON_FORMATTING_MULTILINE_LIST_H_

#include <vector>

#include "weft/common/formatting/context.h"

namespace weft {

struct ColMultilineItem {
  // Renders the item.
  Step expr;

  // Line break between the item and its predecessor, usually
  // SepNlnConsideringTriviaContentBeforeFor() the item's node.  Around
  // multiline items the joiner adds another line break before it.
  Step sep_nln;
};

// Returns true if 'expr' breaks a line of its own when rendered from 'ctx'.
// Leading chunks that start with a comment, a directive or a line break are
// trivia and do not count.  Stores the rendering in '*next'.
bool IsMultilineItem(const Step &expr, const Context &ctx, Context *next);

// Renders one item per line.  Multiline items are set apart from their
// neighbors by the item's 'sep_nln':
//
//   let a = AAAA
//
//   let b =
//       BBBB
//       BBBB
//
//   let c = CCCC
//
// The first item never gets a separator.  Every item is rendered assuming it
// or its predecessor is multiline; when neither is, it is rendered again
// without the separator.  Item steps must therefore be cheap to re-run and
// free of side effects.
Step ColWithNlnWhenItemIsMultiline(std::vector<ColMultilineItem> items);

// ColWithNlnWhenItemIsMultiline() if
// BasicFormatStyle::blank_lines_around_nested_multiline_expressions is set,
// otherwise the items separated by plain line breaks.
Step ColWithNlnWhenItemIsMultilineUsingConfig(
    std::vector<ColMultilineItem> items);

}  // namespace weft

#endif  // WEFT_COMMON_FORMATTING_MULTILINE_LIST_H_
