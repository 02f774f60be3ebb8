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

#include "weft/common/util/logging.h"

#include <cstdlib>

#include "absl/strings/numbers.h"

namespace weft {

// Only referenced when absl does not provide VLOG itself.
int VlogLevel() {
  static const int level = [] {
    const char *detail = std::getenv("WEFT_VLOG_DETAIL");
    int parsed = 0;
    if (detail == nullptr || !absl::SimpleAtoi(detail, &parsed)) return 0;
    return parsed;
  }();
  return level;
}

}  // namespace weft
