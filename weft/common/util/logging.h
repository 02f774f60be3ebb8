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

#ifndef WEFT_COMMON_UTIL_LOGGING_H_
#define WEFT_COMMON_UTIL_LOGGING_H_

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif
#include "absl/log/check.h"  // IWYU pragma: export
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

#include "absl/log/die_if_null.h"  // IWYU pragma: export
#include "absl/log/log.h"          // IWYU pragma: export

// Older absl releases ship LOG and CHECK but no VLOG.
#ifndef VLOG
namespace weft {
// Verbosity threshold for VLOG.  Read once from the WEFT_VLOG_DETAIL
// environment variable.
int VlogLevel();
}  // namespace weft

#define VLOG_IS_ON(x) (::weft::VlogLevel() >= (x))
#define VLOG(x) LOG_IF(INFO, VLOG_IS_ON(x))

#ifdef NDEBUG
#define DVLOG(x) LOG_IF(INFO, false)
#else
#define DVLOG(x) VLOG(x)
#endif  // NDEBUG

#endif  // VLOG

#define CHECK_NOTNULL(p) (void)ABSL_DIE_IF_NULL(p)

#endif  // WEFT_COMMON_UTIL_LOGGING_H_
