// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#ifndef WLM_COMMON_COMPILER_UTIL_H
#define WLM_COMMON_COMPILER_UTIL_H

/// Branch prediction hints for the admission and attribution hot paths.
/// example: if (UNLIKELY(!status.ok())) { ... }
#ifdef LIKELY
#undef LIKELY
#endif

#ifdef UNLIKELY
#undef UNLIKELY
#endif

#define LIKELY(expr) __builtin_expect(!!(expr), 1)
#define UNLIKELY(expr) __builtin_expect(!!(expr), 0)

/// Force inlining. Use sparingly, only for small functions on a hot path where the
/// compiler's heuristics are known to make a bad decision.
#define ALWAYS_INLINE __attribute__((always_inline))

namespace wlm {

/// The size of an L1 cache line in bytes on x86-64. Per-group counters that are
/// updated from many threads are aligned to this to avoid false sharing.
constexpr int CACHE_LINE_SIZE = 64;
}
#endif
