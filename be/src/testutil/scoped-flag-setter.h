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

#ifndef WLM_TESTUTIL_SCOPED_FLAG_SETTER_H
#define WLM_TESTUTIL_SCOPED_FLAG_SETTER_H

namespace wlm {

/// Overrides a flag for the lifetime of the setter and restores the previous value
/// when it goes out of scope. Used by tests that need a non-default enforcement
/// setting for a single case without leaking it into the next one.
//
/// Example (pre-condition: FLAGS_wlm_max_cancellations_per_cycle == 0):
/// {
///   auto s = ScopedFlagSetter<int32_t>::Make(&FLAGS_wlm_max_cancellations_per_cycle, 1);
///   // ... at most one query is cancelled per enforcement cycle in this scope
/// }
/// // Afterwards the cap is unlimited again.
template <typename T>
class ScopedFlagSetter {
 public:
  static ScopedFlagSetter<T> Make(T* flag, const T& new_val) {
    return ScopedFlagSetter(flag, new_val);
  }

  ~ScopedFlagSetter() {
    if (flag_ != nullptr) *flag_ = old_val_;
  }

  ScopedFlagSetter(ScopedFlagSetter&& other) noexcept
    : flag_(other.flag_), old_val_(other.old_val_) {
    other.flag_ = nullptr;
  }

 private:
  ScopedFlagSetter(T* flag, const T& new_val) : flag_(flag), old_val_(*flag) {
    *flag_ = new_val;
  }

  T* flag_;
  T old_val_;
};
}

#endif
