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

#ifndef WLM_WLM_CANCELLATION_TOKEN_H
#define WLM_WLM_CANCELLATION_TOKEN_H

#include <mutex>

#include "common/atomic.h"
#include "common/status.h"

namespace wlm {

/// Cooperative cancellation flag shared between a running query and whoever may cancel
/// it. The query polls IsCancelled() at points where it can stop safely and returns
/// reason() as its final status.
class CancellationToken {
 public:
  bool IsCancelled() const { return cancelled_.Load(); }

  /// Cancels the token with 'reason'. Returns true if this call cancelled it, false if
  /// it was already cancelled (the first reason is kept).
  bool Cancel(const Status& reason) {
    DCHECK(!reason.ok());
    std::lock_guard<std::mutex> l(lock_);
    if (cancelled_.Load()) return false;
    reason_ = reason;
    cancelled_.Store(true);
    return true;
  }

  /// The status passed to the first Cancel() call, OK if not cancelled.
  Status reason() const {
    std::lock_guard<std::mutex> l(lock_);
    return reason_;
  }

 private:
  AtomicBool cancelled_{false};

  /// Protects 'reason_'.
  mutable std::mutex lock_;
  Status reason_;
};

}

#endif
