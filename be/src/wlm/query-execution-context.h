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

#ifndef WLM_WLM_QUERY_EXECUTION_CONTEXT_H
#define WLM_WLM_QUERY_EXECUTION_CONTEXT_H

#include <stdint.h>
#include <limits>
#include <memory>
#include <string>

#include "common/atomic.h"
#include "common/status.h"
#include "wlm/cancellation-token.h"
#include "wlm/query-group-registry.h"
#include "wlm/query-group-state.h"
#include "wlm/resource-type.h"

namespace wlm {

/// Per query handle through which a running query reports its resource consumption to
/// its query group and receives cancellation.
///
/// The context remembers the last reported consumption of every resource type and
/// attributes only the difference to the group, so the group's usage is the sum of
/// the current consumption of its running queries. ReleaseResources() subtracts the
/// remembered consumption again. It runs exactly once even if completion and
/// cancellation race; later updates are ignored.
///
/// The context holds a reference to the group state, so the state stays valid while
/// the query runs even if the group is deregistered meanwhile.
class QueryExecutionContext {
 public:
  /// 'group' must have been acquired with QueryGroupRegistry::AcquireForQuery(); the
  /// context releases it when its resources are released.
  QueryExecutionContext(const std::string& query_id,
      std::shared_ptr<QueryGroupState> group, QueryGroupRegistry* registry);

  /// Releases the resources if that has not happened yet.
  ~QueryExecutionContext();

  const std::string& query_id() const { return query_id_; }
  const std::string& group_id() const { return group_->group_id(); }
  QueryGroupState* group() const { return group_.get(); }
  CancellationToken* cancellation_token() { return &cancellation_token_; }
  const CancellationToken* cancellation_token() const { return &cancellation_token_; }
  int64_t start_time_ms() const { return start_time_ms_; }

  /// Sets the consumption of 'type' to 'value' and attributes the difference to the
  /// previous value. Does nothing after ReleaseResources().
  void UpdateUsage(ResourceType type, int64_t value);

  /// Adds 'delta' to the consumption of 'type'.
  void AddUsage(ResourceType type, int64_t delta);

  /// Sets the CPU consumption from the CPU time used so far.
  void UpdateCpuTime(int64_t cpu_time_ns, int64_t elapsed_ns) {
    UpdateUsage(ResourceType::CPU, CpuTimeToMillicores(cpu_time_ns, elapsed_ns));
  }

  /// Current consumption of 'type', 0 once the resources were released.
  int64_t usage(ResourceType type) const;

  /// Subtracts the query's consumption from its group and releases the group.
  /// Returns true if this call did it, false if it had already happened.
  bool ReleaseResources();

  /// Records how the query ended and releases the resources. An OK 'outcome' counts as
  /// a completion, an error other than a cancellation as a failure. Only the first
  /// call has an effect.
  void Finish(const Status& outcome);

  bool finished() const { return finished_.Load(); }

 private:
  /// Marks a usage slot whose consumption was subtracted from the group.
  static constexpr int64_t RELEASED = std::numeric_limits<int64_t>::min();

  const std::string query_id_;
  const std::shared_ptr<QueryGroupState> group_;
  QueryGroupRegistry* const registry_;
  const int64_t start_time_ms_;

  CancellationToken cancellation_token_;

  /// Last consumption attributed to the group, indexed by ResourceType.
  AtomicInt64 usage_[NUM_RESOURCE_TYPES];

  AtomicBool released_;
  AtomicBool finished_;
};

}

#endif
