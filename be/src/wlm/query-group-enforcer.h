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

#ifndef WLM_WLM_QUERY_GROUP_ENFORCER_H
#define WLM_WLM_QUERY_GROUP_ENFORCER_H

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/atomic.h"
#include "common/status.h"
#include "util/condition-variable.h"
#include "util/thread.h"
#include "wlm/execution-engine.h"
#include "wlm/query-group-config.h"
#include "wlm/query-group-registry.h"
#include "wlm/resource-usage-tracker.h"
#include "wlm/task-selection-strategy.h"
#include "wlm/workload-management-settings.h"

namespace wlm {

/// Background loop that cancels running queries of query groups whose usage has grown
/// past their hard limits after admission.
///
/// Every 'enforcement_interval_ms' one cycle runs on the enforcement thread:
///  1. The usage fraction of every group and tracked resource is stored as the group's
///     last recorded usage.
///  2. If the node is in duress, all running queries of groups pending removal are
///     cancelled.
///  3. For every ENFORCED group (and every SOFT group while the node is still in
///     duress) and every tracked resource whose usage fraction is above the hard limit
///     scaled by the node cancellation threshold, the running queries of the group are
///     listed and the selection strategy picks victims until their usage covers the
///     excess. Queries picked for an earlier resource in the same cycle and queries
///     already cancelled are not picked again; their usage is credited to the excess.
///  4. Each victim is cancelled through the engine. Only cancellations that actually
///     signaled a running query are counted on the group state.
///
/// Cycles never overlap. If a cycle overruns the interval, the start times that passed
/// meanwhile are skipped. A failure to list the queries of one group skips that group;
/// an exception thrown by a collaborator ends the current cycle but not the loop.
class QueryGroupEnforcer {
 public:
  /// 'node_duress_fn' may be empty, in which case the node is never in duress.
  /// 'strategy' defaults to MaximumUsageSelectionStrategy.
  QueryGroupEnforcer(QueryGroupRegistry* registry,
      const QueryGroupConfigProvider* configs, const ResourceUsageTracker* tracker,
      ExecutionEngine* engine, const WorkloadManagementSettings& settings,
      NodeDuressFn node_duress_fn,
      std::unique_ptr<TaskSelectionStrategy> strategy = nullptr);

  /// Stops the enforcement thread if it is running.
  ~QueryGroupEnforcer();

  /// Starts the enforcement thread.
  Status Init() WARN_UNUSED_RESULT;

  /// Stops the enforcement thread and waits for the running cycle to finish. Idempotent.
  void Shutdown();

  /// Runs one cycle on the calling thread. Returns false without doing anything if
  /// another cycle is running.
  bool RunCycle();

  int64_t num_cycles() const { return num_cycles_.Load(); }
  int64_t num_skipped_cycles() const { return num_skipped_cycles_.Load(); }
  int64_t num_failed_cycles() const { return num_failed_cycles_.Load(); }
  int64_t num_enumeration_failures() const { return num_enumeration_failures_.Load(); }
  int64_t num_cancellations() const { return num_cancellations_.Load(); }

 private:
  /// Per cycle bookkeeping.
  struct CycleState {
    explicit CycleState(int32_t max_cancellations)
      : remaining_cancellations(max_cancellations > 0 ? max_cancellations : -1) {}

    bool budget_exhausted() const { return remaining_cancellations == 0; }

    /// -1 if unlimited.
    int32_t remaining_cancellations;
    int32_t num_signaled = 0;
  };

  /// Body of the enforcement thread.
  void EnforcementLoop();

  /// Does the work of RunCycle() once the cycle is known to run alone.
  void RunCycleInternal();

  bool IsNodeInDuress() const { return node_duress_fn_ && node_duress_fn_(); }

  /// Stores the current usage fraction of every tracked resource of every group.
  void RecordUsage(const std::vector<std::shared_ptr<QueryGroupState>>& groups);

  /// Runs EnforceLimits() on every configured group in 'mode'.
  void EnforceGroups(const std::vector<std::shared_ptr<QueryGroupState>>& groups,
      ResiliencyMode mode, CycleState* cycle);

  /// Lists the running queries of 'group' into 'queries'. Exceptions thrown by the
  /// engine are returned as RUNNING_QUERY_LIST_FAILED.
  Status ListRunningQueries(const QueryGroupState& group,
      std::vector<RunningQuery>* queries) WARN_UNUSED_RESULT;

  /// Cancels all running queries of 'group', which is pending removal.
  void CancelQueriesOfRemovedGroup(QueryGroupState* group, CycleState* cycle);

  /// Cancels queries of 'group' for every resource whose limit in 'config' the group
  /// exceeds.
  void EnforceLimits(QueryGroupState* group, const QueryGroupConfig& config,
      CycleState* cycle);

  /// Cancels 'query_id' with 'reason' and records the cancellation on 'group' if a
  /// running query was signaled. 'type' is the exceeded resource or nullptr. Returns
  /// true if the query was signaled.
  bool CancelQuery(QueryGroupState* group, const std::string& query_id,
      const ResourceType* type, const Status& reason, CycleState* cycle);

  QueryGroupRegistry* const registry_;
  const QueryGroupConfigProvider* const configs_;
  const ResourceUsageTracker* const tracker_;
  ExecutionEngine* const engine_;
  const WorkloadManagementSettings settings_;
  const NodeDuressFn node_duress_fn_;
  const std::unique_ptr<TaskSelectionStrategy> strategy_;

  /// True while a cycle runs. Set and cleared with CompareAndSwap() so that only one
  /// cycle runs at a time.
  AtomicBool cycle_running_;

  /// Protects 'shutdown_'. Signaled by Shutdown() to wake the enforcement thread.
  std::mutex lock_;
  ConditionVariable shutdown_cv_;
  bool shutdown_ = false;

  std::unique_ptr<Thread> enforcement_thread_;

  AtomicInt64 num_cycles_;
  AtomicInt64 num_skipped_cycles_;
  AtomicInt64 num_failed_cycles_;
  AtomicInt64 num_enumeration_failures_;
  AtomicInt64 num_cancellations_;
};

}

#endif
