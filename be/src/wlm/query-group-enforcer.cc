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

#include "wlm/query-group-enforcer.h"

#include <algorithm>
#include <exception>

#include "common/logging.h"
#include "util/time.h"

#include "common/names.h"

namespace wlm {

QueryGroupEnforcer::QueryGroupEnforcer(QueryGroupRegistry* registry,
    const QueryGroupConfigProvider* configs, const ResourceUsageTracker* tracker,
    ExecutionEngine* engine, const WorkloadManagementSettings& settings,
    NodeDuressFn node_duress_fn, unique_ptr<TaskSelectionStrategy> strategy)
  : registry_(registry),
    configs_(configs),
    tracker_(tracker),
    engine_(engine),
    settings_(settings),
    node_duress_fn_(move(node_duress_fn)),
    strategy_(strategy != nullptr ? move(strategy) :
                                    unique_ptr<TaskSelectionStrategy>(
                                        new MaximumUsageSelectionStrategy())) {
  DCHECK(registry_ != nullptr);
  DCHECK(configs_ != nullptr);
  DCHECK(tracker_ != nullptr);
  DCHECK(engine_ != nullptr);
}

QueryGroupEnforcer::~QueryGroupEnforcer() {
  Shutdown();
}

Status QueryGroupEnforcer::Init() {
  DCHECK(enforcement_thread_ == nullptr);
  RETURN_IF_ERROR(Thread::Create("query-group", "enforcement-loop",
      [this]() { this->EnforcementLoop(); }, &enforcement_thread_));
  LOG(INFO) << "Started query group enforcement, interval "
            << settings_.enforcement_interval_ms << "ms";
  return Status::OK();
}

void QueryGroupEnforcer::Shutdown() {
  {
    lock_guard<mutex> l(lock_);
    shutdown_ = true;
  }
  shutdown_cv_.NotifyAll();
  if (enforcement_thread_ != nullptr) {
    enforcement_thread_->Join();
    enforcement_thread_.reset();
  }
}

void QueryGroupEnforcer::EnforcementLoop() {
  const int64_t interval_ms = settings_.enforcement_interval_ms;
  int64_t next_cycle_ms = MonotonicMillis() + interval_ms;
  while (true) {
    {
      unique_lock<mutex> l(lock_);
      while (!shutdown_) {
        int64_t wait_ms = next_cycle_ms - MonotonicMillis();
        if (wait_ms <= 0) break;
        shutdown_cv_.WaitForMs(l, wait_ms);
      }
      if (shutdown_) return;
    }
    RunCycle();
    next_cycle_ms += interval_ms;
    int64_t now = MonotonicMillis();
    if (now > next_cycle_ms) {
      // The cycle overran one or more start times. Skip them instead of running the
      // missed cycles back to back.
      int64_t missed = (now - next_cycle_ms) / interval_ms + 1;
      num_skipped_cycles_.Add(missed);
      next_cycle_ms += missed * interval_ms;
      LOG(WARNING) << "Query group enforcement cycle overran the interval of "
                   << interval_ms << "ms, skipped " << missed << " cycle(s)";
    }
  }
}

bool QueryGroupEnforcer::RunCycle() {
  if (!cycle_running_.CompareAndSwap(false, true)) {
    num_skipped_cycles_.Add(1);
    VLOG_PROGRESS << "Skipping query group enforcement cycle, previous cycle is running";
    return false;
  }
  try {
    RunCycleInternal();
  } catch (const std::exception& e) {
    num_failed_cycles_.Add(1);
    LOG(ERROR) << "Query group enforcement cycle failed: " << e.what();
  } catch (...) {
    num_failed_cycles_.Add(1);
    LOG(ERROR) << "Query group enforcement cycle failed with an unknown exception";
  }
  cycle_running_.Store(false);
  return true;
}

void QueryGroupEnforcer::RunCycleInternal() {
  int64_t start_ms = MonotonicMillis();
  vector<shared_ptr<QueryGroupState>> groups = registry_->GetAll();
  RecordUsage(groups);

  CycleState cycle(settings_.max_cancellations_per_cycle);
  EnforceGroups(groups, ResiliencyMode::ENFORCED, &cycle);

  bool in_duress = IsNodeInDuress();
  if (in_duress) {
    for (const shared_ptr<QueryGroupState>& group : groups) {
      if (cycle.budget_exhausted()) break;
      if (group->pending_removal()) CancelQueriesOfRemovedGroup(group.get(), &cycle);
    }
    // Cancelling the queries of removed groups may have relieved the node.
    in_duress = IsNodeInDuress();
    if (in_duress) EnforceGroups(groups, ResiliencyMode::SOFT, &cycle);
  }

  num_cycles_.Add(1);
  VLOG_PROGRESS << "Query group enforcement cycle over " << groups.size()
                << " groups finished in " << (MonotonicMillis() - start_ms)
                << "ms, cancelled " << cycle.num_signaled << " queries"
                << (in_duress ? " (node in duress)" : "");
}

void QueryGroupEnforcer::RecordUsage(const vector<shared_ptr<QueryGroupState>>& groups) {
  for (const shared_ptr<QueryGroupState>& group : groups) {
    for (ResourceType t : group->tracked_resources().types()) {
      group->resource_state(t)->set_last_recorded_usage(
          tracker_->UsageFraction(*group, t));
    }
  }
}

void QueryGroupEnforcer::EnforceGroups(const vector<shared_ptr<QueryGroupState>>& groups,
    ResiliencyMode mode, CycleState* cycle) {
  for (const shared_ptr<QueryGroupState>& group : groups) {
    if (cycle->budget_exhausted()) {
      VLOG_PROGRESS << "Reached the limit of " << settings_.max_cancellations_per_cycle
                    << " cancellations in this enforcement cycle";
      return;
    }
    if (group->group_id() == QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID) continue;
    if (group->pending_removal()) continue;
    shared_ptr<const QueryGroupConfig> config = configs_->Get(group->group_id());
    if (config == nullptr || config->mode != mode) continue;
    EnforceLimits(group.get(), *config, cycle);
  }
}

Status QueryGroupEnforcer::ListRunningQueries(
    const QueryGroupState& group, vector<RunningQuery>* queries) {
  try {
    return engine_->ListRunningQueries(group.group_id(), queries);
  } catch (const std::exception& e) {
    return Status(ErrorCode::RUNNING_QUERY_LIST_FAILED, group.group_id(), e.what());
  }
}

void QueryGroupEnforcer::CancelQueriesOfRemovedGroup(
    QueryGroupState* group, CycleState* cycle) {
  vector<RunningQuery> queries;
  Status status = ListRunningQueries(*group, &queries);
  if (!status.ok()) {
    num_enumeration_failures_.Add(1);
    LOG(WARNING) << "Could not cancel the queries of removed query group "
                 << group->group_id() << ": " << status.GetDetail();
    return;
  }
  for (const RunningQuery& query : queries) {
    if (cycle->budget_exhausted()) return;
    if (query.cancelled) continue;
    Status reason = Status::Expected(
        ErrorCode::QUERY_GROUP_REMOVED, query.query_id, group->group_id());
    CancelQuery(group, query.query_id, nullptr, reason, cycle);
  }
}

void QueryGroupEnforcer::EnforceLimits(
    QueryGroupState* group, const QueryGroupConfig& config, CycleState* cycle) {
  vector<ResourceType> breached;
  for (ResourceType t : group->tracked_resources().types()) {
    if (!config.has_hard_limit(t)) continue;
    double limit_fraction = config.hard_limit(t) * settings_.cancellation_threshold(t);
    if (tracker_->UsageFraction(*group, t) > limit_fraction) breached.push_back(t);
  }
  if (breached.empty()) return;

  vector<RunningQuery> queries;
  Status status = ListRunningQueries(*group, &queries);
  if (!status.ok()) {
    num_enumeration_failures_.Add(1);
    LOG(WARNING) << "Skipping query group " << group->group_id()
                 << " in this enforcement cycle: " << status.GetDetail();
    return;
  }

  // Queries cancelled for an earlier resource in this cycle.
  set<string> selected;
  for (ResourceType t : breached) {
    if (cycle->budget_exhausted()) return;
    double limit_fraction = config.hard_limit(t) * settings_.cancellation_threshold(t);
    int64_t limit = tracker_->FractionToUnits(t, limit_fraction);
    int64_t excess = std::max<int64_t>(0, group->usage(t) - limit);

    // Queries that are going away already reduce the excess by their usage.
    vector<RunningQuery> candidates;
    for (const RunningQuery& query : queries) {
      if (query.cancelled || selected.find(query.query_id) != selected.end()) {
        excess -= query.usage_of(t);
      } else {
        candidates.push_back(query);
      }
    }
    if (excess <= 0) continue;

    double usage_fraction = tracker_->UsageFraction(*group, t);
    LOG(INFO) << "Query group " << group->group_id() << " exceeds its "
              << ResourceTypeToString(t) << " limit: usage " << usage_fraction
              << " > " << limit_fraction << ", excess " << excess;
    for (const RunningQuery* victim : strategy_->SelectVictims(candidates, t, excess)) {
      if (cycle->budget_exhausted()) return;
      Status reason = Status::Expected(ErrorCode::QUERY_GROUP_CANCELLED,
          victim->query_id, group->group_id(), ResourceTypeToString(t), usage_fraction,
          limit_fraction);
      CancelQuery(group, victim->query_id, &t, reason, cycle);
      selected.insert(victim->query_id);
    }
  }
}

bool QueryGroupEnforcer::CancelQuery(QueryGroupState* group, const string& query_id,
    const ResourceType* type, const Status& reason, CycleState* cycle) {
  CancelResult result = engine_->CancelQuery(query_id, reason);
  if (result == CancelResult::NO_OP) {
    VLOG_QUERY << "Query " << query_id << " of query group " << group->group_id()
               << " had already finished, nothing to cancel";
    return false;
  }
  group->RecordCancellation(type);
  num_cancellations_.Add(1);
  ++cycle->num_signaled;
  if (cycle->remaining_cancellations > 0) --cycle->remaining_cancellations;
  LOG(INFO) << reason.msg().msg();
  return true;
}

}
