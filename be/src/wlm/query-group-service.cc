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

#include "wlm/query-group-service.h"

#include <algorithm>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {

const char* const QueryGroupService::ALL_GROUPS = "_all";

QueryGroupService::QueryGroupService(
    const WorkloadManagementSettings& settings, NodeDuressFn node_duress_fn)
  : settings_(settings),
    registry_(settings.tracked_resources),
    tracker_(&registry_, settings),
    admission_controller_(&registry_, &configs_, &tracker_, settings, node_duress_fn),
    enforcer_(&registry_, &configs_, &tracker_, &running_queries_, settings,
        node_duress_fn) {}

QueryGroupService::~QueryGroupService() {
  Shutdown();
}

Status QueryGroupService::Init() {
  RETURN_IF_ERROR(settings_.Validate());
  LOG(INFO) << "Query group workload management: " << settings_.DebugString();
  return enforcer_.Init();
}

void QueryGroupService::Shutdown() {
  enforcer_.Shutdown();
}

Status QueryGroupService::RegisterQueryGroup(const QueryGroupConfig& config) {
  if (config.id == QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID) {
    return Status(ErrorCode::QUERY_GROUP_INVALID_CONFIG, config.id,
        "the default query group cannot be configured");
  }
  RETURN_IF_ERROR(configs_.Put(config));
  registry_.GetOrCreate(config.id);
  LOG(INFO) << "Registered " << config.DebugString();
  return Status::OK();
}

Status QueryGroupService::DeregisterQueryGroup(const string& group_id) {
  if (group_id == QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID
      || !registry_.Contains(group_id)) {
    return Status(ErrorCode::QUERY_GROUP_NOT_FOUND, group_id);
  }
  configs_.Remove(group_id);
  registry_.Deregister(group_id);
  LOG(INFO) << "Deregistered query group " << group_id;
  return Status::OK();
}

string QueryGroupService::ResolveGroupId(const string& group_id) const {
  if (group_id.empty()) return QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID;
  shared_ptr<QueryGroupState> state = registry_.Get(group_id);
  if (state == nullptr || state->pending_removal()) {
    VLOG_QUERY << "Query group " << group_id << " is not registered, using "
               << QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID;
    return QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID;
  }
  return group_id;
}

AdmissionDecision QueryGroupService::Admit(const string& group_id) {
  return admission_controller_.Admit(ResolveGroupId(group_id));
}

Status QueryGroupService::StartQuery(const string& query_id, const string& group_id,
    shared_ptr<QueryExecutionContext>* query) {
  DCHECK(query != nullptr);
  string resolved_id = ResolveGroupId(group_id);
  AdmissionDecision decision = admission_controller_.Admit(resolved_id);
  RETURN_IF_ERROR(decision.ToStatus(resolved_id));

  shared_ptr<QueryGroupState> state = registry_.AcquireForQuery(resolved_id);
  if (state == nullptr) {
    // The group was deregistered between admission and now.
    resolved_id = QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID;
    state = registry_.AcquireForQuery(resolved_id);
  }
  DCHECK(state != nullptr);
  shared_ptr<QueryExecutionContext> ctx =
      make_shared<QueryExecutionContext>(query_id, move(state), &registry_);
  Status status = running_queries_.Register(ctx);
  if (!status.ok()) {
    // Not started, so neither a completion nor a failure of the group.
    ctx->ReleaseResources();
    return status;
  }
  VLOG_QUERY << "Started query " << query_id << " in query group " << resolved_id;
  *query = move(ctx);
  return Status::OK();
}

void QueryGroupService::FinishQuery(QueryExecutionContext* query, const Status& outcome) {
  DCHECK(query != nullptr);
  query->Finish(outcome);
  running_queries_.Unregister(query->query_id());
}

void QueryGroupService::IncrementFailures(const string& group_id) {
  shared_ptr<QueryGroupState> state = registry_.Get(group_id);
  if (state == nullptr || state->pending_removal()) {
    VLOG_QUERY << "Ignoring failure of unknown query group " << group_id;
    return;
  }
  state->IncrementFailures();
}

Status QueryGroupService::GetStats(const string& group_id, QueryGroupStats* stats) const {
  DCHECK(stats != nullptr);
  shared_ptr<QueryGroupState> state = registry_.Get(group_id);
  if (state == nullptr) {
    return Status::Expected(ErrorCode::QUERY_GROUP_NOT_FOUND, group_id);
  }
  *stats = QueryGroupStats::Create(*state, tracker_);
  return Status::OK();
}

bool QueryGroupService::IsLimitBreached(const QueryGroupState& state) const {
  shared_ptr<const QueryGroupConfig> config = configs_.Get(state.group_id());
  if (config == nullptr) return false;
  for (ResourceType t : state.tracked_resources().types()) {
    if (!config->has_hard_limit(t)) continue;
    double limit = config->hard_limit(t) * settings_.cancellation_threshold(t);
    if (state.resource_state(t)->last_recorded_usage() > limit) return true;
  }
  return false;
}

void QueryGroupService::GetNodeStats(const vector<string>& group_ids,
    BreachFilter filter, vector<QueryGroupStats>* stats) const {
  DCHECK(stats != nullptr);
  stats->clear();
  bool all = group_ids.empty()
      || find(group_ids.begin(), group_ids.end(), ALL_GROUPS) != group_ids.end();
  vector<shared_ptr<QueryGroupState>> states;
  if (all) {
    states = registry_.GetAll();
  } else {
    for (const string& id : group_ids) {
      shared_ptr<QueryGroupState> state = registry_.Get(id);
      if (state != nullptr) states.push_back(state);
    }
  }
  for (const shared_ptr<QueryGroupState>& state : states) {
    if (filter != BreachFilter::ALL) {
      bool breached = IsLimitBreached(*state);
      if (breached != (filter == BreachFilter::BREACHED)) continue;
    }
    stats->push_back(QueryGroupStats::Create(*state, tracker_));
  }
  sort(stats->begin(), stats->end(),
      [](const QueryGroupStats& a, const QueryGroupStats& b) {
        return a.group_id < b.group_id;
      });
  // The same id may have been requested twice.
  stats->erase(unique(stats->begin(), stats->end(),
      [](const QueryGroupStats& a, const QueryGroupStats& b) {
        return a.group_id == b.group_id;
      }), stats->end());
}

string QueryGroupService::GetNodeStatsJson(
    const vector<string>& group_ids, BreachFilter filter) const {
  vector<QueryGroupStats> stats;
  GetNodeStats(group_ids, filter, &stats);
  return QueryGroupStatsToJson(stats);
}

}
