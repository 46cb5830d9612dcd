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

#ifndef WLM_WLM_QUERY_GROUP_SERVICE_H
#define WLM_WLM_QUERY_GROUP_SERVICE_H

#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "wlm/admission-controller.h"
#include "wlm/query-execution-context.h"
#include "wlm/query-group-config.h"
#include "wlm/query-group-enforcer.h"
#include "wlm/query-group-registry.h"
#include "wlm/query-group-stats.h"
#include "wlm/resource-usage-tracker.h"
#include "wlm/running-query-map.h"
#include "wlm/workload-management-settings.h"

namespace wlm {

/// Entry point of query group workload management on one node. Owns the registry,
/// the group configurations, the usage tracker, admission control and the enforcement
/// loop, and hands the same instances to each of them.
///
/// Query lifecycle:
///   shared_ptr<QueryExecutionContext> query;
///   RETURN_IF_ERROR(service->StartQuery(query_id, group_id, &query));
///   ... query->UpdateUsage(...), poll query->cancellation_token() ...
///   service->FinishQuery(query.get(), status);
///
/// Group ids that are not registered are executed in the default query group.
class QueryGroupService {
 public:
  /// Selects groups by whether they exceed a hard limit according to their last
  /// recorded usage.
  enum class BreachFilter {
    ALL,
    BREACHED,
    NOT_BREACHED,
  };

  /// Group id list that selects every group in GetNodeStats().
  static const char* const ALL_GROUPS;

  /// Tracks queries in an internal RunningQueryMap.
  QueryGroupService(const WorkloadManagementSettings& settings,
      NodeDuressFn node_duress_fn = NodeDuressFn());

  ~QueryGroupService();

  /// Validates the settings and starts the enforcement loop.
  Status Init() WARN_UNUSED_RESULT;

  /// Stops the enforcement loop.
  void Shutdown();

  /// Adds or replaces the configuration of a query group and creates its state.
  Status RegisterQueryGroup(const QueryGroupConfig& config) WARN_UNUSED_RESULT;

  /// Deletes the configuration of 'group_id' and removes its state once its running
  /// queries finished. Returns QUERY_GROUP_NOT_FOUND if the group is not registered.
  Status DeregisterQueryGroup(const std::string& group_id) WARN_UNUSED_RESULT;

  /// Resolves 'group_id' (empty or unknown ids map to the default group) and runs
  /// admission control for it.
  AdmissionDecision Admit(const std::string& group_id);

  /// Admits a query and creates its execution context. Returns the rejection as a
  /// QUERY_GROUP_REJECTED error, or QUERY_ALREADY_REGISTERED if 'query_id' is running.
  Status StartQuery(const std::string& query_id, const std::string& group_id,
      std::shared_ptr<QueryExecutionContext>* query) WARN_UNUSED_RESULT;

  /// Records how 'query' ended, releases its resources and forgets it.
  void FinishQuery(QueryExecutionContext* query, const Status& outcome);

  /// Counts a failed request of 'group_id'. Ignored for unknown or removed groups.
  void IncrementFailures(const std::string& group_id);

  /// Snapshot of the counters of 'group_id'. Returns QUERY_GROUP_NOT_FOUND if it is
  /// not registered.
  Status GetStats(const std::string& group_id, QueryGroupStats* stats) const
      WARN_UNUSED_RESULT;

  /// Snapshots of the groups named in 'group_ids' (or of all groups if 'group_ids'
  /// contains ALL_GROUPS or is empty), restricted by 'filter'. Unknown ids are skipped.
  /// The result is ordered by group id.
  void GetNodeStats(const std::vector<std::string>& group_ids, BreachFilter filter,
      std::vector<QueryGroupStats>* stats) const;

  /// Same as GetNodeStats(), rendered as JSON.
  std::string GetNodeStatsJson(
      const std::vector<std::string>& group_ids, BreachFilter filter) const;

  /// True if the last recorded usage of 'state' exceeds one of the hard limits of its
  /// group, scaled by the node cancellation threshold.
  bool IsLimitBreached(const QueryGroupState& state) const;

  /// Returns the id queries of 'group_id' are accounted to.
  std::string ResolveGroupId(const std::string& group_id) const;

  QueryGroupRegistry* registry() { return &registry_; }
  InMemoryQueryGroupConfigStore* configs() { return &configs_; }
  RunningQueryMap* running_queries() { return &running_queries_; }
  const ResourceUsageTracker* tracker() const { return &tracker_; }
  AdmissionController* admission_controller() { return &admission_controller_; }
  QueryGroupEnforcer* enforcer() { return &enforcer_; }

 private:
  const WorkloadManagementSettings settings_;
  QueryGroupRegistry registry_;
  InMemoryQueryGroupConfigStore configs_;
  RunningQueryMap running_queries_;
  ResourceUsageTracker tracker_;
  AdmissionController admission_controller_;
  QueryGroupEnforcer enforcer_;
};

}

#endif
