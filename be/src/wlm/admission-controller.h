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

#ifndef WLM_WLM_ADMISSION_CONTROLLER_H
#define WLM_WLM_ADMISSION_CONTROLLER_H

#include <string>

#include "common/atomic.h"
#include "common/status.h"
#include "wlm/query-group-config.h"
#include "wlm/query-group-registry.h"
#include "wlm/resource-usage-tracker.h"
#include "wlm/workload-management-settings.h"

namespace wlm {

enum class AdmissionOutcome {
  ADMITTED,
  REJECTED,
};

/// Result of AdmissionController::Admit(). For a rejection, 'reason' is the resource
/// whose limit was exceeded and 'usage'/'limit' are the fractions of node capacity
/// that were compared.
struct AdmissionDecision {
  static AdmissionDecision Admit(bool degraded = false) {
    AdmissionDecision decision;
    decision.degraded = degraded;
    return decision;
  }

  static AdmissionDecision Reject(ResourceType reason, double usage, double limit) {
    AdmissionDecision decision;
    decision.outcome = AdmissionOutcome::REJECTED;
    decision.reason = reason;
    decision.usage = usage;
    decision.limit = limit;
    return decision;
  }

  bool admitted() const { return outcome == AdmissionOutcome::ADMITTED; }

  /// OK if admitted, otherwise a QUERY_GROUP_REJECTED error for 'group_id' that
  /// callers can return to the client as retryable.
  Status ToStatus(const std::string& group_id) const;

  std::string DebugString() const;

  AdmissionOutcome outcome = AdmissionOutcome::ADMITTED;
  ResourceType reason = ResourceType::CPU;
  double usage = 0;
  double limit = 0;

  /// True if the query was admitted without evaluating limits because the group or
  /// its configuration was not available.
  bool degraded = false;
};

/// Decides synchronously, on the thread submitting the query, whether a new query of
/// a query group may start.
///
/// A query is rejected if its group is ENFORCED (or SOFT while the node is in duress)
/// and the group's current usage of any tracked resource, as a fraction of node
/// capacity, is above the group's hard limit for that resource scaled by the node
/// rejection threshold. Rejections are counted on the group state.
///
/// Admission fails open: a group that is not registered or has no configuration is
/// admitted. Such admissions are logged and counted as degraded.
///
/// Admit() does no I/O and takes no lock other than the registry shard lock.
class AdmissionController {
 public:
  /// 'node_duress_fn' may be empty, in which case the node is never in duress.
  AdmissionController(QueryGroupRegistry* registry,
      const QueryGroupConfigProvider* configs, const ResourceUsageTracker* tracker,
      const WorkloadManagementSettings& settings, NodeDuressFn node_duress_fn);

  AdmissionDecision Admit(const std::string& group_id);

  /// Number of queries admitted without a group state or configuration.
  int64_t num_degraded_admissions() const { return num_degraded_admissions_.Load(); }

 private:
  /// Logs and counts an admission without configuration.
  AdmissionDecision AdmitDegraded(const std::string& group_id, const char* what);

  QueryGroupRegistry* const registry_;
  const QueryGroupConfigProvider* const configs_;
  const ResourceUsageTracker* const tracker_;
  const WorkloadManagementSettings settings_;
  const NodeDuressFn node_duress_fn_;

  AtomicInt64 num_degraded_admissions_;
};

}

#endif
