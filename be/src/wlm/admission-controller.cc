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

#include "wlm/admission-controller.h"

#include <sstream>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {

Status AdmissionDecision::ToStatus(const string& group_id) const {
  if (admitted()) return Status::OK();
  return Status::Expected(ErrorCode::QUERY_GROUP_REJECTED, group_id,
      ResourceTypeToString(reason), usage, limit);
}

string AdmissionDecision::DebugString() const {
  stringstream ss;
  if (admitted()) {
    ss << "ADMITTED" << (degraded ? " (degraded)" : "");
  } else {
    ss << "REJECTED(" << ResourceTypeToString(reason) << " usage=" << usage
       << " limit=" << limit << ")";
  }
  return ss.str();
}

AdmissionController::AdmissionController(QueryGroupRegistry* registry,
    const QueryGroupConfigProvider* configs, const ResourceUsageTracker* tracker,
    const WorkloadManagementSettings& settings, NodeDuressFn node_duress_fn)
  : registry_(registry),
    configs_(configs),
    tracker_(tracker),
    settings_(settings),
    node_duress_fn_(move(node_duress_fn)) {
  DCHECK(registry_ != nullptr);
  DCHECK(configs_ != nullptr);
  DCHECK(tracker_ != nullptr);
}

AdmissionDecision AdmissionController::AdmitDegraded(
    const string& group_id, const char* what) {
  num_degraded_admissions_.Add(1);
  LOG_EVERY_N(WARNING, 100) << "Admitting query of query group " << group_id
                            << " without limits: " << what << " ("
                            << google::COUNTER << " occurrences)";
  return AdmissionDecision::Admit(true);
}

AdmissionDecision AdmissionController::Admit(const string& group_id) {
  // The default group has no limits by definition.
  if (group_id == QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID) {
    return AdmissionDecision::Admit();
  }
  shared_ptr<QueryGroupState> state = registry_->Get(group_id);
  if (state == nullptr) return AdmitDegraded(group_id, "the group is not registered");
  shared_ptr<const QueryGroupConfig> config = configs_->Get(group_id);
  if (config == nullptr) {
    return AdmitDegraded(group_id, "the group configuration is unavailable");
  }

  switch (config->mode) {
    case ResiliencyMode::MONITOR:
      return AdmissionDecision::Admit();
    case ResiliencyMode::SOFT:
      if (!node_duress_fn_ || !node_duress_fn_()) return AdmissionDecision::Admit();
      break;
    case ResiliencyMode::ENFORCED:
      break;
  }

  for (ResourceType t : state->tracked_resources().types()) {
    if (!config->has_hard_limit(t)) continue;
    double limit = config->hard_limit(t) * settings_.rejection_threshold(t);
    double usage = tracker_->UsageFraction(*state, t);
    if (usage > limit) {
      state->RecordRejection(t);
      AdmissionDecision decision = AdmissionDecision::Reject(t, usage, limit);
      VLOG_QUERY << "Query group " << group_id << ": " << decision.DebugString();
      return decision;
    }
  }
  return AdmissionDecision::Admit();
}

}
