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

#include "wlm/query-group-state.h"

#include <sstream>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {

QueryGroupState::QueryGroupState(
    const string& group_id, const TrackedResourceSet& tracked)
  : group_id_(group_id), tracked_(tracked) {
  for (ResourceType t : tracked_.types()) {
    resource_states_[ResourceTypeIndex(t)].reset(new ResourceTypeState(t));
  }
}

void QueryGroupState::RecordRejection(ResourceType type) {
  total_rejections_.Add(1);
  ResourceTypeState* state = resource_state(type);
  DCHECK(state != nullptr) << "Rejection for untracked resource "
                           << ResourceTypeToString(type);
  if (state != nullptr) state->IncrementRejections();
}

void QueryGroupState::RecordCancellation(const ResourceType* type) {
  total_cancellations_.Add(1);
  if (type == nullptr) return;
  ResourceTypeState* state = resource_state(*type);
  DCHECK(state != nullptr) << "Cancellation for untracked resource "
                           << ResourceTypeToString(*type);
  if (state != nullptr) state->IncrementCancellations();
}

string QueryGroupState::DebugString() const {
  stringstream ss;
  ss << "QueryGroupState(id=" << group_id_ << " completions=" << completions()
     << " rejections=" << total_rejections() << " failures=" << failures()
     << " cancellations=" << total_cancellations()
     << " active_queries=" << active_queries()
     << " pending_removal=" << pending_removal();
  for (ResourceType t : tracked_.types()) {
    const ResourceTypeState* state = resource_state(t);
    ss << " " << ResourceTypeToString(t) << "={usage=" << state->usage()
       << " cancellations=" << state->cancellations()
       << " rejections=" << state->rejections()
       << " last_recorded_usage=" << state->last_recorded_usage() << "}";
  }
  ss << ")";
  return ss.str();
}

}
