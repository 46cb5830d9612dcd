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

#include "wlm/resource-usage-tracker.h"

#include <cmath>
#include <limits>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {

ResourceUsageTracker::ResourceUsageTracker(
    QueryGroupRegistry* registry, const WorkloadManagementSettings& settings)
  : registry_(registry), settings_(settings) {
  DCHECK(registry_ != nullptr);
}

void ResourceUsageTracker::Attribute(
    const string& group_id, ResourceType type, int64_t delta) {
  shared_ptr<QueryGroupState> state = registry_->Get(group_id);
  if (state == nullptr) {
    VLOG_ROW << "Dropped " << ResourceTypeToString(type) << " usage " << delta
             << " of unknown query group " << group_id;
    return;
  }
  Attribute(state.get(), type, delta);
}

void ResourceUsageTracker::Attribute(
    QueryGroupState* state, ResourceType type, int64_t delta) {
  DCHECK(state != nullptr);
  ResourceTypeState* resource_state = state->resource_state(type);
  if (resource_state == nullptr || delta == 0) return;
  // May be briefly negative while the release of a query races with its last update.
  int64_t new_usage = resource_state->AddUsage(delta);
  VLOG_ROW << "Query group " << state->group_id() << " " << ResourceTypeToString(type)
           << " usage " << delta << " -> " << new_usage;
}

int64_t ResourceUsageTracker::CurrentUsage(
    const string& group_id, ResourceType type) const {
  shared_ptr<QueryGroupState> state = registry_->Get(group_id);
  if (state == nullptr) return 0;
  return state->usage(type);
}

double ResourceUsageTracker::UsageFraction(
    const QueryGroupState& state, ResourceType type) const {
  int64_t capacity = settings_.capacity(type);
  if (capacity <= 0) return 0;
  return static_cast<double>(state.usage(type)) / static_cast<double>(capacity);
}

int64_t ResourceUsageTracker::FractionToUnits(ResourceType type, double fraction) const {
  int64_t capacity = settings_.capacity(type);
  if (capacity <= 0) return std::numeric_limits<int64_t>::max();
  double capacity_d = static_cast<double>(capacity);
  // The product may round below the exact value, e.g. 0.29 * 100 is 28.999...
  int64_t units = static_cast<int64_t>(std::floor(fraction * capacity_d));
  while (static_cast<double>(units + 1) / capacity_d <= fraction) ++units;
  while (units > 0 && static_cast<double>(units) / capacity_d > fraction) --units;
  return units;
}

}
