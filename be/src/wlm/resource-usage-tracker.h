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

#ifndef WLM_WLM_RESOURCE_USAGE_TRACKER_H
#define WLM_WLM_RESOURCE_USAGE_TRACKER_H

#include <stdint.h>
#include <string>

#include "wlm/query-group-registry.h"
#include "wlm/resource-type.h"
#include "wlm/workload-management-settings.h"

namespace wlm {

/// Attributes resource consumption to (query group, resource type) pairs and reads it
/// back, absolute or as a fraction of node capacity.
///
/// Each pair has its own atomic accumulator inside the group's ResourceTypeState, so
/// attributions to different groups or resources never contend. Reads are not
/// linearizable with concurrent attributions; they return the value of some recent
/// point in time.
///
/// Running queries normally attribute through their QueryExecutionContext, which holds
/// the group state and does not need the registry lookup done by Attribute().
class ResourceUsageTracker {
 public:
  ResourceUsageTracker(
      QueryGroupRegistry* registry, const WorkloadManagementSettings& settings);

  /// Adds the signed 'delta' to the usage of 'type' by 'group_id'. Does nothing if
  /// the group is not registered or 'type' is not tracked.
  void Attribute(const std::string& group_id, ResourceType type, int64_t delta);

  /// Same as above for a state the caller already holds.
  static void Attribute(QueryGroupState* state, ResourceType type, int64_t delta);

  /// Returns the current usage of 'type' by 'group_id', 0 if the group is not
  /// registered or 'type' is not tracked.
  int64_t CurrentUsage(const std::string& group_id, ResourceType type) const;

  /// Returns the usage of 'type' by 'state' as a fraction of the node capacity.
  double UsageFraction(const QueryGroupState& state, ResourceType type) const;

  /// Returns the largest usage of 'type', in units of 'type', whose UsageFraction()
  /// does not exceed 'fraction'. A usage above the result is exactly a usage whose
  /// fraction compares greater than 'fraction'.
  int64_t FractionToUnits(ResourceType type, double fraction) const;

  int64_t capacity(ResourceType type) const { return settings_.capacity(type); }

 private:
  QueryGroupRegistry* const registry_;
  const WorkloadManagementSettings settings_;
};

}

#endif
