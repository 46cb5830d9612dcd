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

#ifndef WLM_WLM_WORKLOAD_MANAGEMENT_SETTINGS_H
#define WLM_WLM_WORKLOAD_MANAGEMENT_SETTINGS_H

#include <stdint.h>
#include <functional>
#include <string>

#include "common/status.h"
#include "wlm/resource-type.h"

namespace wlm {

/// Returns true while the node is in duress, i.e. short of some resource as a whole.
/// Called on the admission path and by the enforcement loop, so it must not block.
typedef std::function<bool ()> NodeDuressFn;

/// Node level settings shared by admission control and enforcement. Built from the
/// --wlm_* flags by FromFlags(); tests construct and adjust it directly.
///
/// A query group's effective limit for a resource is its configured hard limit scaled
/// by the node level threshold for that resource: admission uses the rejection
/// threshold, the enforcement loop the cancellation threshold. With the default of 1.0
/// both use the configured limit unchanged.
struct WorkloadManagementSettings {
  WorkloadManagementSettings();

  /// Snapshots the --wlm_* flags. Capacities left at 0 are derived from CpuInfo and
  /// MemInfo, which must have been initialized.
  static WorkloadManagementSettings FromFlags();

  /// Returns INVALID_FLAG_VALUE naming the first out of range setting.
  Status Validate() const;

  double rejection_threshold(ResourceType type) const {
    return node_rejection_threshold[ResourceTypeIndex(type)];
  }

  double cancellation_threshold(ResourceType type) const {
    return node_cancellation_threshold[ResourceTypeIndex(type)];
  }

  int64_t capacity(ResourceType type) const {
    return node_capacity[ResourceTypeIndex(type)];
  }

  std::string DebugString() const;

  /// Resource types whose stats are enabled.
  TrackedResourceSet tracked_resources;

  /// Time between the starts of two consecutive enforcement cycles.
  int64_t enforcement_interval_ms;

  /// Maximum number of queries cancelled by one enforcement cycle. 0 means no limit.
  int32_t max_cancellations_per_cycle;

  /// Fractions in (0, 1], indexed by ResourceType.
  double node_rejection_threshold[NUM_RESOURCE_TYPES];
  double node_cancellation_threshold[NUM_RESOURCE_TYPES];

  /// Total capacity of the node, indexed by ResourceType: millicores for CPU, bytes
  /// for MEMORY.
  int64_t node_capacity[NUM_RESOURCE_TYPES];
};

}

#endif
