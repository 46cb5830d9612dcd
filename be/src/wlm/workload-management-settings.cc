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

#include "wlm/workload-management-settings.h"

#include <sstream>

#include "common/logging.h"
#include "util/cpu-info.h"
#include "util/mem-info.h"

#include "common/names.h"

DEFINE_int64(wlm_enforcement_interval_ms, 1000, "Interval in milliseconds between the "
    "starts of two query group enforcement cycles. A cycle that runs longer than the "
    "interval causes the following cycles to be skipped, cycles never overlap.");
DEFINE_int32(wlm_max_cancellations_per_cycle, 0, "Maximum number of queries a single "
    "query group enforcement cycle may cancel across all query groups. 0 means no "
    "limit.");
DEFINE_double(wlm_node_cpu_rejection_threshold, 1.0, "Fraction in (0, 1] applied to the "
    "CPU limit of every query group when deciding whether to reject new queries.");
DEFINE_double(wlm_node_memory_rejection_threshold, 1.0, "Fraction in (0, 1] applied to "
    "the memory limit of every query group when deciding whether to reject new "
    "queries.");
DEFINE_double(wlm_node_cpu_cancellation_threshold, 1.0, "Fraction in (0, 1] applied to "
    "the CPU limit of every query group when deciding whether to cancel running "
    "queries.");
DEFINE_double(wlm_node_memory_cancellation_threshold, 1.0, "Fraction in (0, 1] applied "
    "to the memory limit of every query group when deciding whether to cancel running "
    "queries.");
DEFINE_int64(wlm_node_cpu_capacity_millicores, 0, "(Advanced) CPU capacity of this node "
    "in millicores that query group CPU limits are fractions of. If 0, the number of "
    "cores times 1000 is used.");
DEFINE_int64(wlm_node_memory_capacity_bytes, 0, "(Advanced) Memory capacity of this "
    "node in bytes that query group memory limits are fractions of. If 0, the physical "
    "memory of the machine is used.");

namespace wlm {

namespace {

Status ValidateThreshold(double value, const char* flag_name) {
  if (value <= 0 || value > 1.0) {
    return Status(ErrorCode::INVALID_FLAG_VALUE, value, flag_name,
        "must be greater than 0 and at most 1");
  }
  return Status::OK();
}

}

WorkloadManagementSettings::WorkloadManagementSettings()
  : tracked_resources(TrackedResourceSet::All()),
    enforcement_interval_ms(1000),
    max_cancellations_per_cycle(0) {
  for (int i = 0; i < NUM_RESOURCE_TYPES; ++i) {
    node_rejection_threshold[i] = 1.0;
    node_cancellation_threshold[i] = 1.0;
    node_capacity[i] = 0;
  }
}

WorkloadManagementSettings WorkloadManagementSettings::FromFlags() {
  WorkloadManagementSettings settings;
  settings.tracked_resources = TrackedResourceSet::FromFlags();
  settings.enforcement_interval_ms = FLAGS_wlm_enforcement_interval_ms;
  settings.max_cancellations_per_cycle = FLAGS_wlm_max_cancellations_per_cycle;

  const int cpu = ResourceTypeIndex(ResourceType::CPU);
  const int mem = ResourceTypeIndex(ResourceType::MEMORY);
  settings.node_rejection_threshold[cpu] = FLAGS_wlm_node_cpu_rejection_threshold;
  settings.node_rejection_threshold[mem] = FLAGS_wlm_node_memory_rejection_threshold;
  settings.node_cancellation_threshold[cpu] = FLAGS_wlm_node_cpu_cancellation_threshold;
  settings.node_cancellation_threshold[mem] =
      FLAGS_wlm_node_memory_cancellation_threshold;

  settings.node_capacity[cpu] = FLAGS_wlm_node_cpu_capacity_millicores > 0 ?
      FLAGS_wlm_node_cpu_capacity_millicores : CpuInfo::num_cores() * 1000L;
  settings.node_capacity[mem] = FLAGS_wlm_node_memory_capacity_bytes > 0 ?
      FLAGS_wlm_node_memory_capacity_bytes : MemInfo::physical_mem();
  return settings;
}

Status WorkloadManagementSettings::Validate() const {
  if (enforcement_interval_ms <= 0) {
    return Status(ErrorCode::INVALID_FLAG_VALUE, enforcement_interval_ms,
        "wlm_enforcement_interval_ms", "must be positive");
  }
  if (max_cancellations_per_cycle < 0) {
    return Status(ErrorCode::INVALID_FLAG_VALUE, max_cancellations_per_cycle,
        "wlm_max_cancellations_per_cycle", "must not be negative");
  }
  const int cpu = ResourceTypeIndex(ResourceType::CPU);
  const int mem = ResourceTypeIndex(ResourceType::MEMORY);
  RETURN_IF_ERROR(ValidateThreshold(
      node_rejection_threshold[cpu], "wlm_node_cpu_rejection_threshold"));
  RETURN_IF_ERROR(ValidateThreshold(
      node_rejection_threshold[mem], "wlm_node_memory_rejection_threshold"));
  RETURN_IF_ERROR(ValidateThreshold(
      node_cancellation_threshold[cpu], "wlm_node_cpu_cancellation_threshold"));
  RETURN_IF_ERROR(ValidateThreshold(
      node_cancellation_threshold[mem], "wlm_node_memory_cancellation_threshold"));
  // Only tracked resources need a capacity to be measured against.
  if (tracked_resources.Contains(ResourceType::CPU) && node_capacity[cpu] <= 0) {
    return Status(ErrorCode::INVALID_FLAG_VALUE, node_capacity[cpu],
        "wlm_node_cpu_capacity_millicores", "CPU capacity of the node must be positive");
  }
  if (tracked_resources.Contains(ResourceType::MEMORY) && node_capacity[mem] <= 0) {
    return Status(ErrorCode::INVALID_FLAG_VALUE, node_capacity[mem],
        "wlm_node_memory_capacity_bytes",
        "memory capacity of the node must be positive");
  }
  return Status::OK();
}

string WorkloadManagementSettings::DebugString() const {
  stringstream ss;
  ss << "tracked=" << tracked_resources.DebugString()
     << " interval_ms=" << enforcement_interval_ms
     << " max_cancellations_per_cycle=" << max_cancellations_per_cycle;
  for (ResourceType t : ALL_RESOURCE_TYPES) {
    ss << " " << ResourceTypeToString(t) << "={capacity=" << capacity(t)
       << " rejection_threshold=" << rejection_threshold(t)
       << " cancellation_threshold=" << cancellation_threshold(t) << "}";
  }
  return ss.str();
}

}
