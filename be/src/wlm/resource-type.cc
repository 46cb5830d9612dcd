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

#include "wlm/resource-type.h"

#include <sstream>
#include <boost/algorithm/string/predicate.hpp>

#include "common/logging.h"

#include "common/names.h"

DEFINE_bool(wlm_cpu_stats_enabled, true, "If true, CPU usage is tracked per query "
    "group and query groups with a CPU limit are subject to admission control and "
    "cancellation on this node.");
DEFINE_bool(wlm_memory_stats_enabled, true, "If true, memory usage is tracked per query "
    "group and query groups with a memory limit are subject to admission control and "
    "cancellation on this node.");

namespace wlm {

const ResourceType ALL_RESOURCE_TYPES[NUM_RESOURCE_TYPES] = {
  ResourceType::CPU, ResourceType::MEMORY};

const char* ResourceTypeToString(ResourceType type) {
  switch (type) {
    case ResourceType::CPU: return "cpu";
    case ResourceType::MEMORY: return "memory";
  }
  DCHECK(false) << "Unknown resource type " << static_cast<int>(type);
  return "unknown";
}

bool ResourceTypeFromString(const string& name, ResourceType* type) {
  for (ResourceType t : ALL_RESOURCE_TYPES) {
    if (boost::algorithm::iequals(name, ResourceTypeToString(t))) {
      *type = t;
      return true;
    }
  }
  return false;
}

int64_t CpuTimeToMillicores(int64_t cpu_time_ns, int64_t elapsed_ns) {
  if (elapsed_ns <= 0 || cpu_time_ns <= 0) return 0;
  // Compute in floating point, cpu_time_ns * 1000 overflows after ~106 days of CPU.
  return static_cast<int64_t>(
      static_cast<double>(cpu_time_ns) * 1000.0 / static_cast<double>(elapsed_ns));
}

TrackedResourceSet TrackedResourceSet::All() {
  TrackedResourceSet set;
  for (ResourceType t : ALL_RESOURCE_TYPES) set.Add(t);
  return set;
}

TrackedResourceSet TrackedResourceSet::FromFlags() {
  TrackedResourceSet set;
  if (FLAGS_wlm_cpu_stats_enabled) set.Add(ResourceType::CPU);
  if (FLAGS_wlm_memory_stats_enabled) set.Add(ResourceType::MEMORY);
  return set;
}

vector<ResourceType> TrackedResourceSet::types() const {
  vector<ResourceType> result;
  for (ResourceType t : ALL_RESOURCE_TYPES) {
    if (Contains(t)) result.push_back(t);
  }
  return result;
}

string TrackedResourceSet::DebugString() const {
  stringstream ss;
  ss << "[";
  bool first = true;
  for (ResourceType t : types()) {
    if (!first) ss << ", ";
    ss << ResourceTypeToString(t);
    first = false;
  }
  ss << "]";
  return ss.str();
}

}
