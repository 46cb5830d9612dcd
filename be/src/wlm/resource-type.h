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

#ifndef WLM_WLM_RESOURCE_TYPE_H
#define WLM_WLM_RESOURCE_TYPE_H

#include <stdint.h>
#include <string>
#include <vector>

namespace wlm {

/// The closed set of node resources that query groups are measured against. Values are
/// used as indexes into fixed size per-resource arrays.
/// CPU usage is tracked in millicores (1000 == one fully busy core), MEMORY usage in
/// bytes.
enum class ResourceType {
  CPU = 0,
  MEMORY = 1,
};

constexpr int NUM_RESOURCE_TYPES = 2;

/// All resource types in index order.
extern const ResourceType ALL_RESOURCE_TYPES[NUM_RESOURCE_TYPES];

inline int ResourceTypeIndex(ResourceType type) { return static_cast<int>(type); }

/// Lower case name, e.g. "cpu". Used in error messages and the stats JSON.
const char* ResourceTypeToString(ResourceType type);

/// Parses a name produced by ResourceTypeToString() (case insensitive). Returns false
/// if 'name' is not a resource type.
bool ResourceTypeFromString(const std::string& name, ResourceType* type);

/// Converts a query's consumed CPU time over a wall clock interval into millicores, the
/// unit the CPU usage of a query group is tracked in. Returns 0 if 'elapsed_ns' is not
/// positive.
int64_t CpuTimeToMillicores(int64_t cpu_time_ns, int64_t elapsed_ns);

/// The set of resource types whose statistics are enabled on this node. The set is
/// decided once, when the registry is constructed, and every QueryGroupState created by
/// that registry tracks exactly these types.
class TrackedResourceSet {
 public:
  /// Empty set.
  TrackedResourceSet() : mask_(0) {}

  /// Set containing every resource type.
  static TrackedResourceSet All();

  /// Set built from the --wlm_cpu_stats_enabled and --wlm_memory_stats_enabled flags.
  static TrackedResourceSet FromFlags();

  TrackedResourceSet& Add(ResourceType type) {
    mask_ |= 1u << ResourceTypeIndex(type);
    return *this;
  }

  bool Contains(ResourceType type) const {
    return (mask_ & (1u << ResourceTypeIndex(type))) != 0;
  }

  bool empty() const { return mask_ == 0; }

  /// The tracked types in index order.
  std::vector<ResourceType> types() const;

  std::string DebugString() const;

  bool operator==(const TrackedResourceSet& other) const { return mask_ == other.mask_; }

 private:
  uint32_t mask_;
};

}

#endif
