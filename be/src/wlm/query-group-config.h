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

#ifndef WLM_WLM_QUERY_GROUP_CONFIG_H
#define WLM_WLM_QUERY_GROUP_CONFIG_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/status.h"
#include "wlm/resource-type.h"

namespace wlm {

/// How a query group's limits are applied.
///   ENFORCED: new queries are rejected and running queries are cancelled when the
///             group exceeds a hard limit.
///   SOFT:     limits are only applied while the node is in duress.
///   MONITOR:  usage is tracked and reported, nothing is rejected or cancelled.
enum class ResiliencyMode {
  ENFORCED,
  SOFT,
  MONITOR,
};

const char* ResiliencyModeToString(ResiliencyMode mode);

/// Parses "enforced", "soft" or "monitor" (case insensitive).
bool ResiliencyModeFromString(const std::string& name, ResiliencyMode* mode);

/// Configuration of one query group. Limits are fractions of the node capacity of a
/// resource; a negative value means that no limit is configured for that resource.
/// The hard limit is the one admission control and enforcement act on. The soft limit
/// is an early warning level which is only reported in the stats.
struct QueryGroupConfig {
  static constexpr double NO_LIMIT = -1.0;

  QueryGroupConfig();
  QueryGroupConfig(const std::string& id, ResiliencyMode mode);

  /// Fluent setters for tests and embedders.
  QueryGroupConfig& SetHardLimit(ResourceType type, double fraction) {
    hard_limits[ResourceTypeIndex(type)] = fraction;
    return *this;
  }
  QueryGroupConfig& SetSoftLimit(ResourceType type, double fraction) {
    soft_limits[ResourceTypeIndex(type)] = fraction;
    return *this;
  }

  bool has_hard_limit(ResourceType type) const {
    return hard_limits[ResourceTypeIndex(type)] > 0;
  }
  double hard_limit(ResourceType type) const {
    return hard_limits[ResourceTypeIndex(type)];
  }
  bool has_soft_limit(ResourceType type) const {
    return soft_limits[ResourceTypeIndex(type)] > 0;
  }
  double soft_limit(ResourceType type) const {
    return soft_limits[ResourceTypeIndex(type)];
  }

  /// Returns QUERY_GROUP_INVALID_CONFIG if the id is empty, a configured limit is not
  /// in (0, 1] or a soft limit is above the hard limit of the same resource.
  Status Validate() const;

  std::string DebugString() const;

  std::string id;
  ResiliencyMode mode;
  double soft_limits[NUM_RESOURCE_TYPES];
  double hard_limits[NUM_RESOURCE_TYPES];
};

/// Source of query group configurations. The configuration of a group may be briefly
/// unavailable (e.g. while it is being replicated to this node), callers must treat a
/// missing configuration as "no limits".
class QueryGroupConfigProvider {
 public:
  virtual ~QueryGroupConfigProvider() {}

  /// Returns the current configuration of 'group_id' or nullptr if there is none.
  /// Must not block on I/O, it is called on the admission path.
  virtual std::shared_ptr<const QueryGroupConfig> Get(
      const std::string& group_id) const = 0;
};

/// QueryGroupConfigProvider keeping the configurations in memory. Readers work on an
/// immutable snapshot of all configurations and only hold a lock long enough to copy a
/// shared_ptr; updates copy the snapshot, modify the copy and publish it.
class InMemoryQueryGroupConfigStore : public QueryGroupConfigProvider {
 public:
  typedef std::map<std::string, std::shared_ptr<const QueryGroupConfig>> ConfigMap;
  typedef std::shared_ptr<const ConfigMap> SnapshotPtr;

  InMemoryQueryGroupConfigStore();

  /// Adds or replaces the configuration of 'config.id' after validating it.
  Status Put(const QueryGroupConfig& config) WARN_UNUSED_RESULT;

  /// Removes the configuration of 'group_id'. Returns false if there was none.
  bool Remove(const std::string& group_id);

  std::shared_ptr<const QueryGroupConfig> Get(
      const std::string& group_id) const override;

  /// Returns the current immutable set of configurations.
  SnapshotPtr GetSnapshot() const;

 private:
  void SetSnapshot(const SnapshotPtr& new_snapshot);

  /// Serializes Put() and Remove().
  std::mutex update_lock_;

  /// Protects 'current_configs_'. Only held to copy or replace the pointer.
  mutable std::mutex current_configs_lock_;
  SnapshotPtr current_configs_;
};

}

#endif
