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

#include "wlm/query-group-config.h"

#include <sstream>
#include <boost/algorithm/string/predicate.hpp>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {

const char* ResiliencyModeToString(ResiliencyMode mode) {
  switch (mode) {
    case ResiliencyMode::ENFORCED: return "enforced";
    case ResiliencyMode::SOFT: return "soft";
    case ResiliencyMode::MONITOR: return "monitor";
  }
  DCHECK(false) << "Unknown resiliency mode " << static_cast<int>(mode);
  return "unknown";
}

bool ResiliencyModeFromString(const string& name, ResiliencyMode* mode) {
  for (ResiliencyMode m :
      {ResiliencyMode::ENFORCED, ResiliencyMode::SOFT, ResiliencyMode::MONITOR}) {
    if (boost::algorithm::iequals(name, ResiliencyModeToString(m))) {
      *mode = m;
      return true;
    }
  }
  return false;
}

QueryGroupConfig::QueryGroupConfig() : QueryGroupConfig("", ResiliencyMode::MONITOR) {}

QueryGroupConfig::QueryGroupConfig(const string& id, ResiliencyMode mode)
  : id(id), mode(mode) {
  for (int i = 0; i < NUM_RESOURCE_TYPES; ++i) {
    soft_limits[i] = NO_LIMIT;
    hard_limits[i] = NO_LIMIT;
  }
}

Status QueryGroupConfig::Validate() const {
  if (id.empty()) {
    return Status(ErrorCode::QUERY_GROUP_INVALID_CONFIG, "<empty>", "id must be set");
  }
  for (ResourceType t : ALL_RESOURCE_TYPES) {
    double soft = soft_limit(t);
    double hard = hard_limit(t);
    // Anything but NO_LIMIT must be a usable fraction.
    if (hard != NO_LIMIT && (hard <= 0 || hard > 1.0)) {
      return Status(ErrorCode::QUERY_GROUP_INVALID_CONFIG, id,
          Substitute("$0 hard limit $1 is not in (0, 1]", ResourceTypeToString(t), hard));
    }
    if (soft != NO_LIMIT && (soft <= 0 || soft > 1.0)) {
      return Status(ErrorCode::QUERY_GROUP_INVALID_CONFIG, id,
          Substitute("$0 soft limit $1 is not in (0, 1]", ResourceTypeToString(t), soft));
    }
    if (has_soft_limit(t) && has_hard_limit(t) && soft > hard) {
      return Status(ErrorCode::QUERY_GROUP_INVALID_CONFIG, id,
          Substitute("$0 soft limit $1 is above the hard limit $2",
              ResourceTypeToString(t), soft, hard));
    }
  }
  return Status::OK();
}

string QueryGroupConfig::DebugString() const {
  stringstream ss;
  ss << "QueryGroupConfig(id=" << id << " mode=" << ResiliencyModeToString(mode);
  for (ResourceType t : ALL_RESOURCE_TYPES) {
    if (!has_hard_limit(t) && !has_soft_limit(t)) continue;
    ss << " " << ResourceTypeToString(t) << "={soft=" << soft_limit(t)
       << " hard=" << hard_limit(t) << "}";
  }
  ss << ")";
  return ss.str();
}

InMemoryQueryGroupConfigStore::InMemoryQueryGroupConfigStore()
  : current_configs_(make_shared<ConfigMap>()) {}

Status InMemoryQueryGroupConfigStore::Put(const QueryGroupConfig& config) {
  RETURN_IF_ERROR(config.Validate());
  lock_guard<mutex> l(update_lock_);
  shared_ptr<ConfigMap> new_configs = make_shared<ConfigMap>(*GetSnapshot());
  (*new_configs)[config.id] = make_shared<const QueryGroupConfig>(config);
  SetSnapshot(new_configs);
  VLOG_QUERY << "Updated " << config.DebugString();
  return Status::OK();
}

bool InMemoryQueryGroupConfigStore::Remove(const string& group_id) {
  lock_guard<mutex> l(update_lock_);
  SnapshotPtr current = GetSnapshot();
  if (current->find(group_id) == current->end()) return false;
  shared_ptr<ConfigMap> new_configs = make_shared<ConfigMap>(*current);
  new_configs->erase(group_id);
  SetSnapshot(new_configs);
  VLOG_QUERY << "Removed the configuration of query group " << group_id;
  return true;
}

shared_ptr<const QueryGroupConfig> InMemoryQueryGroupConfigStore::Get(
    const string& group_id) const {
  SnapshotPtr snapshot = GetSnapshot();
  auto it = snapshot->find(group_id);
  if (it == snapshot->end()) return nullptr;
  return it->second;
}

InMemoryQueryGroupConfigStore::SnapshotPtr
InMemoryQueryGroupConfigStore::GetSnapshot() const {
  lock_guard<mutex> l(current_configs_lock_);
  DCHECK(current_configs_.get() != nullptr);
  SnapshotPtr snapshot = current_configs_;
  return snapshot;
}

void InMemoryQueryGroupConfigStore::SetSnapshot(const SnapshotPtr& new_snapshot) {
  lock_guard<mutex> l(current_configs_lock_);
  current_configs_ = new_snapshot;
}

}
