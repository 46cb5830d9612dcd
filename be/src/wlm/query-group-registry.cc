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

#include "wlm/query-group-registry.h"

#include <functional>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {

const char* const QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID = "DEFAULT_QUERY_GROUP";

QueryGroupRegistry::QueryGroupRegistry(const TrackedResourceSet& tracked)
  : tracked_(tracked) {
  GetOrCreate(DEFAULT_QUERY_GROUP_ID);
}

QueryGroupRegistry::Shard& QueryGroupRegistry::GetShard(const string& group_id) {
  return shards_[std::hash<string>()(group_id) % NUM_SHARDS];
}

const QueryGroupRegistry::Shard& QueryGroupRegistry::GetShard(
    const string& group_id) const {
  return shards_[std::hash<string>()(group_id) % NUM_SHARDS];
}

shared_ptr<QueryGroupState> QueryGroupRegistry::GetOrCreate(const string& group_id) {
  Shard& shard = GetShard(group_id);
  lock_guard<mutex> l(shard.lock);
  auto it = shard.groups.find(group_id);
  if (it != shard.groups.end()) {
    if (it->second->pending_removal_.Load()) {
      VLOG_QUERY << "Query group " << group_id << " was registered again before its "
                 << "removal completed";
      it->second->pending_removal_.Store(false);
    }
    return it->second;
  }
  shared_ptr<QueryGroupState> state = make_shared<QueryGroupState>(group_id, tracked_);
  shard.groups.emplace(group_id, state);
  VLOG_QUERY << "Created state for query group " << group_id << " tracking "
             << tracked_.DebugString();
  return state;
}

shared_ptr<QueryGroupState> QueryGroupRegistry::Get(const string& group_id) const {
  const Shard& shard = GetShard(group_id);
  lock_guard<mutex> l(shard.lock);
  auto it = shard.groups.find(group_id);
  return it == shard.groups.end() ? nullptr : it->second;
}

shared_ptr<QueryGroupState> QueryGroupRegistry::AcquireForQuery(const string& group_id) {
  Shard& shard = GetShard(group_id);
  lock_guard<mutex> l(shard.lock);
  auto it = shard.groups.find(group_id);
  if (it == shard.groups.end() || it->second->pending_removal_.Load()) return nullptr;
  it->second->active_queries_.Add(1);
  return it->second;
}

void QueryGroupRegistry::ReleaseQuery(const shared_ptr<QueryGroupState>& state) {
  DCHECK(state != nullptr);
  Shard& shard = GetShard(state->group_id());
  lock_guard<mutex> l(shard.lock);
  int64_t remaining = state->active_queries_.Add(-1);
  DCHECK_GE(remaining, 0) << state->group_id();
  if (remaining > 0 || !state->pending_removal_.Load()) return;
  auto it = shard.groups.find(state->group_id());
  // The entry may already belong to a newer state of a re-created group.
  if (it != shard.groups.end() && it->second == state) {
    shard.groups.erase(it);
    VLOG_QUERY << "Removed query group " << state->group_id()
               << " after its last query finished";
  }
}

bool QueryGroupRegistry::Deregister(const string& group_id) {
  if (group_id == DEFAULT_QUERY_GROUP_ID) return false;
  Shard& shard = GetShard(group_id);
  lock_guard<mutex> l(shard.lock);
  auto it = shard.groups.find(group_id);
  if (it == shard.groups.end()) return false;
  const shared_ptr<QueryGroupState>& state = it->second;
  if (state->active_queries_.Load() == 0) {
    shard.groups.erase(it);
    VLOG_QUERY << "Removed query group " << group_id;
  } else {
    state->pending_removal_.Store(true);
    VLOG_QUERY << "Query group " << group_id << " will be removed once its "
               << state->active_queries() << " active queries finish";
  }
  return true;
}

bool QueryGroupRegistry::Contains(const string& group_id) const {
  return Get(group_id) != nullptr;
}

vector<shared_ptr<QueryGroupState>> QueryGroupRegistry::GetAll() const {
  vector<shared_ptr<QueryGroupState>> result;
  for (const Shard& shard : shards_) {
    lock_guard<mutex> l(shard.lock);
    for (const auto& entry : shard.groups) result.push_back(entry.second);
  }
  return result;
}

size_t QueryGroupRegistry::size() const {
  size_t result = 0;
  for (const Shard& shard : shards_) {
    lock_guard<mutex> l(shard.lock);
    result += shard.groups.size();
  }
  return result;
}

}
