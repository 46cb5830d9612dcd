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

#ifndef WLM_WLM_QUERY_GROUP_REGISTRY_H
#define WLM_WLM_QUERY_GROUP_REGISTRY_H

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "wlm/query-group-state.h"
#include "wlm/resource-type.h"

namespace wlm {

/// Concurrent map from query group id to the group's QueryGroupState.
///
/// The map is split into shards, each protected by its own lock, so that lookups of
/// different groups rarely contend. A state is inserted fully constructed under the
/// shard lock, which makes concurrent GetOrCreate() calls for the same id return the
/// same instance.
///
/// Removal is deferred: Deregister() marks a group as pending removal and the entry
/// is only erased once the group has no active queries. A group id that is used again
/// after its entry was erased gets a new, zero initialized state.
///
/// The default query group (DEFAULT_QUERY_GROUP_ID) always exists and cannot be
/// deregistered.
class QueryGroupRegistry {
 public:
  static const char* const DEFAULT_QUERY_GROUP_ID;

  explicit QueryGroupRegistry(const TrackedResourceSet& tracked);

  /// Returns the state of 'group_id', creating it if it does not exist. If the group
  /// is pending removal, the removal is cancelled and the existing state is returned.
  std::shared_ptr<QueryGroupState> GetOrCreate(const std::string& group_id);

  /// Returns the state of 'group_id' or nullptr if there is none.
  std::shared_ptr<QueryGroupState> Get(const std::string& group_id) const;

  /// Returns the state of 'group_id' with its active query count incremented, or
  /// nullptr if the group is not registered or is pending removal. Every successful
  /// call must be paired with a ReleaseQuery().
  std::shared_ptr<QueryGroupState> AcquireForQuery(const std::string& group_id);

  /// Decrements the active query count of 'state' and erases the group from the
  /// registry if it is pending removal and this was its last query.
  void ReleaseQuery(const std::shared_ptr<QueryGroupState>& state);

  /// Requests removal of 'group_id'. The entry is erased immediately if the group has
  /// no active queries, otherwise when its last query is released. Returns false if the
  /// group does not exist or is the default group.
  bool Deregister(const std::string& group_id);

  /// Returns true if 'group_id' is in the registry (pending removal or not).
  bool Contains(const std::string& group_id) const;

  /// Returns all registered groups, including those pending removal, in no particular
  /// order.
  std::vector<std::shared_ptr<QueryGroupState>> GetAll() const;

  /// Number of registered groups, including the default group.
  size_t size() const;

  const TrackedResourceSet& tracked_resources() const { return tracked_; }

 private:
  static constexpr int NUM_SHARDS = 16;

  struct Shard {
    mutable std::mutex lock;
    std::unordered_map<std::string, std::shared_ptr<QueryGroupState>> groups;
  };

  Shard& GetShard(const std::string& group_id);
  const Shard& GetShard(const std::string& group_id) const;

  const TrackedResourceSet tracked_;
  std::array<Shard, NUM_SHARDS> shards_;
};

}

#endif
