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

#ifndef WLM_WLM_QUERY_GROUP_STATE_H
#define WLM_WLM_QUERY_GROUP_STATE_H

#include <array>
#include <atomic>
#include <memory>
#include <string>

#include "common/atomic.h"
#include "common/compiler-util.h"
#include "wlm/resource-type.h"

namespace wlm {

/// Counters and live usage of one query group for one resource type.
/// All members are independent atomics; readers see each value atomically but two
/// values are not read as one transaction.
class ResourceTypeState {
 public:
  explicit ResourceTypeState(ResourceType type) : type_(type), last_recorded_usage_(0) {}

  ResourceType type() const { return type_; }

  /// Queries cancelled by the enforcement loop because the group exceeded its limit
  /// for this resource.
  int64_t cancellations() const { return cancellations_.Load(); }
  void IncrementCancellations() { cancellations_.Add(1); }

  /// Queries rejected by admission control because of this resource.
  int64_t rejections() const { return rejections_.Load(); }
  void IncrementRejections() { rejections_.Add(1); }

  /// Sum of the current usage of all running queries of the group, in the unit of the
  /// resource type.
  int64_t usage() const { return usage_.Load(); }

  /// Adds 'delta' to the usage and returns the new value.
  int64_t AddUsage(int64_t delta) { return usage_.Add(delta); }

  /// Usage as a fraction of node capacity, as seen by the last enforcement cycle.
  double last_recorded_usage() const {
    return last_recorded_usage_.load(std::memory_order_acquire);
  }
  void set_last_recorded_usage(double usage) {
    last_recorded_usage_.store(usage, std::memory_order_release);
  }

 private:
  const ResourceType type_;

  /// Updated by every query of the group, kept on its own cache line.
  alignas(CACHE_LINE_SIZE) AtomicInt64 usage_;

  alignas(CACHE_LINE_SIZE) AtomicInt64 cancellations_;
  AtomicInt64 rejections_;
  std::atomic<double> last_recorded_usage_;
};

/// Live state of one query group on this node. Created by QueryGroupRegistry and
/// shared (via shared_ptr) with the execution contexts of the group's queries, so a
/// state outlives its registry entry until the last of its queries finishes.
///
/// The set of tracked resource types is fixed at construction; resource_state()
/// returns nullptr for all other types. The counters only ever increase.
class QueryGroupState {
 public:
  QueryGroupState(const std::string& group_id, const TrackedResourceSet& tracked);

  const std::string& group_id() const { return group_id_; }
  const TrackedResourceSet& tracked_resources() const { return tracked_; }

  bool IsTracked(ResourceType type) const { return tracked_.Contains(type); }

  /// Returns the state of 'type' or nullptr if 'type' is not tracked.
  ResourceTypeState* resource_state(ResourceType type) {
    return resource_states_[ResourceTypeIndex(type)].get();
  }
  const ResourceTypeState* resource_state(ResourceType type) const {
    return resource_states_[ResourceTypeIndex(type)].get();
  }

  int64_t completions() const { return completions_.Load(); }
  void IncrementCompletions() { completions_.Add(1); }

  int64_t total_rejections() const { return total_rejections_.Load(); }

  /// Records an admission rejection caused by 'type'.
  void RecordRejection(ResourceType type);

  int64_t failures() const { return failures_.Load(); }
  void IncrementFailures() { failures_.Add(1); }

  int64_t total_cancellations() const { return total_cancellations_.Load(); }

  /// Records the cancellation of one query. 'type' is the resource whose limit was
  /// exceeded, or nullptr if the query was cancelled for another reason (e.g. its group
  /// was deleted while the node is in duress).
  void RecordCancellation(const ResourceType* type);

  /// Current usage of 'type', 0 if it is not tracked.
  int64_t usage(ResourceType type) const {
    const ResourceTypeState* state = resource_state(type);
    return state == nullptr ? 0 : state->usage();
  }

  /// Number of admitted queries of this group that have not released their resources.
  /// Maintained by QueryGroupRegistry.
  int64_t active_queries() const { return active_queries_.Load(); }

  /// True once the group's configuration was deleted. The state stays registered until
  /// its last active query finishes.
  bool pending_removal() const { return pending_removal_.Load(); }

  std::string DebugString() const;

 private:
  friend class QueryGroupRegistry;

  const std::string group_id_;
  const TrackedResourceSet tracked_;

  /// Indexed by ResourceType, null for untracked types. Never modified after
  /// construction.
  std::array<std::unique_ptr<ResourceTypeState>, NUM_RESOURCE_TYPES> resource_states_;

  AtomicInt64 completions_;
  AtomicInt64 total_rejections_;
  AtomicInt64 failures_;
  AtomicInt64 total_cancellations_;

  /// Only modified with the registry shard lock held, see QueryGroupRegistry.
  AtomicInt64 active_queries_;
  AtomicBool pending_removal_;
};

}

#endif
