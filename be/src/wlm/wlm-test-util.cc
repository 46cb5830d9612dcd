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

#include "wlm/wlm-test-util.h"

#include <stdexcept>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {
namespace test {

WorkloadManagementSettings MakeTestSettings() {
  WorkloadManagementSettings settings;
  settings.tracked_resources = TrackedResourceSet::All();
  settings.enforcement_interval_ms = 10;
  settings.max_cancellations_per_cycle = 0;
  settings.node_capacity[ResourceTypeIndex(ResourceType::CPU)] = TEST_CPU_CAPACITY;
  settings.node_capacity[ResourceTypeIndex(ResourceType::MEMORY)] = TEST_MEMORY_CAPACITY;
  return settings;
}

RunningQuery MakeRunningQuery(
    const string& query_id, int64_t cpu_usage, int64_t memory_usage, bool cancelled) {
  RunningQuery query;
  query.query_id = query_id;
  query.usage[ResourceTypeIndex(ResourceType::CPU)] = cpu_usage;
  query.usage[ResourceTypeIndex(ResourceType::MEMORY)] = memory_usage;
  query.cancelled = cancelled;
  return query;
}

void FakeExecutionEngine::AddQuery(const string& group_id, const RunningQuery& query) {
  lock_guard<mutex> l(lock_);
  queries_[group_id].push_back(query);
}

void FakeExecutionEngine::SetListStatus(const string& group_id, const Status& status) {
  lock_guard<mutex> l(lock_);
  list_status_[group_id] = status;
}

void FakeExecutionEngine::SetListThrows(const string& group_id) {
  lock_guard<mutex> l(lock_);
  list_throws_.insert(group_id);
}

void FakeExecutionEngine::SetFinished(const string& query_id) {
  lock_guard<mutex> l(lock_);
  finished_.insert(query_id);
}

void FakeExecutionEngine::BlockNextListing() {
  lock_guard<mutex> l(lock_);
  block_next_listing_ = true;
}

void FakeExecutionEngine::WaitUntilBlocked() {
  unique_lock<mutex> l(lock_);
  while (!blocked_) cv_.Wait(l);
}

void FakeExecutionEngine::Unblock() {
  {
    lock_guard<mutex> l(lock_);
    block_next_listing_ = false;
    blocked_ = false;
  }
  cv_.NotifyAll();
}

Status FakeExecutionEngine::ListRunningQueries(
    const string& group_id, vector<RunningQuery>* queries) {
  unique_lock<mutex> l(lock_);
  if (block_next_listing_) {
    block_next_listing_ = false;
    blocked_ = true;
    cv_.NotifyAll();
    while (blocked_) cv_.Wait(l);
  }
  if (list_throws_.find(group_id) != list_throws_.end()) {
    throw std::runtime_error("listing of " + group_id + " exploded");
  }
  auto status_it = list_status_.find(group_id);
  if (status_it != list_status_.end() && !status_it->second.ok()) {
    return status_it->second;
  }
  queries->clear();
  auto it = queries_.find(group_id);
  if (it != queries_.end()) *queries = it->second;
  return Status::OK();
}

CancelResult FakeExecutionEngine::CancelQuery(const string& query_id,
    const Status& reason) {
  lock_guard<mutex> l(lock_);
  ++num_cancel_calls_;
  if (finished_.find(query_id) != finished_.end()) return CancelResult::NO_OP;
  for (auto& entry : queries_) {
    for (RunningQuery& query : entry.second) {
      if (query.query_id != query_id) continue;
      if (query.cancelled) return CancelResult::NO_OP;
      query.cancelled = true;
      cancellations_.emplace_back(query_id, reason);
      return CancelResult::SIGNALED;
    }
  }
  return CancelResult::NO_OP;
}

vector<string> FakeExecutionEngine::cancelled_ids() const {
  lock_guard<mutex> l(lock_);
  vector<string> result;
  for (const auto& entry : cancellations_) result.push_back(entry.first);
  return result;
}

Status FakeExecutionEngine::cancel_reason(const string& query_id) const {
  lock_guard<mutex> l(lock_);
  for (const auto& entry : cancellations_) {
    if (entry.first == query_id) return entry.second;
  }
  return Status::OK();
}

int FakeExecutionEngine::num_cancel_calls() const {
  lock_guard<mutex> l(lock_);
  return num_cancel_calls_;
}

}  // end namespace test
}  // end namespace wlm
