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

#include "wlm/query-execution-context.h"

#include "common/logging.h"
#include "util/time.h"
#include "wlm/resource-usage-tracker.h"

#include "common/names.h"

namespace wlm {

QueryExecutionContext::QueryExecutionContext(const string& query_id,
    shared_ptr<QueryGroupState> group, QueryGroupRegistry* registry)
  : query_id_(query_id),
    group_(move(group)),
    registry_(registry),
    start_time_ms_(MonotonicMillis()) {
  DCHECK(group_ != nullptr);
  DCHECK(registry_ != nullptr);
}

QueryExecutionContext::~QueryExecutionContext() {
  ReleaseResources();
}

void QueryExecutionContext::UpdateUsage(ResourceType type, int64_t value) {
  DCHECK_GE(value, 0);
  AtomicInt64& slot = usage_[ResourceTypeIndex(type)];
  while (true) {
    int64_t old_value = slot.Load();
    if (UNLIKELY(old_value == RELEASED)) return;
    if (old_value == value) return;
    if (slot.CompareAndSwap(old_value, value)) {
      ResourceUsageTracker::Attribute(group_.get(), type, value - old_value);
      return;
    }
  }
}

void QueryExecutionContext::AddUsage(ResourceType type, int64_t delta) {
  AtomicInt64& slot = usage_[ResourceTypeIndex(type)];
  while (true) {
    int64_t old_value = slot.Load();
    if (UNLIKELY(old_value == RELEASED)) return;
    if (slot.CompareAndSwap(old_value, old_value + delta)) {
      ResourceUsageTracker::Attribute(group_.get(), type, delta);
      return;
    }
  }
}

int64_t QueryExecutionContext::usage(ResourceType type) const {
  int64_t value = usage_[ResourceTypeIndex(type)].Load();
  return value == RELEASED ? 0 : value;
}

bool QueryExecutionContext::ReleaseResources() {
  if (!released_.CompareAndSwap(false, true)) return false;
  for (ResourceType t : ALL_RESOURCE_TYPES) {
    // Any update racing with this swap either lands before it, and is subtracted here,
    // or sees RELEASED and is dropped.
    int64_t final_usage = usage_[ResourceTypeIndex(t)].Swap(RELEASED);
    DCHECK_NE(final_usage, RELEASED);
    ResourceUsageTracker::Attribute(group_.get(), t, -final_usage);
  }
  registry_->ReleaseQuery(group_);
  VLOG_QUERY << "Released resources of query " << query_id_ << " in query group "
             << group_id();
  return true;
}

void QueryExecutionContext::Finish(const Status& outcome) {
  if (finished_.CompareAndSwap(false, true)) {
    if (outcome.ok()) {
      group_->IncrementCompletions();
    } else if (!outcome.IsCancelled()) {
      // Failures of queries whose group was deleted are not attributed to it.
      if (!group_->pending_removal()) group_->IncrementFailures();
    }
    VLOG_QUERY << "Query " << query_id_ << " finished: " << outcome;
  }
  ReleaseResources();
}

}
