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

#include "wlm/running-query-map.h"

#include <functional>

#include "common/logging.h"

#include "common/names.h"

namespace wlm {

RunningQueryMap::Shard& RunningQueryMap::GetShard(const string& query_id) {
  return shards_[std::hash<string>()(query_id) % NUM_SHARDS];
}

const RunningQueryMap::Shard& RunningQueryMap::GetShard(const string& query_id) const {
  return shards_[std::hash<string>()(query_id) % NUM_SHARDS];
}

Status RunningQueryMap::Register(shared_ptr<QueryExecutionContext> query) {
  DCHECK(query != nullptr);
  Shard& shard = GetShard(query->query_id());
  lock_guard<mutex> l(shard.lock);
  auto result = shard.queries.emplace(query->query_id(), query);
  if (!result.second) {
    return Status(ErrorCode::QUERY_ALREADY_REGISTERED, query->query_id());
  }
  return Status::OK();
}

bool RunningQueryMap::Unregister(const string& query_id) {
  Shard& shard = GetShard(query_id);
  lock_guard<mutex> l(shard.lock);
  return shard.queries.erase(query_id) > 0;
}

shared_ptr<QueryExecutionContext> RunningQueryMap::Get(const string& query_id) const {
  const Shard& shard = GetShard(query_id);
  lock_guard<mutex> l(shard.lock);
  auto it = shard.queries.find(query_id);
  return it == shard.queries.end() ? nullptr : it->second;
}

size_t RunningQueryMap::size() const {
  size_t result = 0;
  for (const Shard& shard : shards_) {
    lock_guard<mutex> l(shard.lock);
    result += shard.queries.size();
  }
  return result;
}

Status RunningQueryMap::ListRunningQueries(
    const string& group_id, vector<RunningQuery>* queries) {
  DCHECK(queries != nullptr);
  queries->clear();
  for (const Shard& shard : shards_) {
    lock_guard<mutex> l(shard.lock);
    for (const auto& entry : shard.queries) {
      const QueryExecutionContext& ctx = *entry.second;
      if (ctx.group_id() != group_id || ctx.finished()) continue;
      RunningQuery query;
      query.query_id = ctx.query_id();
      for (ResourceType t : ALL_RESOURCE_TYPES) {
        query.usage[ResourceTypeIndex(t)] = ctx.usage(t);
      }
      query.cancelled = ctx.cancellation_token()->IsCancelled();
      query.start_time_ms = ctx.start_time_ms();
      queries->push_back(query);
    }
  }
  return Status::OK();
}

CancelResult RunningQueryMap::CancelQuery(const string& query_id, const Status& reason) {
  shared_ptr<QueryExecutionContext> ctx = Get(query_id);
  if (ctx == nullptr || ctx->finished()) return CancelResult::NO_OP;
  if (!ctx->cancellation_token()->Cancel(reason)) return CancelResult::NO_OP;
  return CancelResult::SIGNALED;
}

}
