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

#ifndef WLM_WLM_RUNNING_QUERY_MAP_H
#define WLM_WLM_RUNNING_QUERY_MAP_H

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/status.h"
#include "wlm/execution-engine.h"
#include "wlm/query-execution-context.h"

namespace wlm {

/// ExecutionEngine over the QueryExecutionContexts of the queries running in this
/// process. Queries are registered when they start and unregistered when they finish;
/// cancellation cancels the query's CancellationToken, which the query polls.
///
/// The map is sharded by query id so that registration from many threads does not
/// contend on a single lock.
class RunningQueryMap : public ExecutionEngine {
 public:
  /// Returns QUERY_ALREADY_REGISTERED if a query with the same id is running.
  Status Register(std::shared_ptr<QueryExecutionContext> query) WARN_UNUSED_RESULT;

  /// Removes 'query_id'. Returns false if it was not registered.
  bool Unregister(const std::string& query_id);

  /// Returns the context of 'query_id' or nullptr.
  std::shared_ptr<QueryExecutionContext> Get(const std::string& query_id) const;

  size_t size() const;

  Status ListRunningQueries(
      const std::string& group_id, std::vector<RunningQuery>* queries) override;

  CancelResult CancelQuery(const std::string& query_id, const Status& reason) override;

 private:
  static constexpr int NUM_SHARDS = 16;

  struct Shard {
    mutable std::mutex lock;
    std::unordered_map<std::string, std::shared_ptr<QueryExecutionContext>> queries;
  };

  Shard& GetShard(const std::string& query_id);
  const Shard& GetShard(const std::string& query_id) const;

  std::array<Shard, NUM_SHARDS> shards_;
};

}

#endif
