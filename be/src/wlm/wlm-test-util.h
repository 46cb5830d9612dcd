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

#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "common/status.h"
#include "util/condition-variable.h"
#include "wlm/execution-engine.h"
#include "wlm/workload-management-settings.h"

namespace wlm {
namespace test {

/// Node capacities used by the tests. Chosen so that usage units and percentages of the
/// node line up: 1 CPU unit is 1% of the node and 10 memory units are 1% of the node.
static const int64_t TEST_CPU_CAPACITY = 100;
static const int64_t TEST_MEMORY_CAPACITY = 1000;

/// Settings tracking all resources with the test capacities, all node thresholds at 1.0
/// and no cancellation cap.
WorkloadManagementSettings MakeTestSettings();

/// Make a RunningQuery with the given usage.
RunningQuery MakeRunningQuery(const std::string& query_id, int64_t cpu_usage,
    int64_t memory_usage = 0, bool cancelled = false);

/// ExecutionEngine that serves a fixed set of running queries per group and records
/// every cancellation. A cancelled query stays listed, marked as cancelled, like a
/// query that was signalled but has not finished yet.
class FakeExecutionEngine : public ExecutionEngine {
 public:
  void AddQuery(const std::string& group_id, const RunningQuery& query);

  /// Make ListRunningQueries() of 'group_id' return 'status'.
  void SetListStatus(const std::string& group_id, const Status& status);

  /// Make ListRunningQueries() of 'group_id' throw a std::runtime_error.
  void SetListThrows(const std::string& group_id);

  /// Make CancelQuery() of 'query_id' report that the query had already finished.
  void SetFinished(const std::string& query_id);

  /// The next ListRunningQueries() call blocks until Unblock() is called.
  void BlockNextListing();

  /// Waits until a ListRunningQueries() call is blocked.
  void WaitUntilBlocked();

  void Unblock();

  Status ListRunningQueries(
      const std::string& group_id, std::vector<RunningQuery>* queries) override;

  CancelResult CancelQuery(const std::string& query_id, const Status& reason) override;

  /// Ids of the queries signalled so far, in the order of cancellation.
  std::vector<std::string> cancelled_ids() const;

  /// Reason of the cancellation of 'query_id'. OK if it was not cancelled.
  Status cancel_reason(const std::string& query_id) const;

  int num_cancel_calls() const;

 private:
  mutable std::mutex lock_;
  ConditionVariable cv_;

  std::map<std::string, std::vector<RunningQuery>> queries_;
  std::map<std::string, Status> list_status_;
  std::set<std::string> list_throws_;
  std::set<std::string> finished_;
  std::vector<std::pair<std::string, Status>> cancellations_;
  int num_cancel_calls_ = 0;

  bool block_next_listing_ = false;
  bool blocked_ = false;
};

}  // end namespace test
}  // end namespace wlm
