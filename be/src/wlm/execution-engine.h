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

#ifndef WLM_WLM_EXECUTION_ENGINE_H
#define WLM_WLM_EXECUTION_ENGINE_H

#include <stdint.h>
#include <string>
#include <vector>

#include "common/status.h"
#include "wlm/resource-type.h"

namespace wlm {

/// Point in time view of one running query, as seen by the enforcement loop.
struct RunningQuery {
  RunningQuery() : usage{}, cancelled(false), start_time_ms(0) {}

  int64_t usage_of(ResourceType type) const { return usage[ResourceTypeIndex(type)]; }

  std::string query_id;

  /// Current consumption, indexed by ResourceType.
  int64_t usage[NUM_RESOURCE_TYPES];

  /// True if cancellation was already requested but the query has not stopped yet.
  bool cancelled;

  int64_t start_time_ms;
};

/// Result of a cancellation request.
enum class CancelResult {
  /// The query was running and has been asked to stop.
  SIGNALED,
  /// The query had already finished or was already cancelled. Not an error.
  NO_OP,
};

/// The parts of the query execution engine the enforcement loop depends on.
/// Implementations must be thread safe and must not block for long: both calls are
/// made from the enforcement thread once per cycle.
class ExecutionEngine {
 public:
  virtual ~ExecutionEngine() {}

  /// Fills 'queries' with the queries of 'group_id' that are currently running.
  /// Returns RUNNING_QUERY_LIST_FAILED (or another error) if the list is unavailable;
  /// the group is then skipped for the current cycle.
  virtual Status ListRunningQueries(
      const std::string& group_id, std::vector<RunningQuery>* queries) = 0;

  /// Requests cancellation of 'query_id' with 'reason'. Does not wait for the query
  /// to stop.
  virtual CancelResult CancelQuery(const std::string& query_id, const Status& reason) = 0;
};

}

#endif
