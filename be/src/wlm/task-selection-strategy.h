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

#ifndef WLM_WLM_TASK_SELECTION_STRATEGY_H
#define WLM_WLM_TASK_SELECTION_STRATEGY_H

#include <stdint.h>
#include <vector>

#include "wlm/execution-engine.h"
#include "wlm/resource-type.h"

namespace wlm {

/// Chooses which running queries of a query group to cancel to bring the group's
/// usage of one resource back within its limit.
class TaskSelectionStrategy {
 public:
  virtual ~TaskSelectionStrategy() {}

  /// Returns the queries from 'candidates' to cancel so that their combined usage of
  /// 'type' is at least 'excess', in the order they should be cancelled. Returns fewer
  /// if the candidates do not add up to 'excess', and none if 'excess' is not positive.
  /// The returned pointers point into 'candidates'.
  virtual std::vector<const RunningQuery*> SelectVictims(
      const std::vector<RunningQuery>& candidates, ResourceType type,
      int64_t excess) const = 0;
};

/// Cancels the largest consumers first, which removes the excess with the fewest
/// cancellations. Queries with equal usage are ordered by ascending query id so the
/// selection is deterministic.
class MaximumUsageSelectionStrategy : public TaskSelectionStrategy {
 public:
  std::vector<const RunningQuery*> SelectVictims(
      const std::vector<RunningQuery>& candidates, ResourceType type,
      int64_t excess) const override;
};

}

#endif
