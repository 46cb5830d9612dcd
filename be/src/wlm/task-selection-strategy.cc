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

#include "wlm/task-selection-strategy.h"

#include <algorithm>

#include "common/names.h"

namespace wlm {

vector<const RunningQuery*> MaximumUsageSelectionStrategy::SelectVictims(
    const vector<RunningQuery>& candidates, ResourceType type, int64_t excess) const {
  vector<const RunningQuery*> victims;
  if (excess <= 0) return victims;

  vector<const RunningQuery*> sorted;
  sorted.reserve(candidates.size());
  for (const RunningQuery& query : candidates) sorted.push_back(&query);
  sort(sorted.begin(), sorted.end(),
      [type](const RunningQuery* a, const RunningQuery* b) {
        int64_t usage_a = a->usage_of(type);
        int64_t usage_b = b->usage_of(type);
        if (usage_a != usage_b) return usage_a > usage_b;
        return a->query_id < b->query_id;
      });

  int64_t selected_usage = 0;
  for (const RunningQuery* query : sorted) {
    if (selected_usage >= excess) break;
    // Sorted by usage, so no later query reduces the excess either.
    if (query->usage_of(type) <= 0) break;
    victims.push_back(query);
    selected_usage += query->usage_of(type);
  }
  return victims;
}

}
