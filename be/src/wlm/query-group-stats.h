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

#ifndef WLM_WLM_QUERY_GROUP_STATS_H
#define WLM_WLM_QUERY_GROUP_STATS_H

#include <stdint.h>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "wlm/query-group-state.h"
#include "wlm/resource-type.h"
#include "wlm/resource-usage-tracker.h"

namespace wlm {

/// Copy of the counters of one resource type of a query group.
struct ResourceStats {
  explicit ResourceStats(ResourceType type) : type(type) {}

  ResourceType type;
  int64_t cancellations = 0;
  int64_t rejections = 0;
  /// Absolute usage, in the unit of 'type'.
  int64_t usage = 0;
  /// Fractions of node capacity.
  double current_usage = 0;
  double last_recorded_usage = 0;
};

/// Point in time copy of the counters of one query group. Every counter is read
/// atomically, but not all of them at the same instant. Since the counters only
/// increase, a later snapshot never shows a smaller value than an earlier one.
struct QueryGroupStats {
  /// Takes a snapshot of 'state'. Usage fractions are computed by 'tracker'.
  static QueryGroupStats Create(
      const QueryGroupState& state, const ResourceUsageTracker& tracker);

  /// Returns the stats of 'type' or nullptr if it is not tracked.
  const ResourceStats* resource(ResourceType type) const;

  /// Adds the counters as members of the JSON object 'group':
  /// {"completions": 4, "rejections": 1, "failures": 0, "total_cancellations": 2,
  ///  "active_queries": 3, "cpu": {"cancellations": 2, "rejections": 1,
  ///  "current_usage": 0.42, "last_recorded_usage": 0.85}, "memory": {...}}
  void ToJson(rapidjson::Value* group, rapidjson::Document* document) const;

  std::string DebugString() const;

  std::string group_id;
  int64_t completions = 0;
  int64_t rejections = 0;
  int64_t failures = 0;
  int64_t total_cancellations = 0;
  int64_t active_queries = 0;
  bool pending_removal = false;
  std::vector<ResourceStats> resources;
};

/// Renders 'stats' as a JSON document {"query_groups": {"<group id>": {...}, ...}}.
std::string QueryGroupStatsToJson(
    const std::vector<QueryGroupStats>& stats, bool pretty = false);

}

#endif
