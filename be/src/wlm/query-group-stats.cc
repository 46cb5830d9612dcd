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

#include "wlm/query-group-stats.h"

#include <sstream>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "common/logging.h"

#include "common/names.h"

using namespace rapidjson;

namespace wlm {

QueryGroupStats QueryGroupStats::Create(
    const QueryGroupState& state, const ResourceUsageTracker& tracker) {
  QueryGroupStats stats;
  stats.group_id = state.group_id();
  stats.completions = state.completions();
  stats.rejections = state.total_rejections();
  stats.failures = state.failures();
  stats.total_cancellations = state.total_cancellations();
  stats.active_queries = state.active_queries();
  stats.pending_removal = state.pending_removal();
  for (ResourceType t : state.tracked_resources().types()) {
    const ResourceTypeState* resource_state = state.resource_state(t);
    ResourceStats resource(t);
    resource.cancellations = resource_state->cancellations();
    resource.rejections = resource_state->rejections();
    resource.usage = resource_state->usage();
    resource.current_usage = tracker.UsageFraction(state, t);
    resource.last_recorded_usage = resource_state->last_recorded_usage();
    stats.resources.push_back(resource);
  }
  return stats;
}

const ResourceStats* QueryGroupStats::resource(ResourceType type) const {
  for (const ResourceStats& r : resources) {
    if (r.type == type) return &r;
  }
  return nullptr;
}

void QueryGroupStats::ToJson(Value* group, Document* document) const {
  Document::AllocatorType& allocator = document->GetAllocator();
  group->AddMember("completions", completions, allocator);
  group->AddMember("rejections", rejections, allocator);
  group->AddMember("failures", failures, allocator);
  group->AddMember("total_cancellations", total_cancellations, allocator);
  group->AddMember("active_queries", active_queries, allocator);
  for (const ResourceStats& r : resources) {
    Value resource(kObjectType);
    resource.AddMember("cancellations", r.cancellations, allocator);
    resource.AddMember("rejections", r.rejections, allocator);
    resource.AddMember("current_usage", r.current_usage, allocator);
    resource.AddMember("last_recorded_usage", r.last_recorded_usage, allocator);
    group->AddMember(StringRef(ResourceTypeToString(r.type)), resource, allocator);
  }
}

string QueryGroupStats::DebugString() const {
  stringstream ss;
  ss << "QueryGroupStats(id=" << group_id << " completions=" << completions
     << " rejections=" << rejections << " failures=" << failures
     << " total_cancellations=" << total_cancellations
     << " active_queries=" << active_queries;
  for (const ResourceStats& r : resources) {
    ss << " " << ResourceTypeToString(r.type) << "={cancellations=" << r.cancellations
       << " rejections=" << r.rejections << " usage=" << r.usage
       << " current_usage=" << r.current_usage
       << " last_recorded_usage=" << r.last_recorded_usage << "}";
  }
  ss << ")";
  return ss.str();
}

string QueryGroupStatsToJson(const vector<QueryGroupStats>& stats, bool pretty) {
  Document document(kObjectType);
  Value groups(kObjectType);
  for (const QueryGroupStats& s : stats) {
    Value group(kObjectType);
    s.ToJson(&group, &document);
    Value group_id(s.group_id.c_str(), document.GetAllocator());
    groups.AddMember(group_id, group, document.GetAllocator());
  }
  document.AddMember("query_groups", groups, document.GetAllocator());

  StringBuffer buffer;
  if (pretty) {
    PrettyWriter<StringBuffer> writer(buffer);
    document.Accept(writer);
  } else {
    Writer<StringBuffer> writer(buffer);
    document.Accept(writer);
  }
  return buffer.GetString();
}

}
