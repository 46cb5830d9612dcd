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

#include "wlm/query-group-service.h"

#include <boost/thread/thread.hpp>
#include <rapidjson/document.h>

#include "common/atomic.h"
#include "testutil/gtest-util.h"
#include "wlm/wlm-test-util.h"

#include "common/names.h"

using namespace rapidjson;

namespace wlm {
using namespace wlm::test;

static const string GROUP_A = "finance";
static const string GROUP_B = "marketing";
static const string DEFAULT_GROUP = QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID;

class QueryGroupServiceTest : public testing::Test {
 protected:
  virtual void SetUp() {
    service_.reset(new QueryGroupService(
        MakeTestSettings(), [this]() { return in_duress_.Load(); }));
  }

  virtual void TearDown() { service_->Shutdown(); }

  void AddGroup(const string& id, ResiliencyMode mode, double cpu_limit) {
    QueryGroupConfig config(id, mode);
    config.SetHardLimit(ResourceType::CPU, cpu_limit);
    ASSERT_OK(service_->RegisterQueryGroup(config));
  }

  shared_ptr<QueryExecutionContext> StartQuery(
      const string& query_id, const string& group_id) {
    shared_ptr<QueryExecutionContext> query;
    Status status = service_->StartQuery(query_id, group_id, &query);
    EXPECT_OK(status);
    return query;
  }

  QueryGroupStats GetStats(const string& group_id) {
    QueryGroupStats stats;
    EXPECT_OK(service_->GetStats(group_id, &stats));
    return stats;
  }

  AtomicBool in_duress_{false};
  unique_ptr<QueryGroupService> service_;
};

TEST_F(QueryGroupServiceTest, RegisterAndDeregister) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.5);
  EXPECT_TRUE(service_->registry()->Contains(GROUP_A));
  EXPECT_TRUE(service_->configs()->Get(GROUP_A) != nullptr);

  QueryGroupConfig invalid(GROUP_B, ResiliencyMode::ENFORCED);
  invalid.SetHardLimit(ResourceType::CPU, 3);
  EXPECT_ERROR(
      service_->RegisterQueryGroup(invalid), ErrorCode::QUERY_GROUP_INVALID_CONFIG);
  EXPECT_FALSE(service_->registry()->Contains(GROUP_B));

  QueryGroupConfig default_config(DEFAULT_GROUP, ResiliencyMode::ENFORCED);
  EXPECT_ERROR(service_->RegisterQueryGroup(default_config),
      ErrorCode::QUERY_GROUP_INVALID_CONFIG);

  ASSERT_OK(service_->DeregisterQueryGroup(GROUP_A));
  EXPECT_FALSE(service_->registry()->Contains(GROUP_A));
  EXPECT_TRUE(service_->configs()->Get(GROUP_A) == nullptr);
  Status status = service_->DeregisterQueryGroup(GROUP_A);
  EXPECT_ERROR(status, ErrorCode::QUERY_GROUP_NOT_FOUND);
  ASSERT_ERROR_MSG(status, "Query group " + GROUP_A + " does not exist on this node.");
  EXPECT_ERROR(service_->DeregisterQueryGroup(DEFAULT_GROUP),
      ErrorCode::QUERY_GROUP_NOT_FOUND);
}

TEST_F(QueryGroupServiceTest, ResolveGroupId) {
  AddGroup(GROUP_A, ResiliencyMode::MONITOR, 0.5);
  EXPECT_EQ(GROUP_A, service_->ResolveGroupId(GROUP_A));
  EXPECT_EQ(DEFAULT_GROUP, service_->ResolveGroupId(""));
  EXPECT_EQ(DEFAULT_GROUP, service_->ResolveGroupId(GROUP_B));
}

TEST_F(QueryGroupServiceTest, QueryLifecycle) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.5);
  shared_ptr<QueryExecutionContext> q1 = StartQuery("q1", GROUP_A);
  shared_ptr<QueryExecutionContext> q2 = StartQuery("q2", GROUP_A);
  ASSERT_TRUE(q1 != nullptr && q2 != nullptr);
  EXPECT_EQ(GROUP_A, q1->group_id());
  EXPECT_EQ(2, service_->running_queries()->size());
  q1->UpdateUsage(ResourceType::CPU, 20);
  q2->UpdateUsage(ResourceType::MEMORY, 300);

  QueryGroupStats stats = GetStats(GROUP_A);
  EXPECT_EQ(2, stats.active_queries);
  EXPECT_DOUBLE_EQ(0.2, stats.resource(ResourceType::CPU)->current_usage);
  EXPECT_DOUBLE_EQ(0.3, stats.resource(ResourceType::MEMORY)->current_usage);

  service_->FinishQuery(q1.get(), Status::OK());
  service_->FinishQuery(q2.get(), Status("scan failed"));
  EXPECT_EQ(0, service_->running_queries()->size());

  stats = GetStats(GROUP_A);
  EXPECT_EQ(1, stats.completions);
  EXPECT_EQ(1, stats.failures);
  EXPECT_EQ(0, stats.active_queries);
  EXPECT_EQ(0, stats.resource(ResourceType::CPU)->usage);
  EXPECT_EQ(0, stats.resource(ResourceType::MEMORY)->usage);
}

TEST_F(QueryGroupServiceTest, UnknownGroupRunsInDefaultGroup) {
  shared_ptr<QueryExecutionContext> query = StartQuery("q1", "no-such-group");
  ASSERT_TRUE(query != nullptr);
  EXPECT_EQ(DEFAULT_GROUP, query->group_id());
  EXPECT_FALSE(service_->registry()->Contains("no-such-group"));
  service_->FinishQuery(query.get(), Status::OK());
  EXPECT_EQ(1, GetStats(DEFAULT_GROUP).completions);
}

TEST_F(QueryGroupServiceTest, DuplicateQueryId) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.5);
  shared_ptr<QueryExecutionContext> query = StartQuery("q1", GROUP_A);
  shared_ptr<QueryExecutionContext> duplicate;
  EXPECT_ERROR(service_->StartQuery("q1", GROUP_A, &duplicate),
      ErrorCode::QUERY_ALREADY_REGISTERED);
  EXPECT_TRUE(duplicate == nullptr);
  QueryGroupStats stats = GetStats(GROUP_A);
  EXPECT_EQ(1, stats.active_queries);
  EXPECT_EQ(0, stats.failures);
}

TEST_F(QueryGroupServiceTest, RejectedQuery) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.1);
  shared_ptr<QueryExecutionContext> q1 = StartQuery("q1", GROUP_A);
  q1->UpdateUsage(ResourceType::CPU, 15);
  shared_ptr<QueryExecutionContext> q2;
  Status status = service_->StartQuery("q2", GROUP_A, &q2);
  EXPECT_ERROR(status, ErrorCode::QUERY_GROUP_REJECTED);
  EXPECT_TRUE(q2 == nullptr);
  EXPECT_EQ(1, service_->running_queries()->size());
  QueryGroupStats stats = GetStats(GROUP_A);
  EXPECT_EQ(1, stats.rejections);
  EXPECT_EQ(1, stats.resource(ResourceType::CPU)->rejections);
  EXPECT_EQ(1, stats.active_queries);
}

// A query over its group's limit is cancelled through its cancellation token, and the
// cancellation is neither a completion nor a failure.
TEST_F(QueryGroupServiceTest, EnforcementCancelsRunningQuery) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.1);
  shared_ptr<QueryExecutionContext> big = StartQuery("big", GROUP_A);
  shared_ptr<QueryExecutionContext> small = StartQuery("small", GROUP_A);
  big->UpdateUsage(ResourceType::CPU, 12);
  small->UpdateUsage(ResourceType::CPU, 3);

  EXPECT_TRUE(service_->enforcer()->RunCycle());
  EXPECT_TRUE(big->cancellation_token()->IsCancelled());
  EXPECT_FALSE(small->cancellation_token()->IsCancelled());
  Status reason = big->cancellation_token()->reason();
  EXPECT_ERROR(reason, ErrorCode::QUERY_GROUP_CANCELLED);

  // The engine notices the cancellation and finishes the query with its reason.
  service_->FinishQuery(big.get(), reason);
  QueryGroupStats stats = GetStats(GROUP_A);
  EXPECT_EQ(1, stats.total_cancellations);
  EXPECT_EQ(1, stats.resource(ResourceType::CPU)->cancellations);
  EXPECT_EQ(0, stats.failures);
  EXPECT_EQ(0, stats.completions);
  EXPECT_EQ(3, stats.resource(ResourceType::CPU)->usage);

  // Nothing left to cancel once the query is gone.
  EXPECT_TRUE(service_->enforcer()->RunCycle());
  EXPECT_FALSE(small->cancellation_token()->IsCancelled());
  service_->FinishQuery(small.get(), Status::OK());
}

TEST_F(QueryGroupServiceTest, DeregisterWithRunningQuery) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.5);
  shared_ptr<QueryExecutionContext> query = StartQuery("q1", GROUP_A);
  query->UpdateUsage(ResourceType::CPU, 10);
  ASSERT_OK(service_->DeregisterQueryGroup(GROUP_A));
  EXPECT_TRUE(service_->registry()->Contains(GROUP_A));
  // New queries of the group fall back to the default group.
  shared_ptr<QueryExecutionContext> late = StartQuery("q2", GROUP_A);
  EXPECT_EQ(DEFAULT_GROUP, late->group_id());

  in_duress_.Store(true);
  EXPECT_TRUE(service_->enforcer()->RunCycle());
  EXPECT_TRUE(query->cancellation_token()->IsCancelled());
  EXPECT_ERROR(query->cancellation_token()->reason(), ErrorCode::QUERY_GROUP_REMOVED);
  EXPECT_FALSE(late->cancellation_token()->IsCancelled());

  // Failures of a removed group are not attributed to it.
  service_->FinishQuery(query.get(), Status("lost executor"));
  EXPECT_FALSE(service_->registry()->Contains(GROUP_A));
  service_->FinishQuery(late.get(), Status::OK());
}

TEST_F(QueryGroupServiceTest, IncrementFailures) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.5);
  service_->IncrementFailures(GROUP_A);
  service_->IncrementFailures(GROUP_A);
  service_->IncrementFailures("no-such-group");
  EXPECT_EQ(2, GetStats(GROUP_A).failures);
  EXPECT_FALSE(service_->registry()->Contains("no-such-group"));
  QueryGroupStats stats;
  EXPECT_ERROR(service_->GetStats("no-such-group", &stats),
      ErrorCode::QUERY_GROUP_NOT_FOUND);
}

TEST_F(QueryGroupServiceTest, NodeStats) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.1);
  AddGroup(GROUP_B, ResiliencyMode::MONITOR, 0.1);
  shared_ptr<QueryExecutionContext> a = StartQuery("a", GROUP_A);
  shared_ptr<QueryExecutionContext> b = StartQuery("b", GROUP_B);
  a->UpdateUsage(ResourceType::CPU, 5);
  b->UpdateUsage(ResourceType::CPU, 30);
  // Breaches are judged on the usage recorded by the last enforcement cycle.
  EXPECT_TRUE(service_->enforcer()->RunCycle());

  vector<QueryGroupStats> stats;
  service_->GetNodeStats({}, QueryGroupService::BreachFilter::ALL, &stats);
  ASSERT_EQ(3, stats.size());
  EXPECT_EQ(DEFAULT_GROUP, stats[0].group_id);
  EXPECT_EQ(GROUP_A, stats[1].group_id);
  EXPECT_EQ(GROUP_B, stats[2].group_id);

  service_->GetNodeStats(
      {QueryGroupService::ALL_GROUPS}, QueryGroupService::BreachFilter::ALL, &stats);
  EXPECT_EQ(3, stats.size());

  service_->GetNodeStats({GROUP_B, GROUP_A, GROUP_B, "no-such-group"},
      QueryGroupService::BreachFilter::ALL, &stats);
  ASSERT_EQ(2, stats.size());
  EXPECT_EQ(GROUP_A, stats[0].group_id);
  EXPECT_EQ(GROUP_B, stats[1].group_id);

  service_->GetNodeStats({}, QueryGroupService::BreachFilter::BREACHED, &stats);
  ASSERT_EQ(1, stats.size());
  EXPECT_EQ(GROUP_B, stats[0].group_id);
  EXPECT_DOUBLE_EQ(0.3, stats[0].resource(ResourceType::CPU)->last_recorded_usage);

  service_->GetNodeStats({}, QueryGroupService::BreachFilter::NOT_BREACHED, &stats);
  ASSERT_EQ(2, stats.size());
  EXPECT_EQ(DEFAULT_GROUP, stats[0].group_id);
  EXPECT_EQ(GROUP_A, stats[1].group_id);

  service_->FinishQuery(a.get(), Status::OK());
  service_->FinishQuery(b.get(), Status::OK());
}

TEST_F(QueryGroupServiceTest, NodeStatsJson) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.5);
  shared_ptr<QueryExecutionContext> query = StartQuery("q1", GROUP_A);
  query->UpdateUsage(ResourceType::MEMORY, 100);
  service_->FinishQuery(query.get(), Status::OK());
  service_->IncrementFailures(GROUP_A);

  string json =
      service_->GetNodeStatsJson({GROUP_A}, QueryGroupService::BreachFilter::ALL);
  Document document;
  document.Parse(json.c_str());
  ASSERT_FALSE(document.HasParseError()) << json;
  ASSERT_TRUE(document.HasMember("query_groups"));
  const Value& groups = document["query_groups"];
  ASSERT_TRUE(groups.HasMember(GROUP_A.c_str())) << json;
  EXPECT_FALSE(groups.HasMember(DEFAULT_GROUP.c_str()));
  const Value& group = groups[GROUP_A.c_str()];
  EXPECT_EQ(1, group["completions"].GetInt64());
  EXPECT_EQ(0, group["rejections"].GetInt64());
  EXPECT_EQ(1, group["failures"].GetInt64());
  EXPECT_EQ(0, group["total_cancellations"].GetInt64());
  EXPECT_EQ(0, group["active_queries"].GetInt64());
  for (const char* resource : {"cpu", "memory"}) {
    ASSERT_TRUE(group.HasMember(resource)) << json;
    const Value& r = group[resource];
    EXPECT_EQ(0, r["cancellations"].GetInt64());
    EXPECT_EQ(0, r["rejections"].GetInt64());
    EXPECT_TRUE(r["current_usage"].IsNumber());
    EXPECT_TRUE(r["last_recorded_usage"].IsNumber());
  }

  string pretty = QueryGroupStatsToJson(vector<QueryGroupStats>(), true);
  document.Parse(pretty.c_str());
  ASSERT_FALSE(document.HasParseError()) << pretty;
  EXPECT_TRUE(document["query_groups"].ObjectEmpty());
}

// Counters read by concurrent snapshots never go backwards.
TEST_F(QueryGroupServiceTest, SnapshotsAreMonotonic) {
  const int NUM_WRITERS = 4;
  const int NUM_QUERIES = 500;
  AddGroup(GROUP_A, ResiliencyMode::MONITOR, 0.5);
  AtomicBool done{false};
  thread_group writers;
  for (int i = 0; i < NUM_WRITERS; ++i) {
    writers.add_thread(new thread([this, i]() {
      for (int j = 0; j < NUM_QUERIES; ++j) {
        shared_ptr<QueryExecutionContext> query;
        string query_id = Substitute("q-$0-$1", i, j);
        if (!service_->StartQuery(query_id, GROUP_A, &query).ok()) continue;
        query->UpdateUsage(ResourceType::CPU, 1);
        service_->FinishQuery(query.get(), j % 2 == 0 ? Status::OK() : Status("failed"));
      }
    }));
  }
  thread reader([this, &done]() {
    QueryGroupStats last = GetStats(GROUP_A);
    while (!done.Load()) {
      QueryGroupStats current = GetStats(GROUP_A);
      EXPECT_GE(current.completions, last.completions);
      EXPECT_GE(current.failures, last.failures);
      EXPECT_GE(current.active_queries, 0);
      last = current;
    }
  });
  writers.join_all();
  done.Store(true);
  reader.join();

  QueryGroupStats stats = GetStats(GROUP_A);
  EXPECT_EQ(NUM_WRITERS * NUM_QUERIES / 2, stats.completions);
  EXPECT_EQ(NUM_WRITERS * NUM_QUERIES / 2, stats.failures);
  EXPECT_EQ(0, stats.active_queries);
  EXPECT_EQ(0, stats.resource(ResourceType::CPU)->usage);
}

TEST_F(QueryGroupServiceTest, InitAndShutdown) {
  ASSERT_OK(service_->Init());
  service_->Shutdown();

  WorkloadManagementSettings invalid = MakeTestSettings();
  invalid.enforcement_interval_ms = -5;
  QueryGroupService service(invalid);
  EXPECT_ERROR(service.Init(), ErrorCode::INVALID_FLAG_VALUE);
}

}

WLM_TEST_MAIN();
