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

#include "wlm/resource-usage-tracker.h"

#include <boost/thread/thread.hpp>

#include "common/atomic.h"
#include "testutil/gtest-util.h"
#include "wlm/query-execution-context.h"
#include "wlm/wlm-test-util.h"

#include "common/names.h"

namespace wlm {
using namespace wlm::test;

static const string GROUP = "reporting";

class ResourceUsageTrackerTest : public testing::Test {
 protected:
  ResourceUsageTrackerTest()
    : settings_(MakeTestSettings()),
      registry_(settings_.tracked_resources),
      tracker_(&registry_, settings_) {}

  virtual void SetUp() { group_ = registry_.GetOrCreate(GROUP); }

  /// Start a query in GROUP the way the service does.
  unique_ptr<QueryExecutionContext> StartQuery(const string& query_id) {
    shared_ptr<QueryGroupState> state = registry_.AcquireForQuery(GROUP);
    EXPECT_TRUE(state != nullptr);
    return unique_ptr<QueryExecutionContext>(
        new QueryExecutionContext(query_id, state, &registry_));
  }

  WorkloadManagementSettings settings_;
  QueryGroupRegistry registry_;
  ResourceUsageTracker tracker_;
  shared_ptr<QueryGroupState> group_;
};

TEST(ResourceTypeTest, Names) {
  EXPECT_STREQ("cpu", ResourceTypeToString(ResourceType::CPU));
  EXPECT_STREQ("memory", ResourceTypeToString(ResourceType::MEMORY));
  ResourceType type;
  EXPECT_TRUE(ResourceTypeFromString("MEMORY", &type));
  EXPECT_EQ(ResourceType::MEMORY, type);
  EXPECT_TRUE(ResourceTypeFromString("Cpu", &type));
  EXPECT_EQ(ResourceType::CPU, type);
  EXPECT_FALSE(ResourceTypeFromString("disk", &type));
}

TEST(ResourceTypeTest, CpuTimeToMillicores) {
  const int64_t SECOND_NS = 1000L * 1000L * 1000L;
  // Two cores fully busy for one second.
  EXPECT_EQ(2000, CpuTimeToMillicores(2 * SECOND_NS, SECOND_NS));
  EXPECT_EQ(250, CpuTimeToMillicores(SECOND_NS / 4, SECOND_NS));
  EXPECT_EQ(0, CpuTimeToMillicores(SECOND_NS, 0));
  EXPECT_EQ(0, CpuTimeToMillicores(0, SECOND_NS));
  // Does not overflow for long running queries.
  const int64_t WEEK_NS = 7L * 24 * 3600 * SECOND_NS;
  EXPECT_EQ(16000, CpuTimeToMillicores(16 * WEEK_NS, WEEK_NS));
}

TEST(ResourceTypeTest, TrackedResourceSet) {
  TrackedResourceSet set;
  EXPECT_TRUE(set.empty());
  set.Add(ResourceType::MEMORY);
  EXPECT_FALSE(set.Contains(ResourceType::CPU));
  EXPECT_TRUE(set.Contains(ResourceType::MEMORY));
  EXPECT_EQ("[memory]", set.DebugString());
  EXPECT_EQ("[cpu, memory]", TrackedResourceSet::All().DebugString());
  EXPECT_EQ(2, TrackedResourceSet::All().types().size());
}

TEST_F(ResourceUsageTrackerTest, Attribute) {
  tracker_.Attribute(GROUP, ResourceType::CPU, 30);
  tracker_.Attribute(GROUP, ResourceType::MEMORY, 250);
  tracker_.Attribute(GROUP, ResourceType::CPU, -10);
  EXPECT_EQ(20, tracker_.CurrentUsage(GROUP, ResourceType::CPU));
  EXPECT_EQ(250, tracker_.CurrentUsage(GROUP, ResourceType::MEMORY));
  EXPECT_DOUBLE_EQ(0.2, tracker_.UsageFraction(*group_, ResourceType::CPU));
  EXPECT_DOUBLE_EQ(0.25, tracker_.UsageFraction(*group_, ResourceType::MEMORY));

  // Usage of groups that do not exist is dropped.
  tracker_.Attribute("unknown", ResourceType::CPU, 10);
  EXPECT_EQ(0, tracker_.CurrentUsage("unknown", ResourceType::CPU));
  EXPECT_FALSE(registry_.Contains("unknown"));
}

TEST_F(ResourceUsageTrackerTest, FractionToUnits) {
  EXPECT_EQ(10, tracker_.FractionToUnits(ResourceType::CPU, 0.1));
  EXPECT_EQ(105, tracker_.FractionToUnits(ResourceType::MEMORY, 0.1055));
  EXPECT_EQ(100, tracker_.FractionToUnits(ResourceType::CPU, 1.0));
  // 0.29 * 100 and 0.57 * 100 round below the exact product.
  EXPECT_EQ(29, tracker_.FractionToUnits(ResourceType::CPU, 0.29));
  EXPECT_EQ(57, tracker_.FractionToUnits(ResourceType::CPU, 0.57));
  EXPECT_EQ(570, tracker_.FractionToUnits(ResourceType::MEMORY, 0.57));
  // The result is the largest usage that does not exceed the fraction.
  for (int percent = 1; percent <= 100; ++percent) {
    double fraction = percent / 100.0;
    int64_t units = tracker_.FractionToUnits(ResourceType::CPU, fraction);
    EXPECT_EQ(percent, units) << fraction;
    group_->resource_state(ResourceType::CPU)->AddUsage(units);
    EXPECT_FALSE(tracker_.UsageFraction(*group_, ResourceType::CPU) > fraction);
    group_->resource_state(ResourceType::CPU)->AddUsage(1);
    EXPECT_TRUE(tracker_.UsageFraction(*group_, ResourceType::CPU) > fraction);
    group_->resource_state(ResourceType::CPU)->AddUsage(-units - 1);
  }
}

TEST(ResourceUsageTrackerUntrackedTest, UntrackedResourceIgnored) {
  WorkloadManagementSettings settings = MakeTestSettings();
  settings.tracked_resources = TrackedResourceSet().Add(ResourceType::CPU);
  QueryGroupRegistry registry(settings.tracked_resources);
  ResourceUsageTracker tracker(&registry, settings);
  registry.GetOrCreate(GROUP);
  tracker.Attribute(GROUP, ResourceType::MEMORY, 500);
  tracker.Attribute(GROUP, ResourceType::CPU, 5);
  EXPECT_EQ(0, tracker.CurrentUsage(GROUP, ResourceType::MEMORY));
  EXPECT_EQ(5, tracker.CurrentUsage(GROUP, ResourceType::CPU));
}

// No attribution may be lost when many threads update the same group.
TEST_F(ResourceUsageTrackerTest, ConcurrentAttribution) {
  const int NUM_THREADS = 16;
  const int NUM_UPDATES = 10000;
  thread_group threads;
  for (int i = 0; i < NUM_THREADS; ++i) {
    threads.add_thread(new thread([this, i]() {
      for (int j = 0; j < NUM_UPDATES; ++j) {
        tracker_.Attribute(GROUP, ResourceType::CPU, 1);
        // Paired memory updates cancel out.
        tracker_.Attribute(GROUP, ResourceType::MEMORY, i + 1);
        tracker_.Attribute(GROUP, ResourceType::MEMORY, -(i + 1));
      }
    }));
  }
  threads.join_all();
  EXPECT_EQ(NUM_THREADS * NUM_UPDATES, tracker_.CurrentUsage(GROUP, ResourceType::CPU));
  EXPECT_EQ(0, tracker_.CurrentUsage(GROUP, ResourceType::MEMORY));
}

TEST_F(ResourceUsageTrackerTest, QueryUsageUpdates) {
  unique_ptr<QueryExecutionContext> q1 = StartQuery("q1");
  unique_ptr<QueryExecutionContext> q2 = StartQuery("q2");
  EXPECT_EQ(2, group_->active_queries());

  q1->UpdateUsage(ResourceType::CPU, 40);
  q1->UpdateUsage(ResourceType::CPU, 25);
  q2->UpdateUsage(ResourceType::CPU, 10);
  q2->AddUsage(ResourceType::MEMORY, 300);
  q2->AddUsage(ResourceType::MEMORY, -100);
  EXPECT_EQ(25, q1->usage(ResourceType::CPU));
  EXPECT_EQ(200, q2->usage(ResourceType::MEMORY));
  EXPECT_EQ(35, group_->usage(ResourceType::CPU));
  EXPECT_EQ(200, group_->usage(ResourceType::MEMORY));

  // Half a core over one second is 500 millicores.
  q1->UpdateCpuTime(500L * 1000L * 1000L, 1000L * 1000L * 1000L);
  EXPECT_EQ(500, q1->usage(ResourceType::CPU));
  EXPECT_EQ(510, group_->usage(ResourceType::CPU));

  EXPECT_TRUE(q1->ReleaseResources());
  EXPECT_EQ(10, group_->usage(ResourceType::CPU));
  EXPECT_EQ(1, group_->active_queries());
  // Updates after the release are dropped.
  q1->UpdateUsage(ResourceType::CPU, 70);
  q1->AddUsage(ResourceType::MEMORY, 70);
  EXPECT_EQ(0, q1->usage(ResourceType::CPU));
  EXPECT_EQ(10, group_->usage(ResourceType::CPU));
  EXPECT_EQ(200, group_->usage(ResourceType::MEMORY));

  // Destroying the context releases what is left.
  q2.reset();
  EXPECT_EQ(0, group_->usage(ResourceType::CPU));
  EXPECT_EQ(0, group_->usage(ResourceType::MEMORY));
  EXPECT_EQ(0, group_->active_queries());
}

// Concurrent releases of the same query subtract its usage exactly once.
TEST_F(ResourceUsageTrackerTest, ReleaseExactlyOnce) {
  const int NUM_THREADS = 16;
  tracker_.Attribute(GROUP, ResourceType::CPU, 7);
  unique_ptr<QueryExecutionContext> query = StartQuery("q1");
  query->UpdateUsage(ResourceType::CPU, 30);
  query->UpdateUsage(ResourceType::MEMORY, 400);
  AtomicInt32 num_released;
  thread_group threads;
  for (int i = 0; i < NUM_THREADS; ++i) {
    threads.add_thread(new thread([&query, &num_released]() {
      if (query->ReleaseResources()) num_released.Add(1);
    }));
  }
  threads.join_all();
  EXPECT_EQ(1, num_released.Load());
  EXPECT_EQ(7, group_->usage(ResourceType::CPU));
  EXPECT_EQ(0, group_->usage(ResourceType::MEMORY));
  EXPECT_EQ(0, group_->active_queries());
}

// Updates racing with the release either land before it and are subtracted, or are
// dropped. The group never keeps usage of a released query.
TEST_F(ResourceUsageTrackerTest, ReleaseRacingWithUpdates) {
  const int NUM_ITERS = 200;
  for (int i = 0; i < NUM_ITERS; ++i) {
    unique_ptr<QueryExecutionContext> query = StartQuery(Substitute("q$0", i));
    thread_group threads;
    threads.add_thread(new thread([&query]() {
      for (int j = 0; j < 100; ++j) query->AddUsage(ResourceType::CPU, 1);
    }));
    threads.add_thread(new thread([&query]() { query->ReleaseResources(); }));
    threads.join_all();
    EXPECT_EQ(0, group_->usage(ResourceType::CPU)) << "iteration " << i;
  }
  EXPECT_EQ(0, group_->active_queries());
}

TEST_F(ResourceUsageTrackerTest, FinishOutcomes) {
  unique_ptr<QueryExecutionContext> ok = StartQuery("ok");
  unique_ptr<QueryExecutionContext> failed = StartQuery("failed");
  unique_ptr<QueryExecutionContext> cancelled = StartQuery("cancelled");
  ok->UpdateUsage(ResourceType::MEMORY, 100);

  ok->Finish(Status::OK());
  failed->Finish(Status("disk full"));
  cancelled->Finish(
      Status::Expected(
          ErrorCode::QUERY_GROUP_CANCELLED, "cancelled", GROUP, "cpu", 1, 0));
  // Only the first outcome counts.
  ok->Finish(Status("late failure"));

  EXPECT_TRUE(ok->finished());
  EXPECT_EQ(1, group_->completions());
  EXPECT_EQ(1, group_->failures());
  EXPECT_EQ(0, group_->usage(ResourceType::MEMORY));
  EXPECT_EQ(0, group_->active_queries());
}

}

WLM_TEST_MAIN();
