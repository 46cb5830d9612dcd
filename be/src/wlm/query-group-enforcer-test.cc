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

#include "wlm/query-group-enforcer.h"

#include <stdexcept>
#include <boost/thread/thread.hpp>

#include "testutil/gtest-util.h"
#include "util/time.h"
#include "wlm/admission-controller.h"
#include "wlm/wlm-test-util.h"

#include "common/names.h"

namespace wlm {
using namespace wlm::test;

static const string GROUP_A = "batch";
static const string GROUP_B = "interactive";

class QueryGroupEnforcerTest : public testing::Test {
 protected:
  QueryGroupEnforcerTest() : settings_(MakeTestSettings()) {}

  virtual void SetUp() { Reset(settings_); }

  virtual void TearDown() {
    if (enforcer_ != nullptr) enforcer_->Shutdown();
  }

  void Reset(const WorkloadManagementSettings& settings) {
    enforcer_.reset();
    tracker_.reset();
    registry_.reset(new QueryGroupRegistry(settings.tracked_resources));
    configs_.reset(new InMemoryQueryGroupConfigStore());
    engine_.reset(new FakeExecutionEngine());
    tracker_.reset(new ResourceUsageTracker(registry_.get(), settings));
    enforcer_.reset(new QueryGroupEnforcer(registry_.get(), configs_.get(),
        tracker_.get(), engine_.get(), settings, [this]() {
          if (duress_throws_) throw std::runtime_error("duress check failed");
          if (duress_throws_unknown_) throw 42;
          ++num_duress_checks_;
          if (max_duress_checks_ >= 0 && num_duress_checks_ > max_duress_checks_) {
            return false;
          }
          return in_duress_;
        }));
  }

  /// Register 'id' with a hard limit of 'fraction' on 'type'.
  void AddGroup(const string& id, ResiliencyMode mode, ResourceType type,
      double fraction) {
    QueryGroupConfig config(id, mode);
    config.SetHardLimit(type, fraction);
    ASSERT_OK(configs_->Put(config));
    registry_->GetOrCreate(id);
  }

  /// Add a running query to 'group_id' and attribute its usage to the group.
  void AddQuery(const string& group_id, const string& query_id, int64_t cpu,
      int64_t memory = 0, bool cancelled = false) {
    engine_->AddQuery(group_id, MakeRunningQuery(query_id, cpu, memory, cancelled));
    tracker_->Attribute(group_id, ResourceType::CPU, cpu);
    tracker_->Attribute(group_id, ResourceType::MEMORY, memory);
  }

  shared_ptr<QueryGroupState> group(const string& id) { return registry_->Get(id); }

  /// Deregister 'id' while 'query_id' still runs in it. Returns the state the query
  /// holds, to be released by the caller.
  shared_ptr<QueryGroupState> AddRemovedGroup(const string& id, const string& query_id,
      int64_t cpu) {
    AddGroup(id, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.5);
    shared_ptr<QueryGroupState> state = registry_->AcquireForQuery(id);
    AddQuery(id, query_id, cpu);
    configs_->Remove(id);
    EXPECT_TRUE(registry_->Deregister(id));
    EXPECT_TRUE(state->pending_removal());
    return state;
  }

  WorkloadManagementSettings settings_;
  bool in_duress_ = false;
  bool duress_throws_ = false;
  bool duress_throws_unknown_ = false;
  /// If not negative, the node leaves duress after this many checks.
  int max_duress_checks_ = -1;
  int num_duress_checks_ = 0;
  unique_ptr<QueryGroupRegistry> registry_;
  unique_ptr<InMemoryQueryGroupConfigStore> configs_;
  unique_ptr<FakeExecutionEngine> engine_;
  unique_ptr<ResourceUsageTracker> tracker_;
  unique_ptr<QueryGroupEnforcer> enforcer_;
};

TEST(MaximumUsageSelectionStrategyTest, SelectVictims) {
  MaximumUsageSelectionStrategy strategy;
  vector<RunningQuery> queries = {MakeRunningQuery("q3", 3), MakeRunningQuery("q1", 10),
      MakeRunningQuery("q2", 5), MakeRunningQuery("idle", 0)};

  vector<const RunningQuery*> victims =
      strategy.SelectVictims(queries, ResourceType::CPU, 8);
  ASSERT_EQ(1, victims.size());
  EXPECT_EQ("q1", victims[0]->query_id);

  victims = strategy.SelectVictims(queries, ResourceType::CPU, 12);
  ASSERT_EQ(2, victims.size());
  EXPECT_EQ("q1", victims[0]->query_id);
  EXPECT_EQ("q2", victims[1]->query_id);

  // Queries without usage never help, even if the excess is not covered.
  victims = strategy.SelectVictims(queries, ResourceType::CPU, 100);
  EXPECT_EQ(3, victims.size());

  EXPECT_TRUE(strategy.SelectVictims(queries, ResourceType::CPU, 0).empty());
  EXPECT_TRUE(strategy.SelectVictims(queries, ResourceType::MEMORY, 5).empty());
}

TEST(MaximumUsageSelectionStrategyTest, TiesBrokenByQueryId) {
  MaximumUsageSelectionStrategy strategy;
  vector<RunningQuery> queries = {MakeRunningQuery("b", 5), MakeRunningQuery("c", 5),
      MakeRunningQuery("a", 5)};
  vector<const RunningQuery*> victims =
      strategy.SelectVictims(queries, ResourceType::CPU, 3);
  ASSERT_EQ(1, victims.size());
  EXPECT_EQ("a", victims[0]->query_id);
}

// Usage 18 against a limit of 10 leaves an excess of 8, which the largest query covers.
TEST_F(QueryGroupEnforcerTest, CancelLargestQuery) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 10);
  AddQuery(GROUP_A, "q2", 5);
  AddQuery(GROUP_A, "q3", 3);
  EXPECT_TRUE(enforcer_->RunCycle());

  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
  Status reason = engine_->cancel_reason("q1");
  EXPECT_ERROR(reason, ErrorCode::QUERY_GROUP_CANCELLED);
  EXPECT_TRUE(reason.IsCancelled());
  EXPECT_STR_CONTAINS(reason.GetDetail(), GROUP_A);
  EXPECT_STR_CONTAINS(reason.GetDetail(), "cpu");

  EXPECT_EQ(1, group(GROUP_A)->total_cancellations());
  EXPECT_EQ(1, group(GROUP_A)->resource_state(ResourceType::CPU)->cancellations());
  EXPECT_EQ(0, group(GROUP_A)->resource_state(ResourceType::MEMORY)->cancellations());
  EXPECT_EQ(1, enforcer_->num_cancellations());
  EXPECT_EQ(1, enforcer_->num_cycles());

  // The cancelled query still counts against the group until it finishes, but it
  // already covers the excess.
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(1, engine_->cancelled_ids().size());
  EXPECT_EQ(2, enforcer_->num_cycles());
}

TEST_F(QueryGroupEnforcerTest, NoCancellationWithinLimit) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.2);
  AddQuery(GROUP_A, "q1", 15);
  AddQuery(GROUP_A, "q2", 5);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
  EXPECT_EQ(0, engine_->num_cancel_calls());
}

TEST_F(QueryGroupEnforcerTest, CancelUntilExcessCovered) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.06);
  AddQuery(GROUP_A, "q1", 10);
  AddQuery(GROUP_A, "q2", 5);
  AddQuery(GROUP_A, "q3", 3);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"q1", "q2"}), engine_->cancelled_ids());
  EXPECT_EQ(2, group(GROUP_A)->total_cancellations());
}

// A group using exactly its limit is admitted, so it must not be cancelled either.
TEST_F(QueryGroupEnforcerTest, UsageAtLimitNotCancelled) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.29);
  AddQuery(GROUP_A, "q1", 29);
  AdmissionController controller(
      registry_.get(), configs_.get(), tracker_.get(), settings_, NodeDuressFn());
  EXPECT_TRUE(controller.Admit(GROUP_A).admitted());
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
  EXPECT_EQ(0, engine_->num_cancel_calls());

  // One unit more is a breach for both.
  AddQuery(GROUP_A, "q2", 1);
  EXPECT_FALSE(controller.Admit(GROUP_A).admitted());
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
}

TEST_F(QueryGroupEnforcerTest, CancellationThresholdScalesLimit) {
  WorkloadManagementSettings settings = MakeTestSettings();
  settings.node_cancellation_threshold[ResourceTypeIndex(ResourceType::MEMORY)] = 0.5;
  Reset(settings);
  // Effective limit is 0.2 of 1000 bytes.
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::MEMORY, 0.4);
  AddQuery(GROUP_A, "q1", 0, 150);
  AddQuery(GROUP_A, "q2", 0, 100);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
  EXPECT_EQ(1, group(GROUP_A)->resource_state(ResourceType::MEMORY)->cancellations());
}

// Queries already being cancelled reduce the excess before any new victim is chosen.
TEST_F(QueryGroupEnforcerTest, CancelledQueriesCredited) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 10, 0, true);
  AddQuery(GROUP_A, "q2", 5);
  AddQuery(GROUP_A, "q3", 3);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
}

// A query cancelled for one resource also counts against the excess of the next.
TEST_F(QueryGroupEnforcerTest, MultiResourceCredit) {
  QueryGroupConfig config(GROUP_A, ResiliencyMode::ENFORCED);
  config.SetHardLimit(ResourceType::CPU, 0.1).SetHardLimit(ResourceType::MEMORY, 0.1);
  ASSERT_OK(configs_->Put(config));
  registry_->GetOrCreate(GROUP_A);
  AddQuery(GROUP_A, "q1", 20, 150);
  AddQuery(GROUP_A, "q2", 2, 60);
  EXPECT_TRUE(enforcer_->RunCycle());
  // q1 covers the CPU excess of 12 and the memory excess of 110.
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
  shared_ptr<QueryGroupState> state = group(GROUP_A);
  EXPECT_EQ(1, state->total_cancellations());
  EXPECT_EQ(1, state->resource_state(ResourceType::CPU)->cancellations());
  EXPECT_EQ(0, state->resource_state(ResourceType::MEMORY)->cancellations());
}

TEST_F(QueryGroupEnforcerTest, FinishedQueryNotCounted) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 10);
  AddQuery(GROUP_A, "q2", 5);
  engine_->SetFinished("q1");
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(1, engine_->num_cancel_calls());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
  EXPECT_EQ(0, group(GROUP_A)->total_cancellations());
  EXPECT_EQ(0, enforcer_->num_cancellations());
}

TEST_F(QueryGroupEnforcerTest, ListingFailureSkipsGroup) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddGroup(GROUP_B, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "a1", 20);
  AddQuery(GROUP_B, "b1", 20);
  engine_->SetListStatus(GROUP_A, Status("executor unavailable"));
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"b1"}), engine_->cancelled_ids());
  EXPECT_EQ(1, enforcer_->num_enumeration_failures());
  EXPECT_EQ(0, enforcer_->num_failed_cycles());
  EXPECT_EQ(0, group(GROUP_A)->total_cancellations());
}

TEST_F(QueryGroupEnforcerTest, ListingExceptionSkipsGroup) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddGroup(GROUP_B, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "a1", 20);
  AddQuery(GROUP_B, "b1", 20);
  engine_->SetListThrows(GROUP_B);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"a1"}), engine_->cancelled_ids());
  EXPECT_EQ(1, enforcer_->num_enumeration_failures());
  EXPECT_EQ(1, enforcer_->num_cycles());
}

// Queries of removed groups are still cancelled when listing another removed group
// throws.
TEST_F(QueryGroupEnforcerTest, RemovedGroupListingExceptionSkipsGroup) {
  shared_ptr<QueryGroupState> a = AddRemovedGroup(GROUP_A, "a1", 5);
  shared_ptr<QueryGroupState> b = AddRemovedGroup(GROUP_B, "b1", 5);
  engine_->SetListThrows(GROUP_A);
  in_duress_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"b1"}), engine_->cancelled_ids());
  EXPECT_EQ(1, enforcer_->num_enumeration_failures());
  EXPECT_EQ(0, enforcer_->num_failed_cycles());
  EXPECT_EQ(1, enforcer_->num_cycles());
  registry_->ReleaseQuery(a);
  registry_->ReleaseQuery(b);
}

// A failing cycle is counted and does not prevent the next cycle from running.
TEST_F(QueryGroupEnforcerTest, FailedCycle) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 20);
  duress_throws_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(1, enforcer_->num_failed_cycles());
  EXPECT_EQ(0, enforcer_->num_cycles());
  duress_throws_ = false;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(1, enforcer_->num_cycles());
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
}

TEST_F(QueryGroupEnforcerTest, UnknownExceptionFailsCycle) {
  AddGroup(GROUP_A, ResiliencyMode::SOFT, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 20);
  in_duress_ = true;
  duress_throws_unknown_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(1, enforcer_->num_failed_cycles());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
  duress_throws_unknown_ = false;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(1, enforcer_->num_cycles());
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
}

// A cycle that starts while the previous one is still running is skipped.
TEST_F(QueryGroupEnforcerTest, OverlappingCycleSkipped) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 20);
  engine_->BlockNextListing();
  bool first_ran = false;
  thread first([this, &first_ran]() { first_ran = enforcer_->RunCycle(); });
  engine_->WaitUntilBlocked();
  EXPECT_FALSE(enforcer_->RunCycle());
  EXPECT_EQ(1, enforcer_->num_skipped_cycles());
  engine_->Unblock();
  first.join();
  EXPECT_TRUE(first_ran);
  EXPECT_EQ(1, enforcer_->num_cycles());
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
}

TEST_F(QueryGroupEnforcerTest, CancellationCapPerCycle) {
  WorkloadManagementSettings settings = MakeTestSettings();
  settings.max_cancellations_per_cycle = 1;
  Reset(settings);
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddGroup(GROUP_B, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "a1", 20);
  AddQuery(GROUP_B, "b1", 20);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(1, engine_->cancelled_ids().size());
  // The other group is handled in the next cycle.
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(2, engine_->cancelled_ids().size());
  EXPECT_EQ(2, enforcer_->num_cancellations());
}

// Enforced groups are handled before the queries of removed groups, so a removed
// group cannot use up the cancellations of a cycle.
TEST_F(QueryGroupEnforcerTest, EnforcedGroupsFirstInDuress) {
  WorkloadManagementSettings settings = MakeTestSettings();
  settings.max_cancellations_per_cycle = 1;
  Reset(settings);
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.5);
  AddQuery(GROUP_A, "e1", 80);
  shared_ptr<QueryGroupState> removed = AddRemovedGroup(GROUP_B, "o1", 5);
  in_duress_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"e1"}), engine_->cancelled_ids());
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"e1", "o1"}), engine_->cancelled_ids());
  registry_->ReleaseQuery(removed);
}

// SOFT groups are left alone once cancelling the queries of removed groups ends the
// duress.
TEST_F(QueryGroupEnforcerTest, SoftGroupsSparedAfterDuressRelieved) {
  AddGroup(GROUP_A, ResiliencyMode::SOFT, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "s1", 30);
  shared_ptr<QueryGroupState> removed = AddRemovedGroup(GROUP_B, "o1", 5);
  in_duress_ = true;
  max_duress_checks_ = 1;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"o1"}), engine_->cancelled_ids());
  EXPECT_EQ(2, num_duress_checks_);
  registry_->ReleaseQuery(removed);
}

TEST_F(QueryGroupEnforcerTest, MonitorModeNotEnforced) {
  AddGroup(GROUP_A, ResiliencyMode::MONITOR, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 50);
  in_duress_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
  // Usage is still recorded for the stats.
  EXPECT_DOUBLE_EQ(
      0.5, group(GROUP_A)->resource_state(ResourceType::CPU)->last_recorded_usage());
}

TEST_F(QueryGroupEnforcerTest, SoftModeEnforcedOnlyInDuress) {
  AddGroup(GROUP_A, ResiliencyMode::SOFT, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 30);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
  in_duress_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
}

TEST_F(QueryGroupEnforcerTest, UnconfiguredAndDefaultGroupsNotEnforced) {
  registry_->GetOrCreate(GROUP_A);
  AddQuery(GROUP_A, "q1", 90);
  AddQuery(QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID, "q2", 90);
  in_duress_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_TRUE(engine_->cancelled_ids().empty());
}

// Queries of a group removed while they run are cancelled once the node is in duress.
TEST_F(QueryGroupEnforcerTest, RemovedGroupCancelledInDuress) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.5);
  shared_ptr<QueryGroupState> state = registry_->AcquireForQuery(GROUP_A);
  AddQuery(GROUP_A, "q1", 5);
  configs_->Remove(GROUP_A);
  EXPECT_TRUE(registry_->Deregister(GROUP_A));
  ASSERT_TRUE(state->pending_removal());

  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_TRUE(engine_->cancelled_ids().empty());

  in_duress_ = true;
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
  Status reason = engine_->cancel_reason("q1");
  EXPECT_ERROR(reason, ErrorCode::QUERY_GROUP_REMOVED);
  EXPECT_TRUE(reason.IsCancelled());
  EXPECT_EQ(1, state->total_cancellations());
  EXPECT_EQ(0, state->resource_state(ResourceType::CPU)->cancellations());
  registry_->ReleaseQuery(state);
}

TEST_F(QueryGroupEnforcerTest, RecordUsage) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.5);
  AddQuery(GROUP_A, "q1", 18, 250);
  EXPECT_DOUBLE_EQ(
      0, group(GROUP_A)->resource_state(ResourceType::CPU)->last_recorded_usage());
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_DOUBLE_EQ(
      0.18, group(GROUP_A)->resource_state(ResourceType::CPU)->last_recorded_usage());
  EXPECT_DOUBLE_EQ(
      0.25, group(GROUP_A)->resource_state(ResourceType::MEMORY)->last_recorded_usage());
}

TEST_F(QueryGroupEnforcerTest, CustomSelectionStrategy) {
  // Picks the candidate with the smallest usage.
  class SmallestFirstStrategy : public TaskSelectionStrategy {
   public:
    vector<const RunningQuery*> SelectVictims(const vector<RunningQuery>& candidates,
        ResourceType type, int64_t excess) const override {
      const RunningQuery* smallest = nullptr;
      for (const RunningQuery& q : candidates) {
        if (smallest == nullptr || q.usage_of(type) < smallest->usage_of(type)) {
          smallest = &q;
        }
      }
      vector<const RunningQuery*> victims;
      if (smallest != nullptr && excess > 0) victims.push_back(smallest);
      return victims;
    }
  };
  enforcer_.reset(new QueryGroupEnforcer(registry_.get(), configs_.get(), tracker_.get(),
      engine_.get(), settings_, NodeDuressFn(),
      unique_ptr<TaskSelectionStrategy>(new SmallestFirstStrategy())));
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 10);
  AddQuery(GROUP_A, "q2", 5);
  EXPECT_TRUE(enforcer_->RunCycle());
  EXPECT_EQ(vector<string>({"q2"}), engine_->cancelled_ids());
}

// The background loop runs cycles at the configured interval until it is shut down.
TEST_F(QueryGroupEnforcerTest, EnforcementLoop) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, ResourceType::CPU, 0.1);
  AddQuery(GROUP_A, "q1", 20);
  ASSERT_OK(enforcer_->Init());
  int64_t deadline = MonotonicMillis() + 10000;
  while (enforcer_->num_cycles() < 3 && MonotonicMillis() < deadline) SleepForMs(5);
  EXPECT_GE(enforcer_->num_cycles(), 3);
  EXPECT_EQ(vector<string>({"q1"}), engine_->cancelled_ids());
  enforcer_->Shutdown();
  int64_t cycles = enforcer_->num_cycles();
  SleepForMs(50);
  EXPECT_EQ(cycles, enforcer_->num_cycles());
  // Shutting down twice is harmless.
  enforcer_->Shutdown();
}

}

WLM_TEST_MAIN();
