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

#include "wlm/query-group-registry.h"

#include <boost/thread/thread.hpp>

#include "testutil/gtest-util.h"

#include "common/names.h"

namespace wlm {

static const string GROUP_A = "analytics";
static const string GROUP_B = "etl";

TEST(QueryGroupRegistryTest, DefaultGroupAlwaysExists) {
  QueryGroupRegistry registry(TrackedResourceSet::All());
  EXPECT_EQ(1, registry.size());
  shared_ptr<QueryGroupState> state =
      registry.Get(QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID);
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID, state->group_id());

  // The default group can never be removed.
  EXPECT_FALSE(registry.Deregister(QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID));
  EXPECT_TRUE(registry.Contains(QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID));
}

TEST(QueryGroupRegistryTest, GetOrCreate) {
  QueryGroupRegistry registry(TrackedResourceSet::All());
  EXPECT_TRUE(registry.Get(GROUP_A) == nullptr);
  shared_ptr<QueryGroupState> a = registry.GetOrCreate(GROUP_A);
  ASSERT_TRUE(a != nullptr);
  EXPECT_EQ(a, registry.GetOrCreate(GROUP_A));
  EXPECT_EQ(a, registry.Get(GROUP_A));
  EXPECT_NE(a, registry.GetOrCreate(GROUP_B));
  EXPECT_EQ(3, registry.size());
  EXPECT_EQ(3, registry.GetAll().size());
}

TEST(QueryGroupRegistryTest, TrackedResourcesAreFixed) {
  TrackedResourceSet cpu_only;
  cpu_only.Add(ResourceType::CPU);
  QueryGroupRegistry registry(cpu_only);
  shared_ptr<QueryGroupState> state = registry.GetOrCreate(GROUP_A);
  EXPECT_TRUE(state->tracked_resources() == cpu_only);
  EXPECT_TRUE(state->resource_state(ResourceType::CPU) != nullptr);
  EXPECT_TRUE(state->resource_state(ResourceType::MEMORY) == nullptr);
  EXPECT_EQ(0, state->usage(ResourceType::MEMORY));
}

// Many threads racing to create the same group must all end up with one instance.
TEST(QueryGroupRegistryTest, ConcurrentGetOrCreate) {
  const int NUM_THREADS = 16;
  const int NUM_GROUPS = 50;
  QueryGroupRegistry registry(TrackedResourceSet::All());
  vector<vector<QueryGroupState*>> seen(NUM_THREADS);
  thread_group threads;
  for (int i = 0; i < NUM_THREADS; ++i) {
    vector<QueryGroupState*>* out = &seen[i];
    threads.add_thread(new thread([&registry, out]() {
      for (int g = 0; g < NUM_GROUPS; ++g) {
        out->push_back(registry.GetOrCreate(Substitute("group-$0", g)).get());
      }
    }));
  }
  threads.join_all();
  EXPECT_EQ(NUM_GROUPS + 1, registry.size());
  for (int g = 0; g < NUM_GROUPS; ++g) {
    QueryGroupState* expected = registry.Get(Substitute("group-$0", g)).get();
    for (int i = 0; i < NUM_THREADS; ++i) EXPECT_EQ(expected, seen[i][g]);
  }
}

TEST(QueryGroupRegistryTest, DeregisterIdleGroup) {
  QueryGroupRegistry registry(TrackedResourceSet::All());
  registry.GetOrCreate(GROUP_A);
  EXPECT_TRUE(registry.Deregister(GROUP_A));
  EXPECT_FALSE(registry.Contains(GROUP_A));
  // Unknown groups are reported as such.
  EXPECT_FALSE(registry.Deregister(GROUP_A));
  EXPECT_FALSE(registry.Deregister("no-such-group"));
}

// A group with active queries stays until its last query is released.
TEST(QueryGroupRegistryTest, DeferredRemoval) {
  QueryGroupRegistry registry(TrackedResourceSet::All());
  registry.GetOrCreate(GROUP_A);
  shared_ptr<QueryGroupState> q1 = registry.AcquireForQuery(GROUP_A);
  shared_ptr<QueryGroupState> q2 = registry.AcquireForQuery(GROUP_A);
  ASSERT_TRUE(q1 != nullptr);
  EXPECT_EQ(q1, q2);
  EXPECT_EQ(2, q1->active_queries());

  EXPECT_TRUE(registry.Deregister(GROUP_A));
  EXPECT_TRUE(registry.Contains(GROUP_A));
  EXPECT_TRUE(q1->pending_removal());
  // No new queries join a group that is going away.
  EXPECT_TRUE(registry.AcquireForQuery(GROUP_A) == nullptr);

  registry.ReleaseQuery(q1);
  EXPECT_TRUE(registry.Contains(GROUP_A));
  registry.ReleaseQuery(q2);
  EXPECT_FALSE(registry.Contains(GROUP_A));
  EXPECT_EQ(0, q1->active_queries());
}

// A group created again after its removal starts from zero.
TEST(QueryGroupRegistryTest, RecreateAfterRemoval) {
  QueryGroupRegistry registry(TrackedResourceSet::All());
  shared_ptr<QueryGroupState> old_state = registry.GetOrCreate(GROUP_A);
  old_state->IncrementCompletions();
  old_state->RecordRejection(ResourceType::CPU);
  ResourceType cpu = ResourceType::CPU;
  old_state->RecordCancellation(&cpu);
  old_state->IncrementFailures();
  EXPECT_TRUE(registry.Deregister(GROUP_A));

  shared_ptr<QueryGroupState> new_state = registry.GetOrCreate(GROUP_A);
  EXPECT_NE(old_state, new_state);
  EXPECT_EQ(0, new_state->completions());
  EXPECT_EQ(0, new_state->total_rejections());
  EXPECT_EQ(0, new_state->failures());
  EXPECT_EQ(0, new_state->total_cancellations());
  EXPECT_EQ(0, new_state->resource_state(ResourceType::CPU)->rejections());
  EXPECT_EQ(0, new_state->resource_state(ResourceType::CPU)->cancellations());
}

// Registering a group again while its removal is pending keeps the group and its
// counters.
TEST(QueryGroupRegistryTest, RecreateWhileRemovalPending) {
  QueryGroupRegistry registry(TrackedResourceSet::All());
  registry.GetOrCreate(GROUP_A);
  shared_ptr<QueryGroupState> query = registry.AcquireForQuery(GROUP_A);
  query->IncrementCompletions();
  EXPECT_TRUE(registry.Deregister(GROUP_A));
  EXPECT_TRUE(query->pending_removal());

  shared_ptr<QueryGroupState> state = registry.GetOrCreate(GROUP_A);
  EXPECT_EQ(query, state);
  EXPECT_FALSE(state->pending_removal());
  EXPECT_EQ(1, state->completions());

  registry.ReleaseQuery(query);
  EXPECT_TRUE(registry.Contains(GROUP_A));
}

// Registering and removing a group again while its last query runs still removes it
// once that query is released.
TEST(QueryGroupRegistryTest, RemovedAgainWhilePending) {
  QueryGroupRegistry registry(TrackedResourceSet::All());
  registry.GetOrCreate(GROUP_A);
  shared_ptr<QueryGroupState> query = registry.AcquireForQuery(GROUP_A);
  EXPECT_TRUE(registry.Deregister(GROUP_A));
  // Pending removal, so a fresh registration reuses the same state.
  EXPECT_EQ(query, registry.GetOrCreate(GROUP_A));
  EXPECT_TRUE(registry.Deregister(GROUP_A));
  registry.ReleaseQuery(query);
  EXPECT_FALSE(registry.Contains(GROUP_A));

  shared_ptr<QueryGroupState> fresh = registry.GetOrCreate(GROUP_A);
  EXPECT_NE(query, fresh);
  EXPECT_TRUE(registry.Contains(GROUP_A));
}

TEST(QueryGroupRegistryTest, ConcurrentAcquireAndRelease) {
  const int NUM_THREADS = 8;
  const int NUM_ITERS = 1000;
  QueryGroupRegistry registry(TrackedResourceSet::All());
  registry.GetOrCreate(GROUP_A);
  thread_group threads;
  for (int i = 0; i < NUM_THREADS; ++i) {
    threads.add_thread(new thread([&registry]() {
      for (int j = 0; j < NUM_ITERS; ++j) {
        shared_ptr<QueryGroupState> state = registry.AcquireForQuery(GROUP_A);
        ASSERT_TRUE(state != nullptr);
        registry.ReleaseQuery(state);
      }
    }));
  }
  threads.join_all();
  shared_ptr<QueryGroupState> state = registry.Get(GROUP_A);
  ASSERT_TRUE(state != nullptr);
  EXPECT_EQ(0, state->active_queries());
}

}

WLM_TEST_MAIN();
