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

#include "wlm/query-group-config.h"

#include <gflags/gflags.h>

#include "testutil/gtest-util.h"
#include "testutil/scoped-flag-setter.h"
#include "wlm/workload-management-settings.h"

#include "common/names.h"

DECLARE_int32(wlm_max_cancellations_per_cycle);
DECLARE_int64(wlm_enforcement_interval_ms);
DECLARE_int64(wlm_node_cpu_capacity_millicores);
DECLARE_int64(wlm_node_memory_capacity_bytes);
DECLARE_double(wlm_node_cpu_rejection_threshold);
DECLARE_bool(wlm_memory_stats_enabled);

namespace wlm {

TEST(QueryGroupConfigTest, ResiliencyModeNames) {
  ResiliencyMode mode;
  EXPECT_TRUE(ResiliencyModeFromString("SOFT", &mode));
  EXPECT_EQ(ResiliencyMode::SOFT, mode);
  EXPECT_TRUE(ResiliencyModeFromString("monitor", &mode));
  EXPECT_EQ(ResiliencyMode::MONITOR, mode);
  EXPECT_TRUE(ResiliencyModeFromString("Enforced", &mode));
  EXPECT_EQ(ResiliencyMode::ENFORCED, mode);
  EXPECT_FALSE(ResiliencyModeFromString("strict", &mode));
  EXPECT_STREQ("soft", ResiliencyModeToString(ResiliencyMode::SOFT));
}

TEST(QueryGroupConfigTest, Validate) {
  QueryGroupConfig config("etl", ResiliencyMode::ENFORCED);
  EXPECT_FALSE(config.has_hard_limit(ResourceType::CPU));
  EXPECT_OK(config.Validate());

  config.SetHardLimit(ResourceType::CPU, 1.0).SetSoftLimit(ResourceType::CPU, 0.5);
  EXPECT_OK(config.Validate());
  EXPECT_TRUE(config.has_hard_limit(ResourceType::CPU));
  EXPECT_DOUBLE_EQ(0.5, config.soft_limit(ResourceType::CPU));

  QueryGroupConfig no_id("", ResiliencyMode::MONITOR);
  EXPECT_ERROR(no_id.Validate(), ErrorCode::QUERY_GROUP_INVALID_CONFIG);

  QueryGroupConfig zero = config;
  zero.SetHardLimit(ResourceType::MEMORY, 0);
  EXPECT_ERROR(zero.Validate(), ErrorCode::QUERY_GROUP_INVALID_CONFIG);

  QueryGroupConfig too_large = config;
  too_large.SetHardLimit(ResourceType::MEMORY, 1.5);
  Status status = too_large.Validate();
  EXPECT_ERROR(status, ErrorCode::QUERY_GROUP_INVALID_CONFIG);
  EXPECT_STR_CONTAINS(status.GetDetail(), "memory hard limit 1.5");

  QueryGroupConfig soft_above_hard = config;
  soft_above_hard.SetSoftLimit(ResourceType::CPU, 0.9)
      .SetHardLimit(ResourceType::CPU, 0.6);
  status = soft_above_hard.Validate();
  EXPECT_ERROR(status, ErrorCode::QUERY_GROUP_INVALID_CONFIG);
  EXPECT_STR_CONTAINS(status.GetDetail(), "above the hard limit");
}

TEST(QueryGroupConfigTest, Store) {
  InMemoryQueryGroupConfigStore store;
  EXPECT_TRUE(store.Get("etl") == nullptr);

  QueryGroupConfig config("etl", ResiliencyMode::ENFORCED);
  config.SetHardLimit(ResourceType::MEMORY, 0.3);
  ASSERT_OK(store.Put(config));
  shared_ptr<const QueryGroupConfig> stored = store.Get("etl");
  ASSERT_TRUE(stored != nullptr);
  EXPECT_DOUBLE_EQ(0.3, stored->hard_limit(ResourceType::MEMORY));

  // Invalid configs do not replace the current one.
  config.SetHardLimit(ResourceType::MEMORY, 2.0);
  EXPECT_ERROR(store.Put(config), ErrorCode::QUERY_GROUP_INVALID_CONFIG);
  EXPECT_DOUBLE_EQ(0.3, store.Get("etl")->hard_limit(ResourceType::MEMORY));

  EXPECT_TRUE(store.Remove("etl"));
  EXPECT_FALSE(store.Remove("etl"));
  EXPECT_TRUE(store.Get("etl") == nullptr);
  // Readers holding the old config keep a consistent copy.
  EXPECT_DOUBLE_EQ(0.3, stored->hard_limit(ResourceType::MEMORY));
}

TEST(QueryGroupConfigTest, SnapshotIsImmutable) {
  InMemoryQueryGroupConfigStore store;
  ASSERT_OK(store.Put(QueryGroupConfig("a", ResiliencyMode::SOFT)));
  InMemoryQueryGroupConfigStore::SnapshotPtr snapshot = store.GetSnapshot();
  ASSERT_OK(store.Put(QueryGroupConfig("b", ResiliencyMode::SOFT)));
  EXPECT_EQ(1, snapshot->size());
  EXPECT_EQ(2, store.GetSnapshot()->size());
}

TEST(WorkloadManagementSettingsTest, FromFlags) {
  google::FlagSaver saver;
  FLAGS_wlm_node_cpu_capacity_millicores = 8000;
  FLAGS_wlm_node_memory_capacity_bytes = 1L << 30;
  FLAGS_wlm_enforcement_interval_ms = 250;
  FLAGS_wlm_memory_stats_enabled = false;
  auto cap = ScopedFlagSetter<int32_t>::Make(&FLAGS_wlm_max_cancellations_per_cycle, 4);
  WorkloadManagementSettings settings = WorkloadManagementSettings::FromFlags();
  EXPECT_OK(settings.Validate());
  EXPECT_EQ(8000, settings.capacity(ResourceType::CPU));
  EXPECT_EQ(1L << 30, settings.capacity(ResourceType::MEMORY));
  EXPECT_EQ(250, settings.enforcement_interval_ms);
  EXPECT_EQ(4, settings.max_cancellations_per_cycle);
  EXPECT_TRUE(settings.tracked_resources.Contains(ResourceType::CPU));
  EXPECT_FALSE(settings.tracked_resources.Contains(ResourceType::MEMORY));
}

TEST(WorkloadManagementSettingsTest, CapacityFromHardware) {
  google::FlagSaver saver;
  FLAGS_wlm_node_cpu_capacity_millicores = 0;
  FLAGS_wlm_node_memory_capacity_bytes = 0;
  WorkloadManagementSettings settings = WorkloadManagementSettings::FromFlags();
  EXPECT_GE(settings.capacity(ResourceType::CPU), 1000);
  EXPECT_EQ(0, settings.capacity(ResourceType::CPU) % 1000);
  EXPECT_GT(settings.capacity(ResourceType::MEMORY), 0);
}

TEST(WorkloadManagementSettingsTest, Validate) {
  google::FlagSaver saver;
  FLAGS_wlm_node_cpu_capacity_millicores = 4000;
  FLAGS_wlm_node_memory_capacity_bytes = 1L << 30;
  EXPECT_OK(WorkloadManagementSettings::FromFlags().Validate());

  FLAGS_wlm_node_cpu_rejection_threshold = 1.2;
  Status status = WorkloadManagementSettings::FromFlags().Validate();
  EXPECT_ERROR(status, ErrorCode::INVALID_FLAG_VALUE);
  EXPECT_STR_CONTAINS(status.GetDetail(), "wlm_node_cpu_rejection_threshold");
  FLAGS_wlm_node_cpu_rejection_threshold = 0.9;

  FLAGS_wlm_enforcement_interval_ms = 0;
  EXPECT_ERROR(WorkloadManagementSettings::FromFlags().Validate(),
      ErrorCode::INVALID_FLAG_VALUE);
  FLAGS_wlm_enforcement_interval_ms = 1000;

  WorkloadManagementSettings settings = WorkloadManagementSettings::FromFlags();
  settings.max_cancellations_per_cycle = -1;
  EXPECT_ERROR(settings.Validate(), ErrorCode::INVALID_FLAG_VALUE);

  // A missing capacity only matters for tracked resources.
  settings = WorkloadManagementSettings::FromFlags();
  settings.node_capacity[ResourceTypeIndex(ResourceType::MEMORY)] = 0;
  EXPECT_ERROR(settings.Validate(), ErrorCode::INVALID_FLAG_VALUE);
  settings.tracked_resources = TrackedResourceSet().Add(ResourceType::CPU);
  EXPECT_OK(settings.Validate());
}

}

WLM_TEST_MAIN();
