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

#include "wlm/admission-controller.h"

#include "testutil/gtest-util.h"
#include "wlm/wlm-test-util.h"

#include "common/names.h"

namespace wlm {
using namespace wlm::test;

static const string GROUP_A = "dashboards";
static const string GROUP_B = "adhoc";

class AdmissionControllerTest : public testing::Test {
 protected:
  AdmissionControllerTest() : settings_(MakeTestSettings()) {}

  virtual void SetUp() { Reset(settings_); }

  /// Recreate all components with 'settings'.
  void Reset(const WorkloadManagementSettings& settings) {
    controller_.reset();
    tracker_.reset();
    registry_.reset(new QueryGroupRegistry(settings.tracked_resources));
    configs_.reset(new InMemoryQueryGroupConfigStore());
    tracker_.reset(new ResourceUsageTracker(registry_.get(), settings));
    controller_.reset(new AdmissionController(registry_.get(), configs_.get(),
        tracker_.get(), settings, [this]() { return in_duress_; }));
  }

  /// Register 'id' with a CPU hard limit.
  void AddGroup(const string& id, ResiliencyMode mode, double cpu_limit) {
    QueryGroupConfig config(id, mode);
    config.SetHardLimit(ResourceType::CPU, cpu_limit);
    ASSERT_OK(configs_->Put(config));
    registry_->GetOrCreate(id);
  }

  WorkloadManagementSettings settings_;
  bool in_duress_ = false;
  unique_ptr<QueryGroupRegistry> registry_;
  unique_ptr<InMemoryQueryGroupConfigStore> configs_;
  unique_ptr<ResourceUsageTracker> tracker_;
  unique_ptr<AdmissionController> controller_;
};

TEST_F(AdmissionControllerTest, AdmitBelowLimit) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.8);
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 50);
  AdmissionDecision decision = controller_->Admit(GROUP_A);
  EXPECT_TRUE(decision.admitted());
  EXPECT_FALSE(decision.degraded);
  EXPECT_OK(decision.ToStatus(GROUP_A));

  // Usage exactly at the limit is still admitted.
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 30);
  EXPECT_TRUE(controller_->Admit(GROUP_A).admitted());
  EXPECT_EQ(0, registry_->Get(GROUP_A)->total_rejections());
}

TEST_F(AdmissionControllerTest, RejectAboveHardLimit) {
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.8);
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 85);
  AdmissionDecision decision = controller_->Admit(GROUP_A);
  ASSERT_FALSE(decision.admitted());
  EXPECT_EQ(ResourceType::CPU, decision.reason);
  EXPECT_DOUBLE_EQ(0.85, decision.usage);
  EXPECT_DOUBLE_EQ(0.8, decision.limit);

  shared_ptr<QueryGroupState> state = registry_->Get(GROUP_A);
  EXPECT_EQ(1, state->total_rejections());
  EXPECT_EQ(1, state->resource_state(ResourceType::CPU)->rejections());
  EXPECT_EQ(0, state->resource_state(ResourceType::MEMORY)->rejections());

  Status status = decision.ToStatus(GROUP_A);
  EXPECT_ERROR(status, ErrorCode::QUERY_GROUP_REJECTED);
  EXPECT_TRUE(status.IsRejected());
  EXPECT_FALSE(status.IsCancelled());
  EXPECT_STR_CONTAINS(status.GetDetail(), GROUP_A);
  EXPECT_STR_CONTAINS(status.GetDetail(), "cpu");
  EXPECT_STR_CONTAINS(status.GetDetail(), "Retry later");
}

TEST_F(AdmissionControllerTest, RejectOnMemory) {
  QueryGroupConfig config(GROUP_A, ResiliencyMode::ENFORCED);
  config.SetHardLimit(ResourceType::CPU, 0.5).SetHardLimit(ResourceType::MEMORY, 0.2);
  ASSERT_OK(configs_->Put(config));
  registry_->GetOrCreate(GROUP_A);
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 10);
  tracker_->Attribute(GROUP_A, ResourceType::MEMORY, 201);
  AdmissionDecision decision = controller_->Admit(GROUP_A);
  ASSERT_FALSE(decision.admitted());
  EXPECT_EQ(ResourceType::MEMORY, decision.reason);
  shared_ptr<QueryGroupState> state = registry_->Get(GROUP_A);
  EXPECT_EQ(1, state->resource_state(ResourceType::MEMORY)->rejections());
}

// A registered group without a configuration is admitted without limits.
TEST_F(AdmissionControllerTest, UnconfiguredGroupFailsOpen) {
  registry_->GetOrCreate(GROUP_B);
  tracker_->Attribute(GROUP_B, ResourceType::CPU, 85);
  AdmissionDecision decision = controller_->Admit(GROUP_B);
  EXPECT_TRUE(decision.admitted());
  EXPECT_TRUE(decision.degraded);
  EXPECT_EQ(1, controller_->num_degraded_admissions());
  EXPECT_EQ(0, registry_->Get(GROUP_B)->total_rejections());
}

TEST_F(AdmissionControllerTest, UnknownGroupFailsOpen) {
  AdmissionDecision decision = controller_->Admit("no-such-group");
  EXPECT_TRUE(decision.admitted());
  EXPECT_TRUE(decision.degraded);
  EXPECT_EQ(1, controller_->num_degraded_admissions());
  EXPECT_FALSE(registry_->Contains("no-such-group"));
}

TEST_F(AdmissionControllerTest, DefaultGroupAlwaysAdmitted) {
  tracker_->Attribute(QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID, ResourceType::CPU, 100);
  in_duress_ = true;
  AdmissionDecision decision =
      controller_->Admit(QueryGroupRegistry::DEFAULT_QUERY_GROUP_ID);
  EXPECT_TRUE(decision.admitted());
  EXPECT_FALSE(decision.degraded);
  EXPECT_EQ(0, controller_->num_degraded_admissions());
}

TEST_F(AdmissionControllerTest, MonitorModeNeverRejects) {
  AddGroup(GROUP_A, ResiliencyMode::MONITOR, 0.1);
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 95);
  in_duress_ = true;
  EXPECT_TRUE(controller_->Admit(GROUP_A).admitted());
  EXPECT_EQ(0, registry_->Get(GROUP_A)->total_rejections());
}

// SOFT groups may exceed their limits as long as the node has spare capacity.
TEST_F(AdmissionControllerTest, SoftModeRejectsOnlyInDuress) {
  AddGroup(GROUP_A, ResiliencyMode::SOFT, 0.3);
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 40);
  EXPECT_TRUE(controller_->Admit(GROUP_A).admitted());
  in_duress_ = true;
  AdmissionDecision decision = controller_->Admit(GROUP_A);
  EXPECT_FALSE(decision.admitted());
  EXPECT_EQ(ResourceType::CPU, decision.reason);
  in_duress_ = false;
  EXPECT_TRUE(controller_->Admit(GROUP_A).admitted());
  EXPECT_EQ(1, registry_->Get(GROUP_A)->total_rejections());
}

TEST_F(AdmissionControllerTest, RejectionThresholdScalesLimit) {
  WorkloadManagementSettings settings = MakeTestSettings();
  settings.node_rejection_threshold[ResourceTypeIndex(ResourceType::CPU)] = 0.5;
  Reset(settings);
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.8);
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 40);
  EXPECT_TRUE(controller_->Admit(GROUP_A).admitted());
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 1);
  AdmissionDecision decision = controller_->Admit(GROUP_A);
  ASSERT_FALSE(decision.admitted());
  EXPECT_DOUBLE_EQ(0.4, decision.limit);
}

TEST_F(AdmissionControllerTest, UntrackedResourceNotEnforced) {
  WorkloadManagementSettings settings = MakeTestSettings();
  settings.tracked_resources = TrackedResourceSet().Add(ResourceType::MEMORY);
  Reset(settings);
  AddGroup(GROUP_A, ResiliencyMode::ENFORCED, 0.1);
  // CPU usage of an untracked resource is never recorded, so it cannot reject.
  tracker_->Attribute(GROUP_A, ResourceType::CPU, 90);
  EXPECT_TRUE(controller_->Admit(GROUP_A).admitted());
}

TEST_F(AdmissionControllerTest, DecisionDebugString) {
  EXPECT_EQ("ADMITTED", AdmissionDecision::Admit().DebugString());
  EXPECT_EQ("ADMITTED (degraded)", AdmissionDecision::Admit(true).DebugString());
  EXPECT_STR_CONTAINS(
      AdmissionDecision::Reject(ResourceType::MEMORY, 0.5, 0.25).DebugString(),
      "REJECTED(memory");
}

}

WLM_TEST_MAIN();
