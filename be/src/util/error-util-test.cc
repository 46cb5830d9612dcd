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

#include <sstream>

#include "common/status.h"
#include "util/error-util.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace wlm {

constexpr int ErrorMsg::MAX_ERROR_MESSAGE_LEN;

TEST(ErrorMsg, GenericFormatting) {
  ErrorMsg msg(ErrorCode::GENERAL, "This is a test");
  ASSERT_EQ("This is a test", msg.msg());

  msg.AddDetail("Detail come here.");
  msg.AddDetail("Or here.");
  ASSERT_EQ("This is a test\nDetail come here.\nOr here.\n",
      msg.GetFullMessageDetails());

  msg = ErrorMsg(ErrorCode::QUERY_GROUP_REJECTED, "etl", "memory", 0.9, 0.75);
  ASSERT_EQ("Query group etl is contended: memory usage 0.9 exceeds the limit 0.75. "
      "Retry later.", msg.msg());

  msg = ErrorMsg(ErrorCode::QUERY_GROUP_CANCELLED, "q1", "etl", "cpu", 0.5, 0.25);
  ASSERT_EQ("Query q1 was cancelled: query group etl breached the cpu limit "
      "(0.5 > 0.25).", msg.msg());

  // Test long error message and truncation.
  string long_msg = std::string(256 * 1024, '-'); // 256kb string
  msg = ErrorMsg(ErrorCode::GENERAL, long_msg);
  ASSERT_EQ(ErrorMsg::MAX_ERROR_MESSAGE_LEN, msg.msg().size());
}

TEST(ErrorMsg, ErrorCodeNames) {
  EXPECT_STREQ("OK", ErrorCodeToString(ErrorCode::OK));
  EXPECT_STREQ(
      "QUERY_GROUP_REJECTED", ErrorCodeToString(ErrorCode::QUERY_GROUP_REJECTED));
  EXPECT_STREQ("QUERY_GROUP_REMOVED", ErrorCodeToString(ErrorCode::QUERY_GROUP_REMOVED));
  EXPECT_STREQ(
      "UNKNOWN", ErrorCodeToString(static_cast<ErrorCode::type>(NUM_ERROR_CODES)));
  // Every code has a template.
  for (int i = 0; i < NUM_ERROR_CODES; ++i) {
    EXPECT_TRUE(GetErrorMessageTemplate(static_cast<ErrorCode::type>(i)) != nullptr);
  }
}

TEST(Status, Classification) {
  EXPECT_TRUE(Status::OK().ok());
  EXPECT_EQ(ErrorCode::OK, Status::OK().code());
  EXPECT_TRUE(Status::CANCELLED.IsCancelled());

  Status rejected = Status::Expected(
      ErrorCode::QUERY_GROUP_REJECTED, "etl", "cpu", 0.9, 0.8);
  EXPECT_TRUE(rejected.IsRejected());
  EXPECT_FALSE(rejected.IsCancelled());

  Status cancelled = Status::Expected(
      ErrorCode::QUERY_GROUP_CANCELLED, "q1", "etl", "cpu", 0.9, 0.8);
  EXPECT_TRUE(cancelled.IsCancelled());
  EXPECT_TRUE(
      Status::Expected(ErrorCode::QUERY_GROUP_REMOVED, "q1", "etl").IsCancelled());
  EXPECT_FALSE(Status("oops").IsCancelled());
  EXPECT_TRUE(Status(ErrorCode::INTERNAL_ERROR, "bad state").IsInternalError());
}

TEST(Status, DetailsAndMerge) {
  Status status(ErrorCode::QUERY_GROUP_NOT_FOUND, "etl");
  status.AddDetail("while computing stats");
  EXPECT_EQ("Query group etl does not exist on this node.\nwhile computing stats\n",
      status.GetDetail());

  Status merged;
  merged.MergeStatus(Status::OK());
  EXPECT_TRUE(merged.ok());
  merged.MergeStatus(status);
  EXPECT_ERROR(merged, ErrorCode::QUERY_GROUP_NOT_FOUND);
  merged.MergeStatus(Status("second"));
  EXPECT_STR_CONTAINS(merged.GetDetail(), "second");
  EXPECT_ERROR(merged, ErrorCode::QUERY_GROUP_NOT_FOUND);

  // Copies are independent.
  Status copy = merged;
  copy.AddDetail("only in copy");
  EXPECT_STR_CONTAINS(copy.GetDetail(), "only in copy");
  EXPECT_EQ(string::npos, merged.GetDetail().find("only in copy"));

  Status moved = std::move(copy);
  EXPECT_FALSE(moved.ok());

  stringstream ss;
  ss << Status::Expected(ErrorCode::QUERY_ALREADY_REGISTERED, "q1");
  EXPECT_STR_CONTAINS(ss.str(), "QUERY_ALREADY_REGISTERED");
  EXPECT_STR_CONTAINS(ss.str(), "Query q1 is already registered.");
}

}

WLM_TEST_MAIN();
