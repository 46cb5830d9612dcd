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

#include "common/init.h"

#include <stdlib.h>
#include <time.h>

#include "common/logging.h"
#include "common/status.h"
#include "util/cpu-info.h"
#include "util/mem-info.h"

#include "common/names.h"

namespace wlm {
TestInfo::Mode TestInfo::mode_ = TestInfo::NON_TEST;
}

void wlm::InitCommonRuntime(int argc, char** argv, TestInfo::Mode test_mode) {
  srand(time(NULL));

  TestInfo::Init(test_mode);

  google::ParseCommandLineFlags(&argc, &argv, true);

  // Tests log to stderr so that failures show up in the ctest output.
  if (TestInfo::is_test()) FLAGS_logtostderr = true;

  wlm::InitGoogleLoggingSafe(argv[0]);

  CpuInfo::Init();
  MemInfo::Init();

  LOG(INFO) << CpuInfo::DebugString();
  LOG(INFO) << MemInfo::DebugString();
  wlm::LogCommandLineFlags();
}
