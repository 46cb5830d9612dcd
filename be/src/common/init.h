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

#ifndef WLM_COMMON_INIT_H
#define WLM_COMMON_INIT_H

#include "util/test-info.h"
#include "common/status.h"

namespace wlm {

/// Initialises flags, logging and the hardware information (CpuInfo, MemInfo) that
/// node capacities are derived from. Tests must indicate that they are tests so that
/// test-specific defaults apply.
/// Callers that want to override default gflags variables should do so before calling
/// this method. No logging should be performed until after this method returns.
void InitCommonRuntime(int argc, char** argv, TestInfo::Mode m = TestInfo::NON_TEST);

}

#endif
