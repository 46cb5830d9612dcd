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

#ifndef WLM_UTIL_CPU_INFO_H
#define WLM_UTIL_CPU_INFO_H

#include <stdint.h>
#include <string>

#include "common/logging.h"

namespace wlm {

/// CpuInfo is an interface to query for cpu information at runtime. On Linux, this
/// information is pulled from /proc/cpuinfo. The --num_cores flag overrides the detected
/// core count, which bounds the CPU capacity that query groups are measured against.
class CpuInfo {
 public:
  /// Initialize CpuInfo.
  static void Init();

  /// Returns the number of cores (including hyper-threaded) on this machine.
  static int num_cores() {
    DCHECK(initialized_);
    return num_cores_;
  }

  /// Returns the model name of the cpu (e.g. Intel i7-2600)
  static std::string model_name() {
    DCHECK(initialized_);
    return model_name_;
  }

  static std::string DebugString();

 private:
  static bool initialized_;
  static int num_cores_;
  static std::string model_name_;
};

}

#endif
