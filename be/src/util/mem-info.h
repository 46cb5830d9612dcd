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

#ifndef WLM_UTIL_MEM_INFO_H
#define WLM_UTIL_MEM_INFO_H

#include <stdint.h>
#include <string>

#include "common/logging.h"

namespace wlm {

/// Provides the amount of physical memory available.
/// Populated from /proc/meminfo.
/// TODO: Allow retrieving of cgroup memory limits so that containerized nodes measure
/// query group memory against the container budget.
class MemInfo {
 public:
  /// Initialize MemInfo.
  static void Init();

  /// Get total physical memory in bytes (ignores cgroups memory limits). Returns -1 if
  /// /proc/meminfo could not be parsed.
  static int64_t physical_mem() {
    DCHECK(initialized_);
    return physical_mem_;
  }

  static std::string DebugString();

 private:
  static bool initialized_;
  static int64_t physical_mem_;
};

}

#endif
