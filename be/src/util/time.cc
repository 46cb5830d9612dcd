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

#include "util/time.h"

#include <chrono>
#include <thread>

#include "common/names.h"

namespace wlm {

void SleepForMs(const int64_t duration_ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

void TimeFromNowMicros(int64_t duration_us, timespec* ts) {
  DCHECK(ts != nullptr);
  clock_gettime(CLOCK_MONOTONIC, ts);
  int64_t nanos = ts->tv_nsec + (duration_us % 1000000L) * 1000L;
  ts->tv_sec += duration_us / 1000000L + nanos / 1000000000L;
  ts->tv_nsec = nanos % 1000000000L;
}

}
