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


#ifndef WLM_COMMON_LOGGING_H
#define WLM_COMMON_LOGGING_H

/// This is a wrapper around the glog header. All code in this project includes this
/// header rather than glog directly so that the verbose levels below are used
/// consistently.
#include <glog/logging.h>
#include <gflags/gflags.h>

/// Define verbose logging levels. Per-query logging (admission decisions, query
/// start/finish) is less verbose than per-cycle enforcement progress, which is less
/// verbose than per-attribution logging.
#define VLOG_QUERY      VLOG(1)
#define VLOG_PROGRESS   VLOG(2)
#define VLOG_ROW        VLOG(3)

namespace wlm {

/// glog doesn't allow multiple invocations of InitGoogleLogging(). This method
/// conditionally calls InitGoogleLogging() only if it hasn't been called before.
void InitGoogleLoggingSafe(const char* arg);

/// Shuts down the google logging library. Call before exit to ensure that log files are
/// flushed. May only be called once.
void ShutdownLogging();

/// Writes all command-line flags to the log at level INFO.
void LogCommandLineFlags();

} // namespace wlm
#endif
