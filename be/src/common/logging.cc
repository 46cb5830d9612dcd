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

#include "common/logging.h"

#include <mutex>
#include <sstream>
#include <vector>

#include "common/names.h"

DEFINE_string(log_filename, "",
    "Prefix of log filename - full path is <log_dir>/<log_filename>.[INFO|WARN|ERROR|"
    "FATAL]. If empty, glog's default naming is used.");

namespace {
bool logging_initialized = false;
// Protects logging_initialized.
mutex logging_mutex;
}

void wlm::InitGoogleLoggingSafe(const char* arg) {
  lock_guard<mutex> logging_lock(logging_mutex);
  if (logging_initialized) return;
  if (!FLAGS_log_filename.empty()) {
    for (int severity = google::INFO; severity <= google::FATAL; ++severity) {
      google::SetLogSymlink(severity, FLAGS_log_filename.c_str());
    }
  }

  // Log to /tmp rather than letting glog guess at a temporary directory if none is
  // specified, so that the location of the log files is predictable.
  if (FLAGS_log_dir.empty()) {
    FLAGS_log_dir = "/tmp";
  }

  // Don't double log to stderr on any threshold.
  FLAGS_stderrthreshold = google::FATAL + 1;

  google::InitGoogleLogging(arg);

  // Needs to be done after InitGoogleLogging.
  if (FLAGS_log_filename.empty()) {
    FLAGS_log_filename = google::ProgramInvocationShortName();
  }

  logging_initialized = true;
}

void wlm::ShutdownLogging() {
  // This method may only correctly be called once (which this lock does not
  // enforce), but this lock protects against concurrent calls with
  // InitGoogleLoggingSafe
  lock_guard<mutex> logging_lock(logging_mutex);
  google::ShutdownGoogleLogging();
}

void wlm::LogCommandLineFlags() {
  vector<google::CommandLineFlagInfo> flags;
  google::GetAllFlags(&flags);
  stringstream ss;
  for (const auto& flag : flags) {
    // Only the flags of this project are interesting; glog and gflags own the rest.
    if (flag.name.compare(0, 4, "wlm_") != 0) continue;
    ss << "--" << flag.name << "=" << flag.current_value
       << (flag.is_default ? "" : " (overridden)") << "\n";
  }
  LOG(INFO) << "Workload management flags:" << endl << ss.str();
}
