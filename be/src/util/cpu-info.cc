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

#include "util/cpu-info.h"

#include <fstream>
#include <sstream>
#include <boost/algorithm/string.hpp>

#include "common/names.h"

using boost::algorithm::trim;
using std::ifstream;
using std::ios;

DEFINE_int32(num_cores, 0, "(Advanced) If > 0, it sets the number of cores available to"
    " this process. Otherwise, the number of cores is determined according to"
    " /proc/cpuinfo.");

namespace wlm {

bool CpuInfo::initialized_ = false;
int CpuInfo::num_cores_ = 1;
string CpuInfo::model_name_ = "unknown";

void CpuInfo::Init() {
  string line;
  string name;
  string value;

  int num_cores = 0;

  // Read from /proc/cpuinfo
  ifstream cpuinfo("/proc/cpuinfo", ios::in);
  while (cpuinfo) {
    getline(cpuinfo, line);
    size_t colon = line.find(':');
    if (colon != string::npos) {
      name = line.substr(0, colon);
      value = line.substr(colon + 1, string::npos);
      trim(name);
      trim(value);
      if (name.compare("processor") == 0) {
        ++num_cores;
      } else if (name.compare("model name") == 0) {
        model_name_ = value;
      }
    }
  }
  if (cpuinfo.is_open()) cpuinfo.close();

  if (num_cores > 0) {
    num_cores_ = num_cores;
  } else {
    num_cores_ = 1;
  }

  if (FLAGS_num_cores > 0) num_cores_ = FLAGS_num_cores;

  initialized_ = true;
}

string CpuInfo::DebugString() {
  DCHECK(initialized_);
  stringstream stream;
  stream << "Cpu Info:" << endl
         << "  Model: " << model_name_ << endl
         << "  Cores: " << num_cores_ << endl;
  return stream.str();
}

}
