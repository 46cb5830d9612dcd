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

#ifndef WLM_COMMON_ERROR_CODES_H
#define WLM_COMMON_ERROR_CODES_H

namespace wlm {

/// Error codes carried by Status. Every code has a message template in
/// util/error-util.cc whose $0..$N placeholders are filled by the Status/ErrorMsg
/// constructor arguments. New codes must be appended so existing values stay stable.
struct ErrorCode {
  enum type {
    OK = 0,
    GENERAL = 1,
    CANCELLED = 2,
    INTERNAL_ERROR = 3,
    QUERY_GROUP_REJECTED = 4,
    QUERY_GROUP_CANCELLED = 5,
    QUERY_GROUP_NOT_FOUND = 6,
    QUERY_GROUP_INVALID_CONFIG = 7,
    QUERY_ALREADY_REGISTERED = 8,
    RUNNING_QUERY_LIST_FAILED = 9,
    THREAD_CREATION_FAILED = 10,
    INVALID_FLAG_VALUE = 11,
    QUERY_GROUP_REMOVED = 12,
  };
};

/// Number of entries in ErrorCode::type.
constexpr int NUM_ERROR_CODES = ErrorCode::QUERY_GROUP_REMOVED + 1;

}

#endif
