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

#include "util/error-util.h"

#include <errno.h>
#include <string.h>
#include <sstream>

#include "common/names.h"

namespace wlm {

namespace {

// Message templates, indexed by ErrorCode::type.
const char* const ERROR_MESSAGE_TEMPLATES[NUM_ERROR_CODES] = {
  /* OK */ "",
  /* GENERAL */ "$0",
  /* CANCELLED */ "Cancelled",
  /* INTERNAL_ERROR */ "Internal error: $0",
  /* QUERY_GROUP_REJECTED */
  "Query group $0 is contended: $1 usage $2 exceeds the limit $3. Retry later.",
  /* QUERY_GROUP_CANCELLED */
  "Query $0 was cancelled: query group $1 breached the $2 limit ($3 > $4).",
  /* QUERY_GROUP_NOT_FOUND */ "Query group $0 does not exist on this node.",
  /* QUERY_GROUP_INVALID_CONFIG */ "Invalid configuration for query group $0: $1",
  /* QUERY_ALREADY_REGISTERED */ "Query $0 is already registered.",
  /* RUNNING_QUERY_LIST_FAILED */
  "Failed to list the running queries of query group $0: $1",
  /* THREAD_CREATION_FAILED */ "Couldn't create thread $0 in category $1: $2",
  /* INVALID_FLAG_VALUE */ "Invalid value '$0' for flag --$1: $2",
  /* QUERY_GROUP_REMOVED */
  "Query $0 was cancelled: query group $1 was removed while the node is in duress.",
};

const char* const ERROR_CODE_NAMES[NUM_ERROR_CODES] = {
  "OK",
  "GENERAL",
  "CANCELLED",
  "INTERNAL_ERROR",
  "QUERY_GROUP_REJECTED",
  "QUERY_GROUP_CANCELLED",
  "QUERY_GROUP_NOT_FOUND",
  "QUERY_GROUP_INVALID_CONFIG",
  "QUERY_ALREADY_REGISTERED",
  "RUNNING_QUERY_LIST_FAILED",
  "THREAD_CREATION_FAILED",
  "INVALID_FLAG_VALUE",
  "QUERY_GROUP_REMOVED",
};

}

string GetStrErrMsg() {
  // Save errno. "<<" could reset it.
  int e = errno;
  return GetStrErrMsg(e);
}

string GetStrErrMsg(int err_no) {
  if (err_no == 0) return "";
  stringstream ss;
  char buf[1024];
  ss << "Error(" << err_no << "): " << strerror_r(err_no, buf, 1024);
  return ss.str();
}

const char* GetErrorMessageTemplate(ErrorCode::type error) {
  DCHECK_GE(error, 0);
  DCHECK_LT(error, NUM_ERROR_CODES);
  return ERROR_MESSAGE_TEMPLATES[error];
}

const char* ErrorCodeToString(ErrorCode::type error) {
  if (error < 0 || error >= NUM_ERROR_CODES) return "UNKNOWN";
  return ERROR_CODE_NAMES[error];
}

ErrorMsg::ErrorMsg(ErrorCode::type error) : error_(error) {
  SetErrorMsg(GetErrorMessageTemplate(error_));
}

ErrorMsg::ErrorMsg(ErrorCode::type error, const ArgType& arg0) : error_(error) {
  SetErrorMsg(absl::Substitute(
      absl::string_view(GetErrorMessageTemplate(error_)), arg0));
}

ErrorMsg::ErrorMsg(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1)
  : error_(error) {
  SetErrorMsg(absl::Substitute(
      absl::string_view(GetErrorMessageTemplate(error_)), arg0, arg1));
}

ErrorMsg::ErrorMsg(
    ErrorCode::type error, const ArgType& arg0, const ArgType& arg1, const ArgType& arg2)
  : error_(error) {
  SetErrorMsg(absl::Substitute(
      absl::string_view(GetErrorMessageTemplate(error_)), arg0, arg1, arg2));
}

ErrorMsg::ErrorMsg(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
    const ArgType& arg2, const ArgType& arg3)
  : error_(error) {
  SetErrorMsg(absl::Substitute(
      absl::string_view(GetErrorMessageTemplate(error_)), arg0, arg1, arg2, arg3));
}

ErrorMsg::ErrorMsg(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
    const ArgType& arg2, const ArgType& arg3, const ArgType& arg4)
  : error_(error) {
  SetErrorMsg(absl::Substitute(absl::string_view(GetErrorMessageTemplate(error_)),
      arg0, arg1, arg2, arg3, arg4));
}

void ErrorMsg::SetErrorMsg(const std::string& msg) {
  if (msg.size() > static_cast<size_t>(MAX_ERROR_MESSAGE_LEN)) {
    message_ = msg.substr(0, MAX_ERROR_MESSAGE_LEN);
  } else {
    message_ = msg;
  }
}

string ErrorMsg::GetFullMessageDetails() const {
  stringstream ss;
  ss << message_ << "\n";
  for(size_t i = 0, end = details_.size(); i < end; ++i) {
    ss << details_[i] << "\n";
  }
  return ss.str();
}

}
