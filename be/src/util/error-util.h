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


#ifndef WLM_UTIL_ERROR_UTIL_H
#define WLM_UTIL_ERROR_UTIL_H

#include <string>
#include <vector>

#include <absl/strings/substitute.h>

#include "common/error-codes.h"
#include "common/logging.h"

namespace wlm {

/// Returns the error message for errno. We should not use strerror directly
/// as that is not thread safe.
/// Returns empty string if errno is 0.
std::string GetStrErrMsg();

// This version of the function receives errno as a parameter instead of reading it
// itself.
std::string GetStrErrMsg(int err_no);

/// Returns the message template registered for 'error'.
const char* GetErrorMessageTemplate(ErrorCode::type error);

/// Returns the symbolic name of 'error', e.g. "QUERY_GROUP_REJECTED".
const char* ErrorCodeToString(ErrorCode::type error);

/// Class that holds a formatted error message and potentially a set of detail
/// messages. Error messages are intended to be user facing. Error details can be attached
/// as strings to the message. These details should only be accessed internally.
class ErrorMsg {
 public:
  static constexpr int MAX_ERROR_MESSAGE_LEN = 128 * 1024; // 128kb

  typedef absl::substitute_internal::Arg ArgType;

  /// Trivial constructor.
  ErrorMsg() : error_(ErrorCode::OK) {}

  /// Below are a set of overloaded constructors taking the number of arguments that the
  /// message template for 'error' expects.
  explicit ErrorMsg(ErrorCode::type error);
  ErrorMsg(ErrorCode::type error, const ArgType& arg0);
  ErrorMsg(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1);
  ErrorMsg(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2);
  ErrorMsg(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2, const ArgType& arg3);
  ErrorMsg(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2, const ArgType& arg3, const ArgType& arg4);

  ErrorCode::type error() const { return error_; }

  /// Add detail string message.
  void AddDetail(const std::string& d) {
    details_.push_back(d);
  }

  /// Set a specific error code.
  void SetErrorCode(ErrorCode::type e) {
    error_ = e;
  }

  /// Return the formatted error string.
  const std::string& msg() const {
    return message_;
  }

  const std::vector<std::string>& details() const {
    return details_;
  }

  /// Set a specific error message. Truncate the message if the length is longer than
  /// MAX_ERROR_MESSAGE_LEN.
  void SetErrorMsg(const std::string& msg);

  /// Produce a string representation of the error message that includes the formatted
  /// message of the original error and the attached detail strings.
  std::string GetFullMessageDetails() const;

private:
  ErrorCode::type error_;
  std::string message_;
  std::vector<std::string> details_;
};

}

#endif
