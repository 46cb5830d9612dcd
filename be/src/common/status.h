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


#ifndef WLM_COMMON_STATUS_H
#define WLM_COMMON_STATUS_H

#include <iosfwd>
#include <string>
#include <vector>

#include "common/compiler-util.h"
#include "common/error-codes.h"
#include "common/logging.h"
#include "util/error-util.h" // for ErrorMsg

namespace wlm {

/// Status is used as a function return type to indicate success, failure or cancellation
/// of the function. In case of successful completion, it only occupies sizeof(void*)
/// statically allocated memory and therefore no more members should be added to this
/// class.
//
/// A Status may either be OK (represented by passing a default constructed Status
/// instance, created via Status::OK()), or it may represent an error condition. In the
/// latter case, a Status has both an error code, which belongs to the ErrorCode enum,
/// and an error string, which may be presented to clients or logged to disk.
///
/// An error Status may also have one or more optional 'detail' strings which provide
/// further context. These strings are intended for internal consumption only - and
/// therefore will not be sent to clients.
///
/// Example Usage:
/// Status RegisterGroup(const QueryGroupConfig& config) {
///   RETURN_IF_ERROR(config.Validate());
///   if (registry->Get(config.id) != nullptr) {
///     Status s(ErrorCode::QUERY_GROUP_INVALID_CONFIG, config.id, "duplicate id");
///     s.AddDetail("registered by an earlier config update");
///     return s;
///   }
///   return Status::OK();
/// }
class [[nodiscard]] Status {
 public:
  typedef ErrorMsg::ArgType ArgType;

  ALWAYS_INLINE Status(): msg_(NULL) {}

  // Return a default constructed Status instance in the OK case.
  static ALWAYS_INLINE Status OK() { return Status(); }

  static const Status CANCELLED;

  /// Copy c'tor makes copy of error detail so Status can be returned by value.
  ALWAYS_INLINE Status(const Status& status) : msg_(NULL) {
    if (UNLIKELY(status.msg_ != NULL)) CopyMessageFrom(status);
  }

  /// Move constructor that moves the error message (if any) and resets 'other' to the
  /// default OK Status.
  ALWAYS_INLINE Status(Status&& other) noexcept : msg_(other.msg_) { other.msg_ = NULL; }

  /// Status using only the error code as a parameter. This can be used for error messages
  /// that don't take format parameters.
  explicit Status(ErrorCode::type code) : Status(false, code) {}

  /// These constructors are used if the caller wants to indicate a non-successful
  /// execution and supply a client-facing error message. These constructors log the
  /// error message at VLOG(1), so they should only be used for rare, low-frequency
  /// errors. Status::Expected() does not log and should be used for higher-frequency
  /// errors such as admission rejections.
  Status(ErrorCode::type error, const ArgType& arg0) : Status(false, error, arg0) {}
  Status(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1)
    : Status(false, error, arg0, arg1) {}
  Status(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2)
    : Status(false, error, arg0, arg1, arg2) {}
  Status(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2, const ArgType& arg3)
    : Status(false, error, arg0, arg1, arg2, arg3) {}
  Status(ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2, const ArgType& arg3, const ArgType& arg4)
    : Status(false, error, arg0, arg1, arg2, arg3, arg4) {}

  /// Used when the ErrorMsg is created as an intermediate value.
  explicit Status(const ErrorMsg& e);

  /// This constructor creates a Status with a default error code of GENERAL and is not
  /// intended for statuses that might be client-visible.
  explicit Status(const std::string& error_msg);

  /// The below Status::Expected() functions create a status instance that represents
  /// an expected error. They behave the same as the constructors with the same
  /// argument types, except they do not log the error message.
  static Status Expected(const ErrorMsg& e);
  static Status Expected(const std::string& error_msg);
  static Status Expected(ErrorCode::type error);
  static Status Expected(ErrorCode::type error, const ArgType& arg0);
  static Status Expected(
      ErrorCode::type error, const ArgType& arg0, const ArgType& arg1);
  static Status Expected(ErrorCode::type error, const ArgType& arg0,
      const ArgType& arg1, const ArgType& arg2);
  static Status Expected(ErrorCode::type error, const ArgType& arg0,
      const ArgType& arg1, const ArgType& arg2, const ArgType& arg3);
  static Status Expected(ErrorCode::type error, const ArgType& arg0,
      const ArgType& arg1, const ArgType& arg2, const ArgType& arg3, const ArgType& arg4);

  /// same as copy c'tor
  ALWAYS_INLINE Status& operator=(const Status& status) {
    // Take the slow path if either Status objects have non-NULL messages (unless they
    // are aliases).
    if (UNLIKELY(msg_ != status.msg_)) CopyMessageFrom(status);
    return *this;
  }

  /// Move assignment that moves the error message (if any) and resets 'other' to the
  /// default OK Status.
  ALWAYS_INLINE Status& operator=(Status&& other) noexcept {
    if (UNLIKELY(msg_ != NULL)) FreeMessage();
    msg_ = other.msg_;
    other.msg_ = NULL;
    return *this;
  }

  ALWAYS_INLINE ~Status() {
    // The UNLIKELY and inlining here are important hints for the compiler to
    // streamline the common case of Status::OK(). Use FreeMessage() which is
    // not inlined to free the message.
    if (UNLIKELY(msg_ != NULL)) FreeMessage();
  }

  bool ALWAYS_INLINE ok() const { return msg_ == NULL; }

  /// Return true if this is a cancellation, either requested by the caller or issued by
  /// query group enforcement.
  bool IsCancelled() const {
    return msg_ != NULL && (msg_->error() == ErrorCode::CANCELLED
                               || msg_->error() == ErrorCode::QUERY_GROUP_CANCELLED
                               || msg_->error() == ErrorCode::QUERY_GROUP_REMOVED);
  }

  /// Return true if this is an admission rejection. These are retryable.
  bool IsRejected() const {
    return msg_ != NULL && msg_->error() == ErrorCode::QUERY_GROUP_REJECTED;
  }

  bool IsInternalError() const {
    return msg_ != NULL && msg_->error() == ErrorCode::INTERNAL_ERROR;
  }

  /// Returns the error message associated with a non-successful status.
  const ErrorMsg& msg() const {
    DCHECK(msg_ != NULL);
    return *msg_; // NOLINT: clang-tidy thinks this might deref a nullptr
  }

  /// Add a detail string. Calling this method is only defined on a non-OK message
  void AddDetail(const std::string& msg);

  /// Does nothing if status.ok().
  /// Otherwise: if 'this' is an error status, adds the error msg from 'status';
  /// otherwise assigns 'status'.
  void MergeStatus(const Status& status);

  /// Returns the formatted message of the error message and the individual details of the
  /// additional messages as a single string. This should only be called internally and
  /// not to report an error back to the client.
  const std::string GetDetail() const;

  ErrorCode::type code() const {
    return msg_ == NULL ? ErrorCode::OK : msg_->error();
  }

 private:
  // Status constructors that can suppress logging via 'silent' parameter
  Status(const ErrorMsg& error_msg, bool silent);
  Status(const std::string& error_msg, bool silent);
  Status(bool silent, ErrorCode::type code);
  Status(bool silent, ErrorCode::type error, const ArgType& arg0);
  Status(bool silent, ErrorCode::type error, const ArgType& arg0, const ArgType& arg1);
  Status(bool silent, ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2);
  Status(bool silent, ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2, const ArgType& arg3);
  Status(bool silent, ErrorCode::type error, const ArgType& arg0, const ArgType& arg1,
      const ArgType& arg2, const ArgType& arg3, const ArgType& arg4);

  // A non-inline function for copying status' message.
  void CopyMessageFrom(const Status& status) noexcept;

  // A non-inline function for freeing status' message.
  void FreeMessage() noexcept;

  /// Status uses a naked pointer to ensure the size of an instance on the stack is only
  /// the sizeof(ErrorMsg*). Every Status owns its ErrorMsg instance.
  ErrorMsg* msg_;
};

/// for debugging
std::ostream& operator<<(std::ostream& os, const Status& status);

/// some generally useful macros
#define RETURN_IF_ERROR(stmt)                          \
  do {                                                 \
    const ::wlm::Status& _status = (stmt);             \
    if (UNLIKELY(!_status.ok())) return _status;       \
  } while (false)

/// This macro can be appended to a function declaration to generate a compiler warning
/// if the result is ignored.
#define WARN_UNUSED_RESULT __attribute__((warn_unused_result))
}

#endif
