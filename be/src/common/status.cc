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

#include "common/status.h"

#include <ostream>

#include "util/error-util.h"

#include "common/names.h"

namespace wlm {

// NOTE: this is statically initialized and we must be very careful what
// functions these constructors call.  In particular, we cannot call
// glog functions which also rely on static initializations.
const Status Status::CANCELLED(ErrorMsg(ErrorCode::CANCELLED), true);

Status::Status(bool silent, ErrorCode::type code) : msg_(new ErrorMsg(code)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(bool silent, ErrorCode::type code, const ArgType& arg0)
  : msg_(new ErrorMsg(code, arg0)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(
    bool silent, ErrorCode::type code, const ArgType& arg0, const ArgType& arg1)
  : msg_(new ErrorMsg(code, arg0, arg1)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(bool silent, ErrorCode::type code, const ArgType& arg0,
    const ArgType& arg1, const ArgType& arg2)
  : msg_(new ErrorMsg(code, arg0, arg1, arg2)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(bool silent, ErrorCode::type code, const ArgType& arg0,
    const ArgType& arg1, const ArgType& arg2, const ArgType& arg3)
  : msg_(new ErrorMsg(code, arg0, arg1, arg2, arg3)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(bool silent, ErrorCode::type code, const ArgType& arg0,
    const ArgType& arg1, const ArgType& arg2, const ArgType& arg3, const ArgType& arg4)
  : msg_(new ErrorMsg(code, arg0, arg1, arg2, arg3, arg4)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(const string& error_msg)
  : msg_(new ErrorMsg(ErrorCode::GENERAL, error_msg)) {
  VLOG(1) << msg_->msg();
}

Status::Status(const ErrorMsg& error_msg, bool silent)
  : msg_(new ErrorMsg(error_msg)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(const string& error_msg, bool silent)
  : msg_(new ErrorMsg(ErrorCode::GENERAL, error_msg)) {
  if (!silent) VLOG(1) << msg_->msg();
}

Status::Status(const ErrorMsg& message)
  : msg_(new ErrorMsg(message)) { }

Status Status::Expected(const ErrorMsg& error_msg) {
  return Status(error_msg, true);
}

Status Status::Expected(const std::string& error_msg) {
  return Status(error_msg, true);
}

Status Status::Expected(ErrorCode::type code) {
  return Status(true, code);
}

Status Status::Expected(ErrorCode::type code, const ArgType& arg0) {
  return Status(true, code, arg0);
}

Status Status::Expected(ErrorCode::type code, const ArgType& arg0, const ArgType& arg1) {
  return Status(true, code, arg0, arg1);
}

Status Status::Expected(ErrorCode::type code, const ArgType& arg0, const ArgType& arg1,
    const ArgType& arg2) {
  return Status(true, code, arg0, arg1, arg2);
}

Status Status::Expected(ErrorCode::type code, const ArgType& arg0, const ArgType& arg1,
    const ArgType& arg2, const ArgType& arg3) {
  return Status(true, code, arg0, arg1, arg2, arg3);
}

Status Status::Expected(ErrorCode::type code, const ArgType& arg0, const ArgType& arg1,
    const ArgType& arg2, const ArgType& arg3, const ArgType& arg4) {
  return Status(true, code, arg0, arg1, arg2, arg3, arg4);
}

void Status::AddDetail(const std::string& msg) {
  DCHECK(msg_ != NULL);
  msg_->AddDetail(msg);
  VLOG(2) << msg;
}

void Status::MergeStatus(const Status& status) {
  if (status.ok()) return;
  if (msg_ == NULL) {
    msg_ = new ErrorMsg(*status.msg_);
  } else {
    msg_->AddDetail(status.msg().msg());
    for (const string& s: status.msg_->details()) msg_->AddDetail(s);
  }
}

const string Status::GetDetail() const {
  return msg_ != NULL ? msg_->GetFullMessageDetails() : "";
}

void Status::FreeMessage() noexcept {
  delete msg_;
}

void Status::CopyMessageFrom(const Status& status) noexcept {
  delete msg_;
  msg_ = status.msg_ == NULL ? NULL : new ErrorMsg(*status.msg_);
}

ostream& operator<<(ostream& os, const Status& status) {
  os << ErrorCodeToString(status.code());
  if (!status.ok()) os << ": " << status.GetDetail();
  return os;
}

}
