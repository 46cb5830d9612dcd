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

#ifndef WLM_UTIL_THREAD_H
#define WLM_UTIL_THREAD_H

#include <functional>
#include <memory>
#include <string>
#include <boost/thread/thread.hpp>

#include "common/status.h"
#include "util/condition-variable.h"

namespace wlm {

/// Thin wrapper around boost::thread that gives every thread a category and a name
/// (visible in 'top -H' and debuggers) and reports creation failures as a Status
/// instead of an exception.
///
/// Threads are started by Create() and must be joined with Join() before the Thread
/// object is destroyed.
class Thread {
 public:
  typedef std::function<void ()> ThreadFunctor;

  /// Starts a new thread running 'functor'. 'category' groups related threads (e.g.
  /// "query-group"), 'name' identifies this thread within the category. On success
  /// *thread owns the new thread. Returns THREAD_CREATION_FAILED if the underlying
  /// thread could not be started.
  static Status Create(const std::string& category, const std::string& name,
      const ThreadFunctor& functor, std::unique_ptr<Thread>* thread) WARN_UNUSED_RESULT;

  ~Thread();

  /// Blocks until the thread function returns. Safe to call more than once.
  void Join();

  /// The system TID of the thread, or -1 if it has not started yet.
  int64_t tid() const { return tid_; }

  const std::string& name() const { return name_; }
  const std::string& category() const { return category_; }

 private:
  Thread(const std::string& category, const std::string& name)
    : category_(category), name_(name), tid_(UNINITIALISED_THREAD_ID) {}

  static constexpr int64_t UNINITIALISED_THREAD_ID = -1;

  /// Entry point of the new thread. Publishes the system TID, sets the thread name
  /// and runs 'functor'.
  void SuperviseThread(const ThreadFunctor& functor);

  const std::string category_;
  const std::string name_;

  /// Written once by the child thread and read by the parent after Create() returns.
  std::mutex tid_lock_;
  ConditionVariable tid_cv_;
  int64_t tid_;

  boost::thread thread_;
};

}

#endif
