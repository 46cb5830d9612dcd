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

#include "util/thread.h"

#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>

#include "common/names.h"

namespace wlm {

Status Thread::Create(const string& category, const string& name,
    const ThreadFunctor& functor, unique_ptr<Thread>* thread) {
  DCHECK(thread != nullptr);
  unique_ptr<Thread> t(new Thread(category, name));
  try {
    t->thread_ = boost::thread(&Thread::SuperviseThread, t.get(), functor);
  } catch (boost::thread_resource_error& e) {
    return Status(ErrorCode::THREAD_CREATION_FAILED, name, category, e.what());
  }
  // Wait for the child to publish its TID so that tid() is valid once we return.
  {
    unique_lock<mutex> l(t->tid_lock_);
    while (t->tid_ == UNINITIALISED_THREAD_ID) t->tid_cv_.Wait(l);
  }
  VLOG(2) << "Started thread " << category << "/" << name << " (tid " << t->tid_ << ")";
  *thread = move(t);
  return Status::OK();
}

Thread::~Thread() {
  DCHECK(!thread_.joinable()) << "Thread " << category_ << "/" << name_
                              << " destroyed without Join()";
}

void Thread::Join() {
  if (thread_.joinable()) thread_.join();
}

void Thread::SuperviseThread(const ThreadFunctor& functor) {
  int64_t system_tid = syscall(SYS_gettid);
  // pthread names are limited to 16 bytes including the terminator.
  string short_name = name_.substr(0, 15);
  pthread_setname_np(pthread_self(), short_name.c_str());
  {
    lock_guard<mutex> l(tid_lock_);
    tid_ = system_tid;
  }
  tid_cv_.NotifyAll();
  functor();
}

}
