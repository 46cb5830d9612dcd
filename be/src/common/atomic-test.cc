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

#include <string>
#include <boost/thread/thread.hpp>

#include "common/atomic.h"
#include "testutil/gtest-util.h"

#include "common/names.h"

namespace wlm {

using namespace internal; // Testing AtomicInt<> directly.

// Single threaded sanity check of every operation.
template<typename T>
static void TestBasic() {
  AtomicInt<T> i1;
  EXPECT_EQ(0, i1.Load());
  i1.Store(10);
  EXPECT_EQ(10, i1.Load());
  EXPECT_EQ(15, i1.Add(5));
  EXPECT_EQ(-10, i1.Add(-25));

  EXPECT_TRUE(i1.CompareAndSwap(-10, 50));
  EXPECT_EQ(50, i1.Load());
  EXPECT_FALSE(i1.CompareAndSwap(-10, 100));
  EXPECT_EQ(50, i1.Load());

  EXPECT_EQ(50, i1.Swap(7));
  EXPECT_EQ(7, i1.Load());
}

TEST(AtomicTest, Basic) {
  TestBasic<int32_t>();
}

TEST(AtomicTest, Basic64) {
  TestBasic<int64_t>();
}

// Each thread adds 'delta' 'n' times.
template<typename T>
static void AddThread(T delta, int64_t n, AtomicInt<T>* ai) {
  for (int64_t i = 0; i < n; ++i) ai->Add(delta);
}

// Each thread adds 'delta' 'n' times with a CAS loop, the way usage slots of a query
// are updated.
template<typename T>
static void CASAddThread(T delta, int64_t n, AtomicInt<T>* ai) {
  for (int64_t i = 0; i < n; ++i) {
    while (true) {
      T old_val = ai->Load();
      if (ai->CompareAndSwap(old_val, old_val + delta)) break;
    }
  }
}

template<typename T>
static void TestMultipleThreads(void (*fn)(T, int64_t, AtomicInt<T>*)) {
  for (int num_threads : {4, 16}) {
    for (int64_t ops : {100, 10000}) {
      AtomicInt<T> ai(0);
      thread_group threads;
      for (int i = 0; i < num_threads; ++i) {
        // Half of the threads add, the other half subtract twice as much.
        T delta = i % 2 == 0 ? 2 : -1;
        threads.add_thread(new thread(fn, delta, ops, &ai));
      }
      threads.join_all();
      EXPECT_EQ(ai.Load(), static_cast<T>((num_threads / 2) * ops));
    }
  }
}

TEST(AtomicTest, MultipleThreadsAdd) {
  TestMultipleThreads<int32_t>(AddThread<int32_t>);
  TestMultipleThreads<int64_t>(AddThread<int64_t>);
}

TEST(AtomicTest, MultipleThreadsCASAdd) {
  TestMultipleThreads<int32_t>(CASAddThread<int32_t>);
  TestMultipleThreads<int64_t>(CASAddThread<int64_t>);
}

// Only one of many threads wins the CAS from false to true.
TEST(AtomicTest, AtomicBoolSingleWinner) {
  AtomicBool flag;
  AtomicInt32 winners;
  thread_group threads;
  for (int i = 0; i < 16; ++i) {
    threads.add_thread(new thread([&flag, &winners]() {
      if (flag.CompareAndSwap(false, true)) winners.Add(1);
    }));
  }
  threads.join_all();
  EXPECT_TRUE(flag.Load());
  EXPECT_EQ(1, winners.Load());
}

enum class TestState { IDLE, RUNNING, DONE };

TEST(AtomicTest, AtomicEnum) {
  AtomicEnum<TestState> state(TestState::IDLE);
  EXPECT_TRUE(state.Load() == TestState::IDLE);
  EXPECT_TRUE(state.CompareAndSwap(TestState::IDLE, TestState::RUNNING));
  EXPECT_FALSE(state.CompareAndSwap(TestState::IDLE, TestState::DONE));
  EXPECT_TRUE(state.Load() == TestState::RUNNING);
  state.Store(TestState::DONE);
  EXPECT_TRUE(state.Load() == TestState::DONE);
}

}

WLM_TEST_MAIN();
