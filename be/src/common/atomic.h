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

#ifndef WLM_COMMON_ATOMIC_H
#define WLM_COMMON_ATOMIC_H

#include <atomic>
#include <cstdint>
#include <type_traits>

#include "common/compiler-util.h"

namespace wlm {

class AtomicUtil {
 public:
  /// Issues instruction to have the CPU wait, this is less busy (bus traffic
  /// etc) than just spinning.
  static ALWAYS_INLINE void CpuWait() {
#if defined(__x86_64__) || defined(__i386__)
    __asm__ __volatile__("pause" : : : "memory");
#else
    __asm__ __volatile__("" : : : "memory");
#endif
  }

  /// Full memory barrier.
  static ALWAYS_INLINE void MemoryBarrier() {
    std::atomic_thread_fence(std::memory_order_seq_cst);
  }
};

namespace internal {

/// Atomic integer. This class template should not be used directly; instead use the
/// typedefs below. 'T' can be either 32-bit or 64-bit signed integer. Each operation
/// is performed atomically and has a specified memory-ordering semantic:
///
/// Acquire: no later memory access by the same thread can be reordered ahead of the
/// operation (memory_order_acquire).
///
/// Release: no previous memory access by the same thread can be reordered after the
/// operation (memory_order_release).
///
/// Barrier: sequentially consistent, i.e. both Acquire and Release and a single total
/// order with all other Barrier operations (memory_order_seq_cst).
template<typename T>
class AtomicInt {
 public:
  AtomicInt(T initial = 0) : value_(initial) {
    static_assert(sizeof(T) == sizeof(int32_t) || sizeof(T) == sizeof(int64_t),
        "Only AtomicInt32 and AtomicInt64 are implemented");
  }

  AtomicInt(const AtomicInt&) = delete;
  AtomicInt& operator=(const AtomicInt&) = delete;

  /// Atomic load with "acquire" memory-ordering semantic.
  ALWAYS_INLINE T Load() const { return value_.load(std::memory_order_acquire); }

  /// Atomic store with "release" memory-ordering semantic.
  ALWAYS_INLINE void Store(T x) { value_.store(x, std::memory_order_release); }

  /// Atomic add with "barrier" memory-ordering semantic. Returns the new value.
  ALWAYS_INLINE T Add(T x) { return value_.fetch_add(x, std::memory_order_seq_cst) + x; }

  /// Atomically compare 'old_val' to 'value_' and set 'value_' to 'new_val' and return
  /// true if they compared equal, otherwise return false (and do no updates), with
  /// "barrier" memory-ordering semantic.
  ALWAYS_INLINE bool CompareAndSwap(T old_val, T new_val) {
    return value_.compare_exchange_strong(old_val, new_val, std::memory_order_seq_cst);
  }

  /// Store 'new_val' and return the previous value, with "barrier" memory-ordering
  /// semantic.
  ALWAYS_INLINE T Swap(T new_val) {
    return value_.exchange(new_val, std::memory_order_seq_cst);
  }

 private:
  std::atomic<T> value_;
};

} // namespace internal

/// Supported atomic types. Use these types rather than referring to AtomicInt<>
/// directly.
typedef internal::AtomicInt<int32_t> AtomicInt32;
typedef internal::AtomicInt<int64_t> AtomicInt64;

/// Atomic enum. Operations have the same semantics as AtomicInt.
template<typename T>
class AtomicEnum {
  static_assert(std::is_enum<T>::value, "Type must be enum");
  static_assert(sizeof(typename std::underlying_type<T>::type) <= sizeof(int32_t),
      "Underlying enum type must fit into 4 bytes");

 public:
  AtomicEnum(T initial) : enum_(static_cast<int32_t>(initial)) {}
  /// Atomic load with "acquire" memory-ordering semantic.
  ALWAYS_INLINE T Load() const { return static_cast<T>(enum_.Load()); }

  /// Atomic store with "release" memory-ordering semantic.
  ALWAYS_INLINE void Store(T val) { enum_.Store(static_cast<int32_t>(val)); }

  ALWAYS_INLINE bool CompareAndSwap(T old_val, T new_val) {
    return enum_.CompareAndSwap(
        static_cast<int32_t>(old_val), static_cast<int32_t>(new_val));
  }

 private:
  internal::AtomicInt<int32_t> enum_;
};

/// Atomic bool. Operations have the same semantics as AtomicInt.
class AtomicBool {
 public:
  AtomicBool(bool initial = false) : boolean_(initial) {}

  /// Atomic load with "acquire" memory-ordering semantic.
  ALWAYS_INLINE bool Load() const { return boolean_.Load(); }

  /// Atomic store with "release" memory-ordering semantic.
  ALWAYS_INLINE void Store(bool val) { boolean_.Store(val); }

  ALWAYS_INLINE bool CompareAndSwap(bool old_val, bool new_val) {
    return boolean_.CompareAndSwap(old_val, new_val);
  }

 private:
  internal::AtomicInt<int32_t> boolean_;
};

}

#endif
