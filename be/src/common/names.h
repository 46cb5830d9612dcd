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

/// The motivation for the using declarations below is to allow accessing the most
/// relevant and most frequently used library classes without having to explicitly pull
/// them into the global namespace. The goal is that every .cc file includes this header
/// as its last include so that names resolve the same way across the project.
///
/// Never include this header from another header.

#ifdef _GLIBCXX_STRING
using std::string;
using std::to_string;
#endif

#ifdef _GLIBCXX_VECTOR
using std::vector;
#endif

#ifdef _GLIBCXX_MAP
using std::map;
#endif

#ifdef _GLIBCXX_SET
using std::set;
#endif

#ifdef _GLIBCXX_UNORDERED_MAP
using std::unordered_map;
#endif

#ifdef _GLIBCXX_MEMORY
using std::make_shared;
using std::shared_ptr;
using std::unique_ptr;
using std::weak_ptr;
#endif

#ifdef _GLIBCXX_UTILITY
using std::make_pair;
using std::move;
using std::pair;
#endif

#ifdef _GLIBCXX_ALGORITHM
using std::max;
using std::min;
using std::sort;
#endif

#ifdef _GLIBCXX_MUTEX
using std::lock_guard;
using std::mutex;
using std::unique_lock;
#endif

#ifdef _GLIBCXX_SSTREAM
using std::stringstream;
#endif

#ifdef _GLIBCXX_OSTREAM
using std::endl;
using std::ostream;
#endif

#ifdef ABSL_STRINGS_SUBSTITUTE_H_
using absl::Substitute;
#endif

#ifdef BOOST_THREAD_THREAD_COMMON_HPP
using boost::thread;
using boost::thread_group;
#endif
