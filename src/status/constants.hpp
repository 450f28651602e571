// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __STATUS_CONSTANTS_HPP__
#define __STATUS_CONSTANTS_HPP__

#include <stout/duration.hpp>

namespace dataflow {
namespace internal {
namespace status {

// ID of the coordinator's libprocess process.
constexpr char COORDINATOR_ID[] = "jobmanager";

constexpr int DEFAULT_COORDINATOR_PORT = 6123;

// Bound on the wait for the coordinator, both when resolving it and
// for every status query.
constexpr Duration DEFAULT_TIMEOUT = Seconds(100);

// ID of the process serving the running jobs over HTTP.
constexpr char JOBS_INFO_ID[] = "jobs";

} // namespace status {
} // namespace internal {
} // namespace dataflow {

#endif // __STATUS_CONSTANTS_HPP__
