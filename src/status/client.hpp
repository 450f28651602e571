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

#ifndef __STATUS_CLIENT_HPP__
#define __STATUS_CLIENT_HPP__

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/pid.hpp>

#include <stout/duration.hpp>
#include <stout/try.hpp>

#include "status/flags.hpp"
#include "status/outcome.hpp"

namespace dataflow {
namespace internal {
namespace status {

// Forward declaration.
class ClusterStatusClientProcess;


// Queries the coordinator for the jobs it is running. The
// coordinator is looked up once, when the client is created. Every
// query is bounded by the timeout; a query that times out, receives
// a reply it cannot parse or loses the coordinator yields an
// unsuccessful outcome and leaves the client usable.
class ClusterStatusClient
{
public:
  // Looks up the coordinator at '--coordinator_host' and
  // '--coordinator_port'.
  static Try<process::Owned<ClusterStatusClient>> create(const Flags& flags);

  static Try<process::Owned<ClusterStatusClient>> create(
      const process::UPID& coordinator,
      const Duration& timeout);

  ~ClusterStatusClient();

  process::Future<StatusQueryOutcome> query();

  // Blocks until the query completes.
  StatusQueryOutcome listRunningJobs();

  const process::UPID& coordinator() const { return coordinator_; }

private:
  ClusterStatusClient(
      const process::UPID& coordinator,
      const Duration& timeout);

  ClusterStatusClient(const ClusterStatusClient&) = delete;
  ClusterStatusClient& operator=(const ClusterStatusClient&) = delete;

  const process::UPID coordinator_;
  ClusterStatusClientProcess* process;
};

} // namespace status {
} // namespace internal {
} // namespace dataflow {

#endif // __STATUS_CLIENT_HPP__
