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

#ifndef __STATUS_JOBS_INFO_HPP__
#define __STATUS_JOBS_INFO_HPP__

#include <string>

#include <process/future.hpp>
#include <process/http.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>

#include "status/client.hpp"

namespace dataflow {
namespace internal {
namespace status {

// Serves the coordinator's running jobs at '/jobs/running'.
class JobsInfoProcess : public process::Process<JobsInfoProcess>
{
public:
  explicit JobsInfoProcess(const process::Owned<ClusterStatusClient>& client);

  ~JobsInfoProcess() override {}

  static std::string RUNNING_HELP();

protected:
  void initialize() override;

private:
  process::Future<process::http::Response> running(
      const process::http::Request& request);

  process::Owned<ClusterStatusClient> client;
};

} // namespace status {
} // namespace internal {
} // namespace dataflow {

#endif // __STATUS_JOBS_INFO_HPP__
