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

#include <string>

#include <glog/logging.h>

#include <process/help.hpp>

#include "status/constants.hpp"
#include "status/jobs_info.hpp"
#include "status/render.hpp"

using process::DESCRIPTION;
using process::Future;
using process::HELP;
using process::Owned;
using process::TLDR;

using process::http::BadRequest;
using process::http::Request;
using process::http::Response;

using std::string;

namespace dataflow {
namespace internal {
namespace status {

JobsInfoProcess::JobsInfoProcess(const Owned<ClusterStatusClient>& _client)
  : ProcessBase(JOBS_INFO_ID),
    client(_client) {}


void JobsInfoProcess::initialize()
{
  route("/running", RUNNING_HELP(), &JobsInfoProcess::running);
}


string JobsInfoProcess::RUNNING_HELP()
{
  return HELP(
    TLDR(
        "Lists the jobs running on the coordinator."),
    DESCRIPTION(
        "Returns 200 OK with a JSON array holding one object per job",
        "with the keys 'jobid', 'jobname' (only for named jobs),",
        "'status' and 'time' (milliseconds since the epoch at which the",
        "job entered its status).",
        "",
        "Returns 400 BAD REQUEST with a plain text message if the",
        "coordinator could not be queried in time or answered with a",
        "reply that could not be understood."));
}


Future<Response> JobsInfoProcess::running(const Request& request)
{
  return client->query()
    .then([](const StatusQueryOutcome& outcome) -> Response {
      return render(outcome);
    })
    .repair([](const Future<Response>& response) -> Future<Response> {
      const string message = response.isFailed()
        ? response.failure()
        : "The running jobs query was discarded";

      LOG(WARNING) << "Failed to query the running jobs: " << message;

      return BadRequest(message);
    });
}

} // namespace status {
} // namespace internal {
} // namespace dataflow {
