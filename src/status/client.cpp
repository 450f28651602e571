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
#include <utility>
#include <vector>

#include <glog/logging.h>

#include <process/defer.hpp>
#include <process/dispatch.hpp>
#include <process/event.hpp>
#include <process/id.hpp>
#include <process/process.hpp>
#include <process/protobuf.hpp>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/stringify.hpp>
#include <stout/uuid.hpp>

#include "messages/messages.hpp"

#include "status/client.hpp"
#include "status/constants.hpp"

using process::Future;
using process::MessageEvent;
using process::Owned;
using process::Process;
using process::Promise;
using process::UPID;

using std::string;
using std::vector;

namespace dataflow {
namespace internal {
namespace status {

// Performs a single query. The reply is handled as a raw message so
// that a reply which does not parse is reported rather than dropped.
class RunningJobsQueryProcess : public ProtobufProcess<RunningJobsQueryProcess>
{
public:
  explicit RunningJobsQueryProcess(const UPID& _coordinator)
    : ProcessBase(process::ID::generate("running-jobs-query")),
      coordinator(_coordinator) {}

  ~RunningJobsQueryProcess() override {}

  Future<StatusQueryOutcome> query()
  {
    send(coordinator, RequestRunningJobsMessage());

    promise.future().onDiscard(defer(self(), &Self::discarded));

    return promise.future();
  }

protected:
  void initialize() override
  {
    // A coordinator that goes away (or was never there) is detected
    // through the link.
    link(coordinator);

    ProcessBase::install(
        RunningJobsMessage().GetTypeName(),
        &RunningJobsQueryProcess::received);
  }

  void finalize() override
  {
    discarded();
  }

  void consume(MessageEvent&& event) override
  {
    if (event.message.from != coordinator) {
      LOG(WARNING) << "Ignoring '" << event.message.name << "' message from "
                   << event.message.from << " which is not the coordinator "
                   << coordinator;
      return;
    }

    // Any other reply from the coordinator ends the query.
    if (event.message.name != RunningJobsMessage().GetTypeName()) {
      LOG(WARNING) << "Received an unexpected '" << event.message.name
                   << "' reply from " << coordinator;

      promise.set(StatusQueryOutcome::malformed(
          "The running jobs request requires a response of type " +
          RunningJobsMessage().GetTypeName() + ", instead the response is"
          " of type " + event.message.name));
      return;
    }

    ProtobufProcess<RunningJobsQueryProcess>::consume(std::move(event));
  }

  void exited(const UPID& pid) override
  {
    if (pid == coordinator) {
      promise.set(StatusQueryOutcome::unreachable(
          "Lost connection to the coordinator at " + stringify(coordinator)));
    }
  }

private:
  void received(const UPID& from, const string& body)
  {
    Try<RunningJobsMessage> message =
      messages::deserialize<RunningJobsMessage>(body);

    if (message.isError()) {
      LOG(WARNING) << "Received a malformed running jobs reply from "
                   << from << ": " << message.error();

      promise.set(StatusQueryOutcome::malformed(
          "The coordinator answered the running jobs request with a"
          " malformed reply: " + message.error()));
      return;
    }

    vector<JobStatus> jobs;
    foreach (const JobStatus& job, message->jobs()) {
      VLOG(2) << "Job " << job.job_id() << " is " << job.state();
      jobs.push_back(job);
    }

    promise.set(StatusQueryOutcome::success(jobs));
  }

  void discarded()
  {
    promise.discard();
  }

  const UPID coordinator;
  Promise<StatusQueryOutcome> promise;
};


class RunningJobsQuery
{
public:
  explicit RunningJobsQuery(const UPID& coordinator)
  {
    process = new RunningJobsQueryProcess(coordinator);
    spawn(process);
  }

  ~RunningJobsQuery()
  {
    terminate(process);
    wait(process);
    delete process;
  }

  Future<StatusQueryOutcome> query()
  {
    return dispatch(process, &RunningJobsQueryProcess::query);
  }

private:
  RunningJobsQueryProcess* process;
};


class ClusterStatusClientProcess : public Process<ClusterStatusClientProcess>
{
public:
  ClusterStatusClientProcess(const UPID& _coordinator, const Duration& _timeout)
    : ProcessBase(process::ID::generate("cluster-status-client")),
      coordinator(_coordinator),
      timeout(_timeout) {}

  ~ClusterStatusClientProcess() override {}

  Future<StatusQueryOutcome> query()
  {
    const id::UUID uuid = id::UUID::random();

    Owned<RunningJobsQuery> query(new RunningJobsQuery(coordinator));
    queries.put(uuid, query);

    const Duration _timeout = timeout;

    return query->query()
      .after(timeout, [_timeout](Future<StatusQueryOutcome> future)
          -> Future<StatusQueryOutcome> {
        future.discard();
        return StatusQueryOutcome::timeout(
            "Could not retrieve the running jobs from the coordinator"
            " within " + stringify(_timeout));
      })
      .onAny(defer(self(), &Self::_query, uuid));
  }

private:
  void _query(const id::UUID& uuid)
  {
    queries.erase(uuid);
  }

  const UPID coordinator;
  const Duration timeout;

  // Outstanding queries; they are terminated along with this process.
  hashmap<id::UUID, Owned<RunningJobsQuery>> queries;
};


Try<Owned<ClusterStatusClient>> ClusterStatusClient::create(
    const Flags& flags)
{
  if (flags.coordinator_host.isNone()) {
    return Error("Missing required flag --coordinator_host");
  }

  const UPID coordinator(
      string(COORDINATOR_ID) + "@" + flags.coordinator_host.get() + ":" +
      stringify(flags.coordinator_port));

  return create(coordinator, flags.timeout);
}


Try<Owned<ClusterStatusClient>> ClusterStatusClient::create(
    const UPID& coordinator,
    const Duration& timeout)
{
  const string error =
    "Could not find coordinator at specified address " +
    stringify(coordinator) + ".";

  // An address that does not resolve yields an empty PID.
  if (!coordinator) {
    return Error(error);
  }

  Protocol<IdentifyCoordinatorMessage, CoordinatorIdentifiedMessage> identify;

  Future<CoordinatorIdentifiedMessage> identified =
    identify(coordinator, IdentifyCoordinatorMessage());

  if (!identified.await(timeout) || !identified.isReady()) {
    identified.discard();
    return Error(error);
  }

  LOG(INFO) << "Found coordinator at " << coordinator
            << (identified->has_version()
                ? " (version " + identified->version() + ")"
                : string());

  return Owned<ClusterStatusClient>(
      new ClusterStatusClient(coordinator, timeout));
}


ClusterStatusClient::ClusterStatusClient(
    const UPID& coordinator,
    const Duration& timeout)
  : coordinator_(coordinator)
{
  process = new ClusterStatusClientProcess(coordinator, timeout);
  spawn(process);
}


ClusterStatusClient::~ClusterStatusClient()
{
  terminate(process);
  wait(process);
  delete process;
}


Future<StatusQueryOutcome> ClusterStatusClient::query()
{
  return dispatch(process, &ClusterStatusClientProcess::query);
}


StatusQueryOutcome ClusterStatusClient::listRunningJobs()
{
  Future<StatusQueryOutcome> outcome = query();
  outcome.await();

  if (outcome.isReady()) {
    return outcome.get();
  }

  return StatusQueryOutcome::unreachable(
      outcome.isFailed()
        ? outcome.failure()
        : "The running jobs query was discarded");
}

} // namespace status {
} // namespace internal {
} // namespace dataflow {
