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

#include <iostream>

#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/try.hpp>

#include "logging/logging.hpp"

#include "status/client.hpp"
#include "status/flags.hpp"
#include "status/jobs_info.hpp"

using namespace dataflow::internal;

using process::Owned;

using std::cerr;
using std::cout;
using std::endl;

using dataflow::internal::status::ClusterStatusClient;
using dataflow::internal::status::JobsInfoProcess;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  status::Flags flags;

  Try<flags::Warnings> load = flags.load("DATAFLOW_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << load.error() << "\n\n"
         << "See `dataflow-jobs-info --help` for a list of supported flags."
         << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], flags, true); // Catch signals.

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  process::initialize();

  Try<Owned<ClusterStatusClient>> client = ClusterStatusClient::create(flags);
  if (client.isError()) {
    EXIT(EXIT_FAILURE) << client.error();
  }

  JobsInfoProcess* jobs = new JobsInfoProcess(client.get());

  process::spawn(jobs);

  LOG(INFO) << "Serving the running jobs of " << client.get()->coordinator()
            << " at " << jobs->self() << "/running";

  process::wait(jobs->self());
  delete jobs;

  return EXIT_SUCCESS;
}
