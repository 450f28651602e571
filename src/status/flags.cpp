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

#include "status/constants.hpp"
#include "status/flags.hpp"


dataflow::internal::status::Flags::Flags()
{
  add(&Flags::coordinator_host,
      "coordinator_host",
      "Hostname or IP address of the coordinator (required).");

  add(&Flags::coordinator_port,
      "coordinator_port",
      "Port the coordinator listens on.",
      DEFAULT_COORDINATOR_PORT,
      [](int value) -> Option<Error> {
        if (value <= 0 || value > 65535) {
          return Error("Expected --coordinator_port in [1, 65535]");
        }
        return None();
      });

  add(&Flags::timeout,
      "timeout",
      "Amount of time to wait for the coordinator, both when looking it\n"
      "up and for every status query.",
      DEFAULT_TIMEOUT,
      [](const Duration& value) -> Option<Error> {
        if (value <= Duration::zero()) {
          return Error("Expected --timeout to be positive");
        }
        return None();
      });
}
