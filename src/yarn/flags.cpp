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

#include <stout/stringify.hpp>

#include "yarn/constants.hpp"
#include "yarn/flags.hpp"


dataflow::internal::yarn::Flags::Flags()
{
  add(&Flags::heap_cutoff_ratio,
      "heap_cutoff_ratio",
      "Fraction of the container memory used as heap. The resource manager\n"
      "kills containers exceeding their memory, so the process needs\n"
      "headroom for memory it allocates besides the heap.",
      DEFAULT_HEAP_CUTOFF_RATIO,
      [](double value) -> Option<Error> {
        if (value <= 0.0 || value > 1.0) {
          return Error("Expected --heap_cutoff_ratio in (0, 1]");
        }
        return None();
      });

  add(&Flags::heap_limit_cap,
      "heap_limit_cap",
      "Maximum amount of memory (in MB) held back from the heap by\n"
      "--heap_cutoff_ratio. Large containers give up at most this much.",
      DEFAULT_HEAP_LIMIT_CAP,
      [](int value) -> Option<Error> {
        if (value < 0) {
          return Error("Expected --heap_limit_cap to be non-negative");
        }
        return None();
      });

  add(&Flags::application_classpath,
      "application_classpath",
      "Comma separated classpath entries appended (in order) to the\n"
      "container's CLASSPATH after the working directory.",
      DEFAULT_APPLICATION_CLASSPATH);

  add(&Flags::hadoop,
      "hadoop",
      "Path to the 'hadoop' client used to access the cluster storage.\n"
      "Defaults to '$HADOOP_HOME/bin/hadoop' or 'hadoop' on the PATH.");

  add(&Flags::staging_root,
      "staging_root",
      "Fully qualified directory of the cluster storage under which\n"
      "application files are staged, e.g., 'hdfs://namenode:8020/user/me'.");

  add(&Flags::token_renewer,
      "token_renewer",
      "Principal allowed to renew the delegation tokens obtained for the\n"
      "container, usually the resource manager's principal.");

  add(&Flags::container_memory,
      "container_memory",
      "Memory (in MB) requested for the container.",
      DEFAULT_CONTAINER_MEMORY,
      [](int value) -> Option<Error> {
        if (value <= 0) {
          return Error("Expected --container_memory to be positive");
        }
        return None();
      });

  add(&Flags::app_id,
      "app_id",
      "Application ID assigned by the resource manager.");

  add(&Flags::artifacts,
      "artifacts",
      "Comma separated local files staged for the container.");
}
