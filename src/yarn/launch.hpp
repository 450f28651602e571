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

#ifndef __YARN_LAUNCH_HPP__
#define __YARN_LAUNCH_HPP__

#include <string>
#include <vector>

#include <dataflow/dataflow.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/option.hpp>
#include <stout/try.hpp>

#include "hdfs/hdfs.hpp"

#include "yarn/flags.hpp"

namespace dataflow {
namespace internal {
namespace yarn {

class ContainerLaunchSpecBuilder
{
public:
  ContainerLaunchSpecBuilder& memoryBudget(int megabytes);
  ContainerLaunchSpecBuilder& heapLimit(int megabytes);
  ContainerLaunchSpecBuilder& environment(const Environment& environment);
  ContainerLaunchSpecBuilder& resource(const LocalResource& resource);
  ContainerLaunchSpecBuilder& credentials(const std::string& credentials);

  // Returns an error if the memory budget is missing or not positive,
  // if the heap does not fit into the budget or if a variable is set
  // more than once in the environment.
  Try<ContainerLaunchSpec> build() const;

private:
  Option<int> memoryBudget_;
  Option<int> heapLimit_;
  Environment environment_;
  std::vector<LocalResource> resources_;
  Option<std::string> credentials_;
};


// Assembles everything needed to launch a container of 'memory' MB
// for the application 'appId': the heap limit, the classpath, the
// staged 'artifacts' (in the given order) and the credentials to
// access them.
process::Future<ContainerLaunchSpec> prepare(
    const Flags& flags,
    const process::Owned<HDFS>& hdfs,
    const std::string& appId,
    int memory,
    const std::vector<std::string>& artifacts);

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {

#endif // __YARN_LAUNCH_HPP__
