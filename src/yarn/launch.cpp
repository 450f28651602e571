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

#include <set>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "hdfs/tokens.hpp"

#include "yarn/credentials.hpp"
#include "yarn/environment.hpp"
#include "yarn/heap.hpp"
#include "yarn/launch.hpp"
#include "yarn/provisioner.hpp"

using process::Failure;
using process::Future;
using process::Owned;

using std::set;
using std::string;
using std::vector;

namespace dataflow {
namespace internal {
namespace yarn {

ContainerLaunchSpecBuilder& ContainerLaunchSpecBuilder::memoryBudget(
    int megabytes)
{
  memoryBudget_ = megabytes;
  return *this;
}


ContainerLaunchSpecBuilder& ContainerLaunchSpecBuilder::heapLimit(
    int megabytes)
{
  heapLimit_ = megabytes;
  return *this;
}


ContainerLaunchSpecBuilder& ContainerLaunchSpecBuilder::environment(
    const Environment& environment)
{
  environment_ = environment;
  return *this;
}


ContainerLaunchSpecBuilder& ContainerLaunchSpecBuilder::resource(
    const LocalResource& resource)
{
  resources_.push_back(resource);
  return *this;
}


ContainerLaunchSpecBuilder& ContainerLaunchSpecBuilder::credentials(
    const string& credentials)
{
  credentials_ = credentials;
  return *this;
}


Try<ContainerLaunchSpec> ContainerLaunchSpecBuilder::build() const
{
  if (memoryBudget_.isNone() || memoryBudget_.get() <= 0) {
    return Error("Expecting a positive memory budget");
  }

  const int heap = heapLimit_.getOrElse(memoryBudget_.get());

  if (heap < 0 || heap > memoryBudget_.get()) {
    return Error(
        "Heap limit of " + stringify(heap) + " MB does not fit into the"
        " memory budget of " + stringify(memoryBudget_.get()) + " MB");
  }

  set<string> names;
  foreach (const Environment::Variable& variable,
           environment_.variables()) {
    if (names.count(variable.name()) > 0) {
      return Error(
          "Environment variable '" + variable.name() + "' is set more"
          " than once");
    }
    names.insert(variable.name());
  }

  ContainerLaunchSpec spec;
  spec.set_memory_budget_mb(memoryBudget_.get());
  spec.set_heap_limit_mb(heap);
  spec.mutable_environment()->CopyFrom(environment_);

  foreach (const LocalResource& resource, resources_) {
    spec.add_resources()->CopyFrom(resource);
  }

  if (credentials_.isSome()) {
    spec.set_credentials(credentials_.get());
  }

  return spec;
}


Future<ContainerLaunchSpec> prepare(
    const Flags& flags,
    const Owned<HDFS>& hdfs,
    const string& appId,
    int memory,
    const vector<string>& artifacts)
{
  if (flags.staging_root.isNone()) {
    return Failure("Missing required flag --staging_root");
  }

  const string root = flags.staging_root.get();

  const int heap = computeHeapLimit(
      memory,
      flags.heap_cutoff_ratio,
      flags.heap_limit_cap);

  const Environment environment = classpath(
      Environment(),
      strings::tokenize(flags.application_classpath, ","));

  Try<hdfs::Credentials> user = CredentialBundler::currentUserCredentials();
  if (user.isError()) {
    return Failure("Failed to load the user's tokens: " + user.error());
  }

  // Artifacts are staged one after the other so the resources keep
  // the order of 'artifacts'.
  Future<vector<LocalResource>> resources = vector<LocalResource>();

  foreach (const string& artifact, artifacts) {
    resources = resources
      .then([=](const vector<LocalResource>& staged) {
        return ResourceProvisioner(hdfs).provision(artifact, appId, root)
          .then([staged](const LocalResource& resource) {
            vector<LocalResource> result = staged;
            result.push_back(resource);
            return result;
          });
      });
  }

  const Option<string> renewer = flags.token_renewer;
  const hdfs::Credentials tokens = user.get();

  return resources
    .then([=](const vector<LocalResource>& staged) {
      vector<string> paths;
      foreach (const string& artifact, artifacts) {
        paths.push_back(
            ResourceProvisioner::destination(artifact, appId, root));
      }
      paths.push_back(root);

      return CredentialBundler(hdfs, renewer).bundle(paths, tokens)
        .then([=](const string& credentials) -> Future<ContainerLaunchSpec> {
          ContainerLaunchSpecBuilder builder;
          builder
            .memoryBudget(memory)
            .heapLimit(heap)
            .environment(environment)
            .credentials(credentials);

          foreach (const LocalResource& resource, staged) {
            builder.resource(resource);
          }

          Try<ContainerLaunchSpec> spec = builder.build();
          if (spec.isError()) {
            return Failure(spec.error());
          }

          LOG(INFO) << "Prepared container of " << memory << " MB with a "
                    << heap << " MB heap and " << staged.size()
                    << " resource(s)";

          return spec.get();
        });
    });
}

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {
