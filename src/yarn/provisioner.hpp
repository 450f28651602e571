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

#ifndef __YARN_PROVISIONER_HPP__
#define __YARN_PROVISIONER_HPP__

#include <string>

#include <dataflow/dataflow.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/nothing.hpp>

#include "hdfs/hdfs.hpp"

namespace dataflow {
namespace internal {
namespace yarn {

// Stages files in the cluster storage so that the resource manager
// can localize them into containers. Every operation is a chain of
// storage operations; the first failure fails the returned future
// with the storage layer's message and nothing is retried.
class ResourceProvisioner
{
public:
  explicit ResourceProvisioner(const process::Owned<HDFS>& _hdfs)
    : hdfs(_hdfs) {}

  // Returns where 'localPath' is staged for the application:
  // '<destinationRoot>/.dataflow/<appId>/<basename>'.
  static std::string destination(
      const std::string& localPath,
      const std::string& appId,
      const std::string& destinationRoot);

  // Copies 'localPath' to its destination, replacing any earlier
  // copy, and describes the copy.
  process::Future<LocalResource> provision(
      const std::string& localPath,
      const std::string& appId,
      const std::string& destinationRoot);

  // Describes a file that is already staged. The size and timestamp
  // are read from the storage, i.e., they are what the container
  // will see.
  process::Future<LocalResource> registerExisting(
      const std::string& remotePath);

  // Removes every file staged for the application.
  process::Future<Nothing> cleanup(
      const std::string& appId,
      const std::string& destinationRoot);

private:
  process::Owned<HDFS> hdfs;
};

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {

#endif // __YARN_PROVISIONER_HPP__
