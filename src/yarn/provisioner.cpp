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

#include <stout/path.hpp>
#include <stout/try.hpp>

#include "yarn/constants.hpp"
#include "yarn/provisioner.hpp"

using process::Failure;
using process::Future;
using process::Owned;

using std::string;

namespace dataflow {
namespace internal {
namespace yarn {

string ResourceProvisioner::destination(
    const string& localPath,
    const string& appId,
    const string& destinationRoot)
{
  return path::join(
      destinationRoot,
      STAGING_DIRECTORY,
      appId,
      Path(localPath).basename());
}


Future<LocalResource> ResourceProvisioner::provision(
    const string& localPath,
    const string& appId,
    const string& destinationRoot)
{
  const string remotePath = destination(localPath, appId, destinationRoot);

  LOG(INFO) << "Copying from '" << localPath << "' to '" << remotePath << "'";

  // Keep the storage client alive until the chain completes.
  Owned<HDFS> hdfs = this->hdfs;

  return hdfs->mkdir(Path(remotePath).dirname())
    .then([=]() {
      return hdfs->copyFromLocal(localPath, remotePath);
    })
    .then([=]() {
      return ResourceProvisioner(hdfs).registerExisting(remotePath);
    });
}


Future<LocalResource> ResourceProvisioner::registerExisting(
    const string& remotePath)
{
  Try<URL> url = HDFS::parse(remotePath);
  if (url.isError()) {
    return Failure(
        "Failed to determine the location of '" + remotePath + "': " +
        url.error());
  }

  const URL location = url.get();

  return hdfs->stat(remotePath)
    .then([location](const HDFS::FileStatus& status) {
      LocalResource resource;
      resource.mutable_url()->CopyFrom(location);
      resource.set_size(status.length.bytes());
      resource.set_timestamp(status.modificationTime);
      resource.set_type(LocalResource::FILE);
      resource.set_visibility(LocalResource::APPLICATION);

      VLOG(1) << "Registered " << resource;

      return resource;
    });
}


Future<Nothing> ResourceProvisioner::cleanup(
    const string& appId,
    const string& destinationRoot)
{
  const string directory =
    path::join(destinationRoot, STAGING_DIRECTORY, appId);

  LOG(INFO) << "Removing staged files in '" << directory << "'";

  return hdfs->rm(directory, true);
}

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {
