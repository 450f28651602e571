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

#ifndef __YARN_CREDENTIALS_HPP__
#define __YARN_CREDENTIALS_HPP__

#include <string>
#include <vector>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/none.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "hdfs/hdfs.hpp"
#include "hdfs/tokens.hpp"

namespace dataflow {
namespace internal {
namespace yarn {

// Bundles the credentials a container needs to access the cluster
// storage: a delegation token for every file system the container
// reads from plus the tokens already held by the current user.
//
// There is no partial bundle. A container started with incomplete
// credentials would only fail later, when it is denied access.
class CredentialBundler
{
public:
  explicit CredentialBundler(
      const process::Owned<HDFS>& _hdfs,
      const Option<std::string>& _renewer = None())
    : hdfs(_hdfs), renewer(_renewer) {}

  // Returns the tokens of the current user, read from the token
  // storage file named by HADOOP_TOKEN_FILE_LOCATION. Returns no
  // tokens if the variable is not set.
  static Try<hdfs::Credentials> currentUserCredentials();

  // Returns the serialized token storage with the delegation tokens
  // for 'paths' and the tokens in 'user'. All tokens are keyed by
  // their identifier; the tokens in 'user' win on collisions.
  process::Future<std::string> bundle(
      const std::vector<std::string>& paths,
      const hdfs::Credentials& user);

private:
  // Obtains a delegation token from the file system rooted at 'root'
  // by way of the token storage file 'file'.
  process::Future<hdfs::Credentials> obtain(
      const std::string& root,
      const std::string& file);

  process::Owned<HDFS> hdfs;
  const Option<std::string> renewer;
};

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {

#endif // __YARN_CREDENTIALS_HPP__
