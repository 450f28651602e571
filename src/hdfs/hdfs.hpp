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

#ifndef __HDFS_HPP__
#define __HDFS_HPP__

#include <stdint.h>

#include <string>

#include <dataflow/dataflow.hpp>

#include <process/future.hpp>
#include <process/owned.hpp>

#include <stout/bytes.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>


// Client for the cluster's distributed file system. All operations
// are performed by the 'hadoop' command line client run as a
// subprocess, so any file system the client is configured for
// (hdfs://, viewfs://, file://, ...) is supported.
class HDFS
{
public:
  struct FileStatus
  {
    Bytes length;

    // Milliseconds since the epoch.
    int64_t modificationTime;
  };

  static Try<process::Owned<HDFS>> create(
      const Option<std::string>& hadoop = None());

  // Parses a fully qualified file system path into the URL the
  // resource manager uses to localize it. A missing port defaults
  // to 8020 for the 'hdfs' scheme.
  static Try<dataflow::URL> parse(const std::string& uri);

  // Returns the file system root ('scheme://authority/') of a fully
  // qualified path. This is what delegation tokens are scoped to.
  static Try<std::string> root(const std::string& uri);

  process::Future<FileStatus> stat(const std::string& path);

  // Creates the directory along with any missing parents.
  process::Future<Nothing> mkdir(const std::string& path);

  process::Future<Nothing> rm(
      const std::string& path,
      bool recursive = false);

  // Copies a local file into the file system, replacing the
  // destination if it exists.
  process::Future<Nothing> copyFromLocal(
      const std::string& from,
      const std::string& to);

  // Obtains a delegation token from the file system rooted at 'uri'
  // and writes it to the local file 'to' using the writable token
  // storage format (see 'hdfs/tokens.hpp').
  process::Future<Nothing> fetchDelegationToken(
      const std::string& uri,
      const Option<std::string>& renewer,
      const std::string& to);

private:
  explicit HDFS(const std::string& _hadoop)
    : hadoop(_hadoop) {}

  const std::string hadoop;
};

#endif // __HDFS_HPP__
