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

#include <algorithm>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>

#include <stout/os/mkdtemp.hpp>
#include <stout/os/rmdir.hpp>

#include "yarn/constants.hpp"
#include "yarn/credentials.hpp"

using process::Failure;
using process::Future;
using process::Owned;

using std::string;
using std::vector;

namespace dataflow {
namespace internal {
namespace yarn {

// Re-keys every token by its identifier.
static hdfs::Credentials rekey(const hdfs::Credentials& credentials)
{
  hdfs::Credentials result;

  foreachvalue (const hdfs::Token& token, credentials.tokens()) {
    result.add(token.identifier, token);
  }

  foreachpair (const string& alias,
               const string& secret,
               credentials.secrets()) {
    result.add(alias, secret);
  }

  return result;
}


Try<hdfs::Credentials> CredentialBundler::currentUserCredentials()
{
  Option<string> location = os::getenv(TOKEN_FILE_LOCATION);
  if (location.isNone()) {
    return hdfs::Credentials();
  }

  return hdfs::read(location.get());
}


Future<hdfs::Credentials> CredentialBundler::obtain(
    const string& root,
    const string& file)
{
  return hdfs->fetchDelegationToken(root, renewer, file)
    .then([root, file]() -> Future<hdfs::Credentials> {
      Try<hdfs::Credentials> credentials = hdfs::read(file);
      if (credentials.isError()) {
        return Failure(
            "Failed to obtain a delegation token for '" + root + "': " +
            credentials.error());
      }

      LOG(INFO) << "Obtained " << credentials->tokens().size()
                << " delegation token(s) for '" << root << "'";

      return credentials.get();
    });
}


Future<string> CredentialBundler::bundle(
    const vector<string>& paths,
    const hdfs::Credentials& user)
{
  // Tokens are scoped to a file system, not to a path.
  vector<string> roots;
  foreach (const string& path, paths) {
    Try<string> root = HDFS::root(path);
    if (root.isError()) {
      return Failure(
          "Failed to determine the file system of '" + path + "': " +
          root.error());
    }

    if (std::find(roots.begin(), roots.end(), root.get()) == roots.end()) {
      roots.push_back(root.get());
    }
  }

  Try<string> directory = os::mkdtemp();
  if (directory.isError()) {
    return Failure(
        "Failed to create a directory for delegation tokens: " +
        directory.error());
  }

  Future<hdfs::Credentials> credentials = hdfs::Credentials();

  // The tokens are obtained one file system at a time.
  for (size_t i = 0; i < roots.size(); i++) {
    Owned<CredentialBundler> self(new CredentialBundler(hdfs, renewer));
    const string root = roots[i];
    const string file =
      path::join(directory.get(), "token-" + stringify(i));

    credentials = credentials
      .then([self, root, file](const hdfs::Credentials& result) {
        return self->obtain(root, file)
          .then([result](const hdfs::Credentials& obtained) {
            hdfs::Credentials merged = result;
            merged.merge(rekey(obtained));
            return merged;
          });
      });
  }

  const string _directory = directory.get();

  return credentials
    .then([user](const hdfs::Credentials& result) {
      hdfs::Credentials merged = result;

      foreachvalue (const hdfs::Token& token, user.tokens()) {
        LOG(INFO) << "Adding user token of kind '" << token.kind
                  << "' for service '" << token.service << "'";
      }

      // Merged last so that the user's tokens win.
      merged.merge(rekey(user));

      const string data = hdfs::serialize(merged);

      VLOG(1) << "Wrote tokens. Credentials buffer length: " << data.size();

      return data;
    })
    .onAny([_directory]() {
      Try<Nothing> rmdir = os::rmdir(_directory);
      if (rmdir.isError()) {
        LOG(WARNING) << "Failed to remove token directory '" << _directory
                     << "': " << rmdir.error();
      }
    });
}

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {
