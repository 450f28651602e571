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
#include <tuple>
#include <vector>

#include <process/collect.hpp>
#include <process/io.hpp>
#include <process/subprocess.hpp>

#include <stout/bytes.hpp>
#include <stout/check.hpp>
#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/numify.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <stout/os/constants.hpp>
#include <stout/os/exists.hpp>

#include "hdfs/hdfs.hpp"

using namespace process;

using std::string;
using std::vector;

// Default namenode RPC port.
static const int DEFAULT_HDFS_PORT = 8020;


struct CommandResult
{
  Option<int> status;
  string out;
  string err;
};


static Future<CommandResult> result(const Subprocess& s)
{
  CHECK_SOME(s.out());
  CHECK_SOME(s.err());

  return await(
      s.status(),
      io::read(s.out().get()),
      io::read(s.err().get()))
    .then([](const std::tuple<
        Future<Option<int>>,
        Future<string>,
        Future<string>>& t) -> Future<CommandResult> {
      const Future<Option<int>>& status = std::get<0>(t);
      if (!status.isReady()) {
        return Failure(
            "Failed to get the exit status of the subprocess: " +
            (status.isFailed() ? status.failure() : "discarded"));
      }

      const Future<string>& output = std::get<1>(t);
      if (!output.isReady()) {
        return Failure(
            "Failed to read stdout from the subprocess: " +
            (output.isFailed() ? output.failure() : "discarded"));
      }

      const Future<string>& error = std::get<2>(t);
      if (!error.isReady()) {
        return Failure(
            "Failed to read stderr from the subprocess: " +
            (error.isFailed() ? error.failure() : "discarded"));
      }

      CommandResult result;
      result.status = status.get();
      result.out = output.get();
      result.err = error.get();

      return result;
    });
}


// Runs the hadoop client and returns what it wrote to stdout. The
// future fails unless the client exits with status 0.
static Future<string> execute(const string& hadoop, const vector<string>& argv)
{
  Try<Subprocess> s = subprocess(
      hadoop,
      argv,
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PIPE(),
      Subprocess::PIPE());

  if (s.isError()) {
    return Failure("Failed to execute the subprocess: " + s.error());
  }

  return result(s.get())
    .then([](const CommandResult& result) -> Future<string> {
      if (result.status.isNone()) {
        return Failure("Failed to reap the subprocess");
      }

      if (result.status.get() != 0) {
        return Failure(
            "Unexpected result from the subprocess: "
            "status='" + stringify(result.status.get()) + "', " +
            "stdout='" + result.out + "', " +
            "stderr='" + result.err + "'");
      }

      return result.out;
    });
}


Try<Owned<HDFS>> HDFS::create(const Option<string>& _hadoop)
{
  // Determine the hadoop client to use. If the user has specified
  // it, use it. If not, look for environment variable HADOOP_HOME. If
  // the environment variable is not set, assume it's on the PATH.
  string hadoop;

  if (_hadoop.isSome()) {
    hadoop = _hadoop.get();
  } else {
    Option<string> hadoopHome = os::getenv("HADOOP_HOME");
    if (hadoopHome.isSome()) {
      hadoop = path::join(hadoopHome.get(), "bin", "hadoop");
    } else {
      hadoop = "hadoop";
    }
  }

  // Check if the hadoop client is available.
  Try<Subprocess> subprocess = process::subprocess(hadoop + " version 2>&1");

  if (subprocess.isError()) {
    return Error("Failed to exec hadoop subprocess: " + subprocess.error());
  }

  Option<int> status = subprocess->status().get();
  if (status.isNone()) {
    return Error("No status found for 'hadoop version' command");
  }

  // Check the final status of the command
  if (status.get() != 0) {
    return Error(
        "Hadoop client is not available, exit status: " +
        stringify(status.get()));
  }

  return Owned<HDFS>(new HDFS(hadoop));
}


Try<dataflow::URL> HDFS::parse(const string& uri)
{
  size_t schemePos = uri.find("://");
  if (schemePos == string::npos || schemePos == 0) {
    return Error("Missing scheme in url string '" + uri + "'");
  }

  dataflow::URL url;
  url.set_scheme(uri.substr(0, schemePos));

  const string uriPath = uri.substr(schemePos + 3);

  // If path is specified in the URL, try to capture the host and path
  // separately.
  size_t pathPos = uriPath.find_first_of('/');

  string authority = uriPath;
  string path = "/";
  if (pathPos != string::npos) {
    authority = uriPath.substr(0, pathPos);
    path = uriPath.substr(pathPos);
  }

  url.set_file(path);

  if (authority.empty()) {
    return url;
  }

  size_t userPos = authority.find('@');
  if (userPos != string::npos) {
    url.set_user_info(authority.substr(0, userPos));
    authority = authority.substr(userPos + 1);
  }

  const vector<string> tokens = strings::tokenize(authority, ":");

  if (tokens.empty() || tokens[0].empty()) {
    return Error("Host not found in url '" + uri + "'");
  }

  if (tokens.size() > 2) {
    return Error("Found multiple ports in url '" + uri + "'");
  }

  url.set_host(tokens[0]);

  if (tokens.size() == 2) {
    Try<int> port = numify<int>(tokens[1]);
    if (port.isError()) {
      return Error("Failed to parse port: " + port.error());
    }

    url.set_port(port.get());
  } else if (url.scheme() == "hdfs") {
    url.set_port(DEFAULT_HDFS_PORT);
  }

  return url;
}


Try<string> HDFS::root(const string& uri)
{
  size_t schemePos = uri.find("://");
  if (schemePos == string::npos || schemePos == 0) {
    return Error("Missing scheme in url string '" + uri + "'");
  }

  size_t pathPos = uri.find('/', schemePos + 3);
  if (pathPos == string::npos) {
    return uri + "/";
  }

  return uri.substr(0, pathPos + 1);
}


// An HDFS client path must be either a full URI or an absolute path. If it is
// a relative path, prepend "/" to make it absolute. (Note that all URI schemes
// supported by the HDFS client contain "://" whereas file paths never do.)
static string normalize(const string& hdfsPath)
{
  if (strings::contains(hdfsPath, "://") || // A URI or a malformed path.
      path::is_absolute(hdfsPath)) { // Already an absolute path.
    return hdfsPath;
  }

  // A relative, non-URI file path. Prepend "/".
  return path::join("", hdfsPath);
}


Future<HDFS::FileStatus> HDFS::stat(const string& path)
{
  // '%b' is the length in bytes and '%Y' the modification time in
  // milliseconds since the epoch.
  return execute(hadoop, {"hadoop", "fs", "-stat", "%b %Y", normalize(path)})
    .then([path](const string& output) -> Future<FileStatus> {
      // The 'hadoop' command can emit various WARN or other log
      // messages, so we scan for the line with the two fields.
      foreach (const string& line, strings::tokenize(output, "\n")) {
        vector<string> fields = strings::tokenize(line, " \t");
        if (fields.size() != 2) {
          continue;
        }

        Try<size_t> length = numify<size_t>(fields[0]);
        Try<int64_t> modificationTime = numify<int64_t>(fields[1]);

        if (length.isSome() && modificationTime.isSome()) {
          FileStatus status;
          status.length = Bytes(length.get());
          status.modificationTime = modificationTime.get();
          return status;
        }
      }

      return Failure(
          "Unexpected output format for '" + path + "': '" + output + "'");
    });
}


Future<Nothing> HDFS::mkdir(const string& path)
{
  return execute(hadoop, {"hadoop", "fs", "-mkdir", "-p", normalize(path)})
    .then([]() { return Nothing(); });
}


Future<Nothing> HDFS::rm(const string& path, bool recursive)
{
  vector<string> argv = {"hadoop", "fs", "-rm"};
  if (recursive) {
    argv.push_back("-r");
  }
  argv.push_back(normalize(path));

  return execute(hadoop, argv)
    .then([]() { return Nothing(); });
}


Future<Nothing> HDFS::copyFromLocal(const string& from, const string& to)
{
  if (!os::exists(from)) {
    return Failure("Failed to find '" + from + "'");
  }

  return execute(
      hadoop,
      {"hadoop", "fs", "-copyFromLocal", "-f", from, normalize(to)})
    .then([]() { return Nothing(); });
}


Future<Nothing> HDFS::fetchDelegationToken(
    const string& uri,
    const Option<string>& renewer,
    const string& to)
{
  vector<string> argv = {"hadoop", "dtutil", "get", uri, "-format", "java"};
  if (renewer.isSome()) {
    argv.push_back("-renewer");
    argv.push_back(renewer.get());
  }

  // The token file must be the last argument.
  argv.push_back(to);

  return execute(hadoop, argv)
    .then([]() { return Nothing(); });
}
