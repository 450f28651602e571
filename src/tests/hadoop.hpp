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

#ifndef __TESTS_HADOOP_HPP__
#define __TESTS_HADOOP_HPP__

#include <string>

#include <gtest/gtest.h>

#include <process/gtest.hpp>
#include <process/owned.hpp>

#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/try.hpp>

#include <stout/os/chmod.hpp>
#include <stout/os/write.hpp>

#include <stout/tests/utils.hpp>

#include "hdfs/hdfs.hpp"

namespace dataflow {
namespace internal {
namespace tests {

// Installs a fake hadoop command line tool in the sandbox. It
// emulates the client's logic on the local filesystem for 'file://'
// URIs. Delegation tokens are copied from the file 'tokens' in the
// sandbox and every token request is recorded in 'dtutil.log'.
class HadoopTest : public TemporaryDirectoryTest
{
public:
  void SetUp() override
  {
    TemporaryDirectoryTest::SetUp();

    hadoop = path::join(sandbox.get(), "hadoop");
    tokens = path::join(sandbox.get(), "tokens");
    requests = path::join(sandbox.get(), "dtutil.log");

    ASSERT_SOME(os::write(
        hadoop,
        "#!/bin/sh\n"
        "strip() { echo \"$1\" | sed -e 's|^file://||'; }\n"
        "if [ \"$1\" = \"version\" ]; then\n"
        "  exit 0\n"
        "fi\n"
        "if [ \"$1\" = \"dtutil\" ]; then\n"
        "  echo \"$@\" >> " + requests + "\n"
        "  for last in \"$@\"; do :; done\n"
        "  cp " + tokens + " \"$last\"\n"
        "  exit $?\n"
        "fi\n"
        "case \"$2\" in\n"
        "  -stat)\n"
        "    file=$(strip \"$4\")\n"
        "    test -f \"$file\" || exit 1\n"
        "    echo \"$(wc -c < \"$file\" | tr -d ' ')"
        " $(($(stat -c %Y \"$file\") * 1000))\"\n"
        "    ;;\n"
        "  -mkdir)\n"
        "    mkdir -p \"$(strip \"$4\")\"\n"
        "    ;;\n"
        "  -copyFromLocal)\n"
        "    cp \"$4\" \"$(strip \"$5\")\"\n"
        "    ;;\n"
        "  -rm)\n"
        "    if [ \"$3\" = \"-r\" ]; then\n"
        "      rm -r \"$(strip \"$4\")\"\n"
        "    else\n"
        "      rm \"$(strip \"$3\")\"\n"
        "    fi\n"
        "    ;;\n"
        "  *)\n"
        "    exit 2\n"
        "    ;;\n"
        "esac\n"));

    ASSERT_SOME(os::chmod(
        hadoop,
        S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH));

    Try<process::Owned<HDFS>> _hdfs = HDFS::create(hadoop);
    ASSERT_SOME(_hdfs);

    hdfs = _hdfs.get();
  }

protected:
  static std::string uri(const std::string& path)
  {
    return "file://" + path;
  }

  std::string hadoop;
  std::string tokens;
  std::string requests;
  process::Owned<HDFS> hdfs;
};

} // namespace tests {
} // namespace internal {
} // namespace dataflow {

#endif // __TESTS_HADOOP_HPP__
