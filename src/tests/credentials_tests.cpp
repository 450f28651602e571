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
#include <vector>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>

#include <stout/os/read.hpp>
#include <stout/os/rm.hpp>

#include "hdfs/tokens.hpp"

#include "tests/hadoop.hpp"

#include "yarn/constants.hpp"
#include "yarn/credentials.hpp"

using std::string;
using std::vector;

using process::Future;

namespace dataflow {
namespace internal {
namespace tests {

static hdfs::Token createToken(const string& identifier, const string& kind)
{
  hdfs::Token token;
  token.identifier = identifier;
  token.password = "password";
  token.kind = kind;
  token.service = "namenode:8020";
  return token;
}


class CredentialBundlerTest : public HadoopTest
{
public:
  void SetUp() override
  {
    HadoopTest::SetUp();

    // What the namenode hands out for every token request.
    hdfs::Credentials delegation;
    delegation.add("namenode", createToken("shared", "HDFS_DELEGATION_TOKEN"));
    delegation.add("other", createToken("fetched", "HDFS_DELEGATION_TOKEN"));

    ASSERT_SOME(hdfs::write(tokens, delegation));
  }
};


TEST_F(CredentialBundlerTest, Bundle)
{
  yarn::CredentialBundler bundler(hdfs, string("yarn"));

  const vector<string> paths = {
    "hdfs://namenode:8020/user/me/.dataflow/app/a.jar",
    "hdfs://namenode:8020/user/me/.dataflow/app/b.jar",
    "hdfs://other:8020/data"
  };

  Future<string> bundle = bundler.bundle(paths, hdfs::Credentials());
  AWAIT_READY(bundle);

  Try<hdfs::Credentials> credentials = hdfs::parse(bundle.get());
  ASSERT_SOME(credentials);

  // Tokens are keyed by their identifier.
  ASSERT_EQ(2u, credentials->tokens().size());
  EXPECT_EQ(1u, credentials->tokens().count("shared"));
  EXPECT_EQ(1u, credentials->tokens().count("fetched"));

  // One token request per file system.
  Try<string> requests = os::read(this->requests);
  ASSERT_SOME(requests);

  const vector<string> lines = strings::tokenize(requests.get(), "\n");
  ASSERT_EQ(2u, lines.size());
  EXPECT_TRUE(strings::startsWith(
      lines[0], "dtutil get hdfs://namenode:8020/ -format java -renewer yarn"));
  EXPECT_TRUE(strings::startsWith(
      lines[1], "dtutil get hdfs://other:8020/ -format java -renewer yarn"));
}


// A token the user already holds replaces a fetched token with the
// same identifier.
TEST_F(CredentialBundlerTest, UserTokensWin)
{
  hdfs::Credentials user;
  user.add("anything", createToken("shared", "USER_TOKEN"));
  user.add("kms", createToken("kms", "kms-dt"));
  user.add("s3.secret", string("s3cr3t"));

  yarn::CredentialBundler bundler(hdfs);

  Future<string> bundle = bundler.bundle(
      {"hdfs://namenode:8020/user/me"},
      user);

  AWAIT_READY(bundle);

  Try<hdfs::Credentials> credentials = hdfs::parse(bundle.get());
  ASSERT_SOME(credentials);

  ASSERT_EQ(3u, credentials->tokens().size());
  EXPECT_EQ("USER_TOKEN", credentials->tokens().at("shared").kind);
  EXPECT_EQ("kms-dt", credentials->tokens().at("kms").kind);
  EXPECT_EQ(
      "HDFS_DELEGATION_TOKEN",
      credentials->tokens().at("fetched").kind);

  ASSERT_EQ(1u, credentials->secrets().size());
  EXPECT_EQ("s3cr3t", credentials->secrets().at("s3.secret"));
}


TEST_F(CredentialBundlerTest, NoPaths)
{
  hdfs::Credentials user;
  user.add("kms", createToken("kms", "kms-dt"));

  yarn::CredentialBundler bundler(hdfs);

  Future<string> bundle = bundler.bundle(vector<string>(), user);
  AWAIT_READY(bundle);

  Try<hdfs::Credentials> credentials = hdfs::parse(bundle.get());
  ASSERT_SOME(credentials);

  ASSERT_EQ(1u, credentials->tokens().size());
  EXPECT_EQ(1u, credentials->tokens().count("kms"));
}


TEST_F(CredentialBundlerTest, FetchFailure)
{
  // Without the token file the emulated token request fails.
  ASSERT_SOME(os::rm(tokens));

  yarn::CredentialBundler bundler(hdfs);

  AWAIT_FAILED(bundler.bundle(
      {"hdfs://namenode:8020/user/me"},
      hdfs::Credentials()));
}


TEST_F(CredentialBundlerTest, UnqualifiedPath)
{
  yarn::CredentialBundler bundler(hdfs);

  AWAIT_FAILED(bundler.bundle({"/user/me"}, hdfs::Credentials()));
}


TEST_F(CredentialBundlerTest, CurrentUserCredentials)
{
  os::unsetenv(yarn::TOKEN_FILE_LOCATION);

  Try<hdfs::Credentials> credentials =
    yarn::CredentialBundler::currentUserCredentials();

  ASSERT_SOME(credentials);
  EXPECT_TRUE(credentials->tokens().empty());

  os::setenv(yarn::TOKEN_FILE_LOCATION, tokens);

  credentials = yarn::CredentialBundler::currentUserCredentials();

  os::unsetenv(yarn::TOKEN_FILE_LOCATION);

  ASSERT_SOME(credentials);
  EXPECT_EQ(2u, credentials->tokens().size());
}

} // namespace tests {
} // namespace internal {
} // namespace dataflow {
