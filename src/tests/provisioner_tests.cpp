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

#include <dataflow/dataflow.hpp>

#include <process/future.hpp>
#include <process/gtest.hpp>

#include <stout/gtest.hpp>
#include <stout/path.hpp>

#include <stout/os/exists.hpp>
#include <stout/os/mkdir.hpp>
#include <stout/os/read.hpp>
#include <stout/os/write.hpp>

#include "tests/hadoop.hpp"

#include "yarn/provisioner.hpp"

using std::string;

using process::Future;

namespace dataflow {
namespace internal {
namespace tests {

class ResourceProvisionerTest : public HadoopTest
{
public:
  void SetUp() override
  {
    HadoopTest::SetUp();

    staging = path::join(sandbox.get(), "staging");
    ASSERT_SOME(os::mkdir(staging));

    artifact = path::join(sandbox.get(), "dataflow.jar");
    ASSERT_SOME(os::write(artifact, "jar"));
  }

protected:
  string staging;
  string artifact;
};


TEST(ResourceProvisionerDestinationTest, Destination)
{
  EXPECT_EQ(
      "hdfs://namenode:8020/user/me/.dataflow/application_1_0001/a.jar",
      yarn::ResourceProvisioner::destination(
          "/home/me/build/a.jar",
          "application_1_0001",
          "hdfs://namenode:8020/user/me"));
}


TEST_F(ResourceProvisionerTest, Provision)
{
  yarn::ResourceProvisioner provisioner(hdfs);

  Future<LocalResource> resource =
    provisioner.provision(artifact, "application_1_0001", uri(staging));

  AWAIT_READY(resource);

  const string remote =
    path::join(staging, ".dataflow", "application_1_0001", "dataflow.jar");

  EXPECT_SOME_EQ("jar", os::read(remote));

  EXPECT_EQ("file", resource->url().scheme());
  EXPECT_EQ(remote, resource->url().file());
  EXPECT_EQ(3u, resource->size());
  EXPECT_LT(0, resource->timestamp());
  EXPECT_EQ(LocalResource::FILE, resource->type());
  EXPECT_EQ(LocalResource::APPLICATION, resource->visibility());
}


// Provisioning the same file again stages it at the same location
// and describes the new contents.
TEST_F(ResourceProvisionerTest, ProvisionTwice)
{
  yarn::ResourceProvisioner provisioner(hdfs);

  Future<LocalResource> first =
    provisioner.provision(artifact, "application_1_0001", uri(staging));
  AWAIT_READY(first);

  ASSERT_SOME(os::write(artifact, "a larger jar"));

  Future<LocalResource> second =
    provisioner.provision(artifact, "application_1_0001", uri(staging));
  AWAIT_READY(second);

  EXPECT_EQ(first->url(), second->url());
  EXPECT_EQ(12u, second->size());
}


TEST_F(ResourceProvisionerTest, RegisterExisting)
{
  const string remote = path::join(staging, "existing.jar");
  ASSERT_SOME(os::write(remote, "existing"));

  yarn::ResourceProvisioner provisioner(hdfs);

  Future<LocalResource> resource = provisioner.registerExisting(uri(remote));
  AWAIT_READY(resource);

  EXPECT_EQ(remote, resource->url().file());
  EXPECT_EQ(8u, resource->size());
  EXPECT_EQ(LocalResource::FILE, resource->type());
  EXPECT_EQ(LocalResource::APPLICATION, resource->visibility());

  AWAIT_FAILED(provisioner.registerExisting(
      uri(path::join(staging, "NotExists"))));

  // Only fully qualified paths can be localized.
  AWAIT_FAILED(provisioner.registerExisting(remote));
}


TEST_F(ResourceProvisionerTest, ProvisionMissingFile)
{
  yarn::ResourceProvisioner provisioner(hdfs);

  AWAIT_FAILED(provisioner.provision(
      path::join(sandbox.get(), "NotExists"),
      "application_1_0001",
      uri(staging)));
}


TEST_F(ResourceProvisionerTest, Cleanup)
{
  yarn::ResourceProvisioner provisioner(hdfs);

  AWAIT_READY(
      provisioner.provision(artifact, "application_1_0001", uri(staging)));

  AWAIT_READY(provisioner.cleanup("application_1_0001", uri(staging)));

  EXPECT_FALSE(os::exists(
      path::join(staging, ".dataflow", "application_1_0001")));
  EXPECT_TRUE(os::exists(path::join(staging, ".dataflow")));
}

} // namespace tests {
} // namespace internal {
} // namespace dataflow {
