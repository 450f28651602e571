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

#include <stdint.h>

#include <string>

#include <gtest/gtest.h>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/path.hpp>

#include <stout/os/write.hpp>

#include <stout/tests/utils.hpp>

#include "hdfs/tokens.hpp"

using std::string;

namespace dataflow {
namespace internal {
namespace tests {

static hdfs::Token createToken(
    const string& identifier,
    const string& kind = "HDFS_DELEGATION_TOKEN",
    const string& service = "10.0.0.1:8020")
{
  hdfs::Token token;
  token.identifier = identifier;
  token.password = "password-" + identifier;
  token.kind = kind;
  token.service = service;
  return token;
}


static string encode(int64_t value)
{
  string out;
  hdfs::vint::write(value, &out);
  return out;
}


TEST(TokensTest, VariableLengthInt)
{
  EXPECT_EQ(string("\x00", 1), encode(0));
  EXPECT_EQ("\x7F", encode(127));
  EXPECT_EQ("\x90", encode(-112));
  EXPECT_EQ("\x8F\x80", encode(128));
  EXPECT_EQ("\x8E\x01\x2C", encode(300));
  EXPECT_EQ("\x87\x70", encode(-113));

  const int64_t values[] = {
    0, 1, -1, 127, 128, -112, -113, 255, 256, 65536,
    INT32_MAX, INT32_MIN, INT64_MAX, INT64_MIN};

  foreach (int64_t value, values) {
    const string data = encode(value);

    size_t offset = 0;
    EXPECT_SOME_EQ(value, hdfs::vint::read(data, &offset));
    EXPECT_EQ(data.size(), offset);
  }
}


TEST(TokensTest, TruncatedVariableLengthInt)
{
  const string data = encode(300).substr(0, 2);

  size_t offset = 0;
  EXPECT_ERROR(hdfs::vint::read(data, &offset));

  offset = 0;
  EXPECT_ERROR(hdfs::vint::read("", &offset));
}


TEST(TokensTest, Serialize)
{
  hdfs::Credentials credentials;
  credentials.add("alias", createToken("id"));

  const string expected =
    string("HDTS") +
    string("\x00", 1) +             // Version.
    "\x01" +                        // Number of tokens.
    "\x05" "alias" +
    "\x02" "id" +
    "\x0B" "password-id" +
    "\x15" "HDFS_DELEGATION_TOKEN" +
    "\x0D" "10.0.0.1:8020" +
    string("\x00", 1);              // Number of secret keys.

  EXPECT_EQ(expected, hdfs::serialize(credentials));
}


TEST(TokensTest, Parse)
{
  hdfs::Credentials credentials;
  credentials.add("first", createToken("1"));
  credentials.add("second", createToken("2", "kms-dt", "kms://http@kms"));
  credentials.add("secret", string("\x00\x01\x02", 3));

  Try<hdfs::Credentials> parsed = hdfs::parse(hdfs::serialize(credentials));
  ASSERT_SOME(parsed);

  ASSERT_EQ(2u, parsed->tokens().size());
  EXPECT_EQ(createToken("1"), parsed->tokens().at("first"));
  EXPECT_EQ(
      createToken("2", "kms-dt", "kms://http@kms"),
      parsed->tokens().at("second"));

  ASSERT_EQ(1u, parsed->secrets().size());
  EXPECT_EQ(string("\x00\x01\x02", 3), parsed->secrets().at("secret"));
}


TEST(TokensTest, ParseEmpty)
{
  Try<hdfs::Credentials> parsed =
    hdfs::parse(hdfs::serialize(hdfs::Credentials()));

  ASSERT_SOME(parsed);
  EXPECT_TRUE(parsed->tokens().empty());
  EXPECT_TRUE(parsed->secrets().empty());
}


TEST(TokensTest, ParseInvalid)
{
  const string data = hdfs::serialize(hdfs::Credentials());

  EXPECT_ERROR(hdfs::parse(""));
  EXPECT_ERROR(hdfs::parse("HDTS"));
  EXPECT_ERROR(hdfs::parse("XXXX" + data.substr(4)));

  // Unsupported version.
  string version = data;
  version[4] = 1;
  EXPECT_ERROR(hdfs::parse(version));

  // Trailing bytes.
  EXPECT_ERROR(hdfs::parse(data + "x"));

  // More tokens announced than present.
  string truncated = data;
  truncated[5] = 3;
  EXPECT_ERROR(hdfs::parse(truncated));
}


TEST(TokensTest, Merge)
{
  hdfs::Credentials credentials;
  credentials.add("a", createToken("1"));
  credentials.add("b", createToken("2"));

  hdfs::Credentials other;
  other.add("b", createToken("3"));
  other.add("c", createToken("4"));

  credentials.merge(other);

  ASSERT_EQ(3u, credentials.tokens().size());
  EXPECT_EQ(createToken("1"), credentials.tokens().at("a"));
  EXPECT_EQ(createToken("3"), credentials.tokens().at("b"));
  EXPECT_EQ(createToken("4"), credentials.tokens().at("c"));
}


class TokensFileTest : public TemporaryDirectoryTest {};


TEST_F(TokensFileTest, ReadWrite)
{
  const string file = path::join(sandbox.get(), "tokens");

  hdfs::Credentials credentials;
  credentials.add("alias", createToken("id"));

  ASSERT_SOME(hdfs::write(file, credentials));

  Try<hdfs::Credentials> read = hdfs::read(file);
  ASSERT_SOME(read);
  EXPECT_EQ(credentials.tokens(), read->tokens());

  EXPECT_ERROR(hdfs::read(path::join(sandbox.get(), "NotExists")));

  ASSERT_SOME(os::write(file, "garbage"));
  EXPECT_ERROR(hdfs::read(file));
}

} // namespace tests {
} // namespace internal {
} // namespace dataflow {
