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

#ifndef __HDFS_TOKENS_HPP__
#define __HDFS_TOKENS_HPP__

#include <stdint.h>

#include <map>
#include <string>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace dataflow {
namespace internal {
namespace hdfs {

// A security token understood by the storage layer's client.
struct Token
{
  std::string identifier;
  std::string password;
  std::string kind;
  std::string service;
};


bool operator==(const Token& left, const Token& right);


// The tokens and secret keys held by an identity, keyed by alias.
// Adding an entry with an alias that is already present replaces
// the earlier entry.
class Credentials
{
public:
  void add(const std::string& alias, const Token& token);
  void add(const std::string& alias, const std::string& secret);

  // Adds every token and secret of 'that'; entries of 'that' win on
  // alias collisions.
  void merge(const Credentials& that);

  const std::map<std::string, Token>& tokens() const { return tokens_; }
  const std::map<std::string, std::string>& secrets() const { return secrets_; }

private:
  std::map<std::string, Token> tokens_;
  std::map<std::string, std::string> secrets_;
};


// Serializes the credentials using the writable token storage format:
//
//   "HDTS" | version (0) | vint #tokens | (alias token)* |
//   vint #secrets | (alias vint-length bytes)*
//
// where an alias is a Text (vint length followed by the bytes) and a
// token is the identifier and password (each vint length followed by
// the bytes) followed by the kind and service as Text.
std::string serialize(const Credentials& credentials);

Try<Credentials> parse(const std::string& data);

Try<Credentials> read(const std::string& path);

Try<Nothing> write(const std::string& path, const Credentials& credentials);


namespace vint {

// The variable length integer encoding of Hadoop's 'WritableUtils'.
// Values in [-112, 127] take a single byte; otherwise the first byte
// encodes the sign and the number of bytes that follow (big endian).
void write(int64_t value, std::string* out);

Try<int64_t> read(const std::string& data, size_t* offset);

} // namespace vint {

} // namespace hdfs {
} // namespace internal {
} // namespace dataflow {

#endif // __HDFS_TOKENS_HPP__
