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

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/stringify.hpp>

#include <stout/os/read.hpp>
#include <stout/os/write.hpp>

#include "hdfs/tokens.hpp"

using std::map;
using std::string;

namespace dataflow {
namespace internal {
namespace hdfs {

static const char TOKEN_STORAGE_MAGIC[] = "HDTS";
static const char TOKEN_STORAGE_VERSION = 0;


bool operator==(const Token& left, const Token& right)
{
  return left.identifier == right.identifier &&
    left.password == right.password &&
    left.kind == right.kind &&
    left.service == right.service;
}


void Credentials::add(const string& alias, const Token& token)
{
  tokens_[alias] = token;
}


void Credentials::add(const string& alias, const string& secret)
{
  secrets_[alias] = secret;
}


void Credentials::merge(const Credentials& that)
{
  foreachpair (const string& alias, const Token& token, that.tokens_) {
    tokens_[alias] = token;
  }

  foreachpair (const string& alias, const string& secret, that.secrets_) {
    secrets_[alias] = secret;
  }
}


namespace vint {

void write(int64_t value, string* out)
{
  if (value >= -112 && value <= 127) {
    out->push_back(static_cast<char>(value));
    return;
  }

  int length = -112;
  if (value < 0) {
    value = ~value;
    length = -120;
  }

  for (int64_t tmp = value; tmp != 0; tmp >>= 8) {
    length--;
  }

  out->push_back(static_cast<char>(length));

  length = (length < -120) ? -(length + 120) : -(length + 112);

  for (int index = length; index != 0; index--) {
    const int shift = (index - 1) * 8;
    out->push_back(
        static_cast<char>((static_cast<uint64_t>(value) >> shift) & 0xFF));
  }
}


Try<int64_t> read(const string& data, size_t* offset)
{
  if (*offset >= data.size()) {
    return Error("Unexpected end of data while reading a variable length int");
  }

  const int8_t first = static_cast<int8_t>(data[(*offset)++]);

  if (first >= -112) {
    return static_cast<int64_t>(first);
  }

  const bool negative = first < -120;
  const size_t length = negative ? -(first + 120) : -(first + 112);

  if (data.size() - *offset < length) {
    return Error("Unexpected end of data while reading a variable length int");
  }

  uint64_t value = 0;
  for (size_t i = 0; i < length; i++) {
    value = (value << 8) | static_cast<uint8_t>(data[(*offset)++]);
  }

  return negative ? ~static_cast<int64_t>(value) : static_cast<int64_t>(value);
}

} // namespace vint {


static void writeBytes(const string& bytes, string* out)
{
  vint::write(static_cast<int64_t>(bytes.size()), out);
  out->append(bytes);
}


static Try<string> readBytes(const string& data, size_t* offset)
{
  Try<int64_t> length = vint::read(data, offset);
  if (length.isError()) {
    return Error(length.error());
  }

  if (length.get() < 0 ||
      static_cast<uint64_t>(length.get()) > data.size() - *offset) {
    return Error("Invalid length " + stringify(length.get()));
  }

  string bytes = data.substr(*offset, length.get());
  *offset += length.get();
  return bytes;
}


static Try<size_t> readCount(const string& data, size_t* offset)
{
  Try<int64_t> count = vint::read(data, offset);
  if (count.isError()) {
    return Error(count.error());
  }

  // Every entry takes at least one byte.
  if (count.get() < 0 ||
      static_cast<uint64_t>(count.get()) > data.size() - *offset) {
    return Error("Invalid number of entries " + stringify(count.get()));
  }

  return static_cast<size_t>(count.get());
}


static Try<Token> readToken(const string& data, size_t* offset)
{
  Token token;

  // NOTE: The order of the fields is the order they are written in.
  string* fields[] = {
    &token.identifier,
    &token.password,
    &token.kind,
    &token.service
  };

  foreach (string* field, fields) {
    Try<string> bytes = readBytes(data, offset);
    if (bytes.isError()) {
      return Error(bytes.error());
    }

    *field = bytes.get();
  }

  return token;
}


string serialize(const Credentials& credentials)
{
  string out(TOKEN_STORAGE_MAGIC);
  out.push_back(TOKEN_STORAGE_VERSION);

  vint::write(static_cast<int64_t>(credentials.tokens().size()), &out);
  foreachpair (const string& alias, const Token& token, credentials.tokens()) {
    writeBytes(alias, &out);
    writeBytes(token.identifier, &out);
    writeBytes(token.password, &out);
    writeBytes(token.kind, &out);
    writeBytes(token.service, &out);
  }

  vint::write(static_cast<int64_t>(credentials.secrets().size()), &out);
  foreachpair (const string& alias,
               const string& secret,
               credentials.secrets()) {
    writeBytes(alias, &out);
    writeBytes(secret, &out);
  }

  return out;
}


Try<Credentials> parse(const string& data)
{
  const string magic(TOKEN_STORAGE_MAGIC);

  if (data.compare(0, magic.size(), magic) != 0) {
    return Error("Bad header found in token storage");
  }

  size_t offset = magic.size();

  if (offset >= data.size()) {
    return Error("Missing token storage version");
  }

  const char version = data[offset++];
  if (version != TOKEN_STORAGE_VERSION) {
    return Error(
        "Unsupported token storage version " +
        stringify(static_cast<int>(version)));
  }

  Credentials credentials;

  Try<size_t> tokens = readCount(data, &offset);
  if (tokens.isError()) {
    return Error("Failed to read tokens: " + tokens.error());
  }

  for (size_t i = 0; i < tokens.get(); i++) {
    Try<string> alias = readBytes(data, &offset);
    if (alias.isError()) {
      return Error(
          "Failed to read alias of token " + stringify(i) + ": " +
          alias.error());
    }

    Try<Token> token = readToken(data, &offset);
    if (token.isError()) {
      return Error(
          "Failed to read token '" + alias.get() + "': " + token.error());
    }

    credentials.add(alias.get(), token.get());
  }

  Try<size_t> secrets = readCount(data, &offset);
  if (secrets.isError()) {
    return Error("Failed to read secret keys: " + secrets.error());
  }

  for (size_t i = 0; i < secrets.get(); i++) {
    Try<string> alias = readBytes(data, &offset);
    if (alias.isError()) {
      return Error(
          "Failed to read alias of secret key " + stringify(i) + ": " +
          alias.error());
    }

    Try<string> secret = readBytes(data, &offset);
    if (secret.isError()) {
      return Error(
          "Failed to read secret key '" + alias.get() + "': " +
          secret.error());
    }

    credentials.add(alias.get(), secret.get());
  }

  if (offset != data.size()) {
    return Error(
        "Found " + stringify(data.size() - offset) +
        " trailing bytes in token storage");
  }

  return credentials;
}


Try<Credentials> read(const string& path)
{
  Try<string> data = os::read(path);
  if (data.isError()) {
    return Error(
        "Failed to read token storage '" + path + "': " + data.error());
  }

  Try<Credentials> credentials = parse(data.get());
  if (credentials.isError()) {
    return Error(
        "Failed to parse token storage '" + path + "': " +
        credentials.error());
  }

  return credentials;
}


Try<Nothing> write(const string& path, const Credentials& credentials)
{
  return os::write(path, serialize(credentials));
}

} // namespace hdfs {
} // namespace internal {
} // namespace dataflow {
