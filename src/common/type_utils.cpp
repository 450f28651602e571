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

#include <ostream>

#include <dataflow/dataflow.hpp>

using std::ostream;

namespace dataflow {

bool operator==(const JobID& left, const JobID& right)
{
  return left.value() == right.value();
}


bool operator==(const URL& left, const URL& right)
{
  return left.scheme() == right.scheme() &&
    left.has_user_info() == right.has_user_info() &&
    left.user_info() == right.user_info() &&
    left.has_host() == right.has_host() &&
    left.host() == right.host() &&
    left.has_port() == right.has_port() &&
    left.port() == right.port() &&
    left.file() == right.file();
}


static bool operator==(
    const Environment::Variable& left,
    const Environment::Variable& right)
{
  return left.name() == right.name() && left.value() == right.value();
}


bool operator==(const Environment& left, const Environment& right)
{
  // Order of variables is not important.
  if (left.variables().size() != right.variables().size()) {
    return false;
  }

  for (int i = 0; i < left.variables().size(); i++) {
    bool found = false;
    for (int j = 0; j < right.variables().size(); j++) {
      if (left.variables().Get(i) == right.variables().Get(j)) {
        found = true;
        break;
      }
    }
    if (!found) {
      return false;
    }
  }

  return true;
}


bool operator==(const LocalResource& left, const LocalResource& right)
{
  return left.url() == right.url() &&
    left.size() == right.size() &&
    left.timestamp() == right.timestamp() &&
    left.type() == right.type() &&
    left.visibility() == right.visibility();
}


ostream& operator<<(ostream& stream, const JobID& jobId)
{
  return stream << jobId.value();
}


ostream& operator<<(ostream& stream, const JobStatus::State& state)
{
  return stream << JobStatus::State_Name(state);
}


ostream& operator<<(ostream& stream, const URL& url)
{
  stream << url.scheme() << ":";

  // The 'authority' part.
  if (url.has_host()) {
    stream << "//";

    if (url.has_user_info()) {
      stream << url.user_info() << "@";
    }

    stream << url.host();

    if (url.has_port()) {
      stream << ":" << url.port();
    }
  }

  return stream << url.file();
}


ostream& operator<<(ostream& stream, const LocalResource& resource)
{
  return stream
    << resource.url()
    << " (" << resource.size() << " bytes, modified at "
    << resource.timestamp() << ")";
}

} // namespace dataflow {
