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
#include <string>
#include <vector>

#include <stout/unreachable.hpp>

#include "status/outcome.hpp"

using std::ostream;
using std::string;
using std::vector;

namespace dataflow {
namespace internal {
namespace status {

StatusQueryOutcome StatusQueryOutcome::success(const vector<JobStatus>& jobs)
{
  return StatusQueryOutcome(SUCCESS, jobs, "");
}


StatusQueryOutcome StatusQueryOutcome::timeout(const string& message)
{
  return StatusQueryOutcome(TIMEOUT, vector<JobStatus>(), message);
}


StatusQueryOutcome StatusQueryOutcome::malformed(const string& message)
{
  return StatusQueryOutcome(MALFORMED_RESPONSE, vector<JobStatus>(), message);
}


StatusQueryOutcome StatusQueryOutcome::unreachable(const string& message)
{
  return StatusQueryOutcome(UNREACHABLE, vector<JobStatus>(), message);
}


ostream& operator<<(ostream& stream, const StatusQueryOutcome::Kind& kind)
{
  switch (kind) {
    case StatusQueryOutcome::SUCCESS:
      return stream << "SUCCESS";
    case StatusQueryOutcome::TIMEOUT:
      return stream << "TIMEOUT";
    case StatusQueryOutcome::MALFORMED_RESPONSE:
      return stream << "MALFORMED_RESPONSE";
    case StatusQueryOutcome::UNREACHABLE:
      return stream << "UNREACHABLE";
  }

  UNREACHABLE();
}

} // namespace status {
} // namespace internal {
} // namespace dataflow {
