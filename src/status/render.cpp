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

#include <sstream>
#include <string>
#include <vector>

#include <stout/foreach.hpp>

#include "status/render.hpp"

using std::ostringstream;
using std::string;
using std::vector;

namespace dataflow {
namespace internal {
namespace status {

string escape(const string& value)
{
  string result;
  result.reserve(value.size());

  foreach (char c, value) {
    switch (c) {
      case '\\':
      case '"':
      case '/':
        result += '\\';
        result += c;
        break;
      case '\b': result += "\\b"; break;
      case '\t': result += "\\t"; break;
      case '\n': result += "<br>"; break;
      case '\f': result += "\\f"; break;
      case '\r': result += "\\r"; break;
      default:
        // Other control characters are unreadable, drop them.
        if (static_cast<unsigned char>(c) >= 0x20) {
          result += c;
        }
        break;
    }
  }

  return result;
}


string jsonify(const vector<JobStatus>& jobs)
{
  ostringstream out;

  out << "[";

  for (size_t i = 0; i < jobs.size(); i++) {
    const JobStatus& job = jobs[i];

    if (i > 0) {
      out << ", ";
    }

    out << "{\"jobid\": \"" << escape(job.job_id().value()) << "\", ";

    if (job.has_name()) {
      out << "\"jobname\": \"" << escape(job.name()) << "\", ";
    }

    out << "\"status\": \"" << JobStatus::State_Name(job.state()) << "\", "
        << "\"time\": " << job.timestamp() << "}";
  }

  out << "]";

  return out.str();
}


process::http::Response render(const StatusQueryOutcome& outcome)
{
  if (!outcome.isSuccess()) {
    return process::http::BadRequest(outcome.message());
  }

  process::http::OK response(jsonify(outcome.jobs()));
  response.headers["Content-Type"] = "application/json";

  return response;
}

} // namespace status {
} // namespace internal {
} // namespace dataflow {
