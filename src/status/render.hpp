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

#ifndef __STATUS_RENDER_HPP__
#define __STATUS_RENDER_HPP__

#include <string>
#include <vector>

#include <dataflow/dataflow.hpp>

#include <process/http.hpp>

#include "status/outcome.hpp"

namespace dataflow {
namespace internal {
namespace status {

// Escapes a free text value for inclusion in a JSON string. Newlines
// become '<br>' so the value displays as is in a web page; other
// control characters without a short escape are dropped.
std::string escape(const std::string& value);


// Renders the jobs as a JSON array, e.g.:
//
//   [{"jobid": "a1", "jobname": "wordcount", "status": "RUNNING",
//     "time": 1400000000000}]
//
// 'jobname' is only present for jobs that were given a name.
std::string jsonify(const std::vector<JobStatus>& jobs);


// A successful outcome renders as '200 OK' with the JSON array of
// jobs, anything else as '400 Bad Request' with the outcome's
// message as plain text.
process::http::Response render(const StatusQueryOutcome& outcome);

} // namespace status {
} // namespace internal {
} // namespace dataflow {

#endif // __STATUS_RENDER_HPP__
