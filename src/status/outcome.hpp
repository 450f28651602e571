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

#ifndef __STATUS_OUTCOME_HPP__
#define __STATUS_OUTCOME_HPP__

#include <ostream>
#include <string>
#include <vector>

#include <dataflow/dataflow.hpp>

namespace dataflow {
namespace internal {
namespace status {

// Result of one query for the running jobs. Only a successful
// outcome carries jobs; every other outcome carries a message
// describing what went wrong.
class StatusQueryOutcome
{
public:
  enum Kind
  {
    SUCCESS,
    TIMEOUT,
    MALFORMED_RESPONSE,
    UNREACHABLE
  };

  static StatusQueryOutcome success(const std::vector<JobStatus>& jobs);
  static StatusQueryOutcome timeout(const std::string& message);
  static StatusQueryOutcome malformed(const std::string& message);
  static StatusQueryOutcome unreachable(const std::string& message);

  Kind kind() const { return kind_; }

  bool isSuccess() const { return kind_ == SUCCESS; }

  // Jobs in the order reported by the coordinator.
  const std::vector<JobStatus>& jobs() const { return jobs_; }

  const std::string& message() const { return message_; }

private:
  StatusQueryOutcome(
      Kind kind,
      const std::vector<JobStatus>& jobs,
      const std::string& message)
    : kind_(kind), jobs_(jobs), message_(message) {}

  Kind kind_;
  std::vector<JobStatus> jobs_;
  std::string message_;
};


std::ostream& operator<<(
    std::ostream& stream,
    const StatusQueryOutcome::Kind& kind);

} // namespace status {
} // namespace internal {
} // namespace dataflow {

#endif // __STATUS_OUTCOME_HPP__
