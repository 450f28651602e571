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

#ifndef __DATAFLOW_HPP__
#define __DATAFLOW_HPP__

#include <ostream>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <dataflow/dataflow.pb.h>

namespace dataflow {

bool operator==(const JobID& left, const JobID& right);
bool operator==(const URL& left, const URL& right);
bool operator==(const Environment& left, const Environment& right);
bool operator==(const LocalResource& left, const LocalResource& right);


inline bool operator!=(const JobID& left, const JobID& right)
{
  return !(left == right);
}


std::ostream& operator<<(std::ostream& stream, const JobID& jobId);
std::ostream& operator<<(std::ostream& stream, const JobStatus::State& state);
std::ostream& operator<<(std::ostream& stream, const URL& url);
std::ostream& operator<<(std::ostream& stream, const LocalResource& resource);

} // namespace dataflow {

#endif // __DATAFLOW_HPP__
