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

#ifndef __YARN_ENVIRONMENT_HPP__
#define __YARN_ENVIRONMENT_HPP__

#include <string>
#include <utility>
#include <vector>

#include <dataflow/dataflow.hpp>

#include <stout/option.hpp>

namespace dataflow {
namespace internal {
namespace yarn {

// Returns the value of the variable 'name', if set.
Option<std::string> lookup(
    const Environment& environment,
    const std::string& name);


// Returns a copy of 'environment' where 'value' is appended to the
// variable 'name' using the path list separator, or where 'name' is
// set to 'value' if it was not set. Appending a value that is already
// present appends it again.
Environment appendVariable(
    const Environment& environment,
    const std::string& name,
    const std::string& value);


// Composes an environment out of a base environment and a sequence
// of appends. The appends are applied in the order they were added,
// which makes the resulting path lists reproducible. The base is
// never modified, so one base can be shared by many containers.
class EnvironmentComposer
{
public:
  explicit EnvironmentComposer(const Environment& _base = Environment())
    : base(_base) {}

  EnvironmentComposer& append(
      const std::string& name,
      const std::string& value);

  Environment compose() const;

private:
  const Environment base;
  std::vector<std::pair<std::string, std::string>> appends;
};


// Returns 'base' with the container classpath appended to CLASSPATH:
// the jars in the container's working directory first, then each of
// 'entries' (trimmed) in order. Blank entries are skipped.
Environment classpath(
    const Environment& base,
    const std::vector<std::string>& entries);

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {

#endif // __YARN_ENVIRONMENT_HPP__
