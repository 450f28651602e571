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
#include <utility>
#include <vector>

#include <stout/foreach.hpp>
#include <stout/strings.hpp>

#include "yarn/constants.hpp"
#include "yarn/environment.hpp"

using std::pair;
using std::string;
using std::vector;

namespace dataflow {
namespace internal {
namespace yarn {

Option<string> lookup(const Environment& environment, const string& name)
{
  foreach (const Environment::Variable& variable, environment.variables()) {
    if (variable.name() == name) {
      return variable.value();
    }
  }

  return None();
}


Environment appendVariable(
    const Environment& environment,
    const string& name,
    const string& value)
{
  Environment result = environment;

  foreach (Environment::Variable& variable, *result.mutable_variables()) {
    if (variable.name() == name) {
      variable.set_value(variable.value() + PATH_LIST_SEPARATOR + value);
      return result;
    }
  }

  Environment::Variable* variable = result.add_variables();
  variable->set_name(name);
  variable->set_value(value);

  return result;
}


EnvironmentComposer& EnvironmentComposer::append(
    const string& name,
    const string& value)
{
  appends.push_back(std::make_pair(name, value));
  return *this;
}


Environment EnvironmentComposer::compose() const
{
  Environment environment = base;

  foreach (const pair<string, string>& append, appends) {
    environment = appendVariable(environment, append.first, append.second);
  }

  return environment;
}


Environment classpath(const Environment& base, const vector<string>& entries)
{
  EnvironmentComposer composer(base);

  composer.append(CLASSPATH, WORKING_DIRECTORY_WILDCARD);

  foreach (const string& entry, entries) {
    const string trimmed = strings::trim(entry);
    if (!trimmed.empty()) {
      composer.append(CLASSPATH, trimmed);
    }
  }

  return composer.compose();
}

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {
