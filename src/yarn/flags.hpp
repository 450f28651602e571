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

#ifndef __YARN_FLAGS_HPP__
#define __YARN_FLAGS_HPP__

#include <string>

#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace dataflow {
namespace internal {
namespace yarn {

class Flags : public virtual logging::Flags
{
public:
  Flags();

  double heap_cutoff_ratio;
  int heap_limit_cap;
  std::string application_classpath;
  Option<std::string> hadoop;
  Option<std::string> staging_root;
  Option<std::string> token_renewer;
  int container_memory;
  Option<std::string> app_id;
  Option<std::string> artifacts;
};

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {

#endif // __YARN_FLAGS_HPP__
