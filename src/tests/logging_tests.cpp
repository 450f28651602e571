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

#include <map>
#include <string>

#include <gtest/gtest.h>

#include <stout/flags.hpp>
#include <stout/gtest.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "logging/flags.hpp"
#include "logging/logging.hpp"

using std::map;
using std::string;

namespace dataflow {
namespace internal {
namespace tests {

TEST(LoggingTest, Severity)
{
  EXPECT_EQ(google::INFO, logging::getLogSeverity("INFO"));
  EXPECT_EQ(google::WARNING, logging::getLogSeverity("WARNING"));
  EXPECT_EQ(google::ERROR, logging::getLogSeverity("ERROR"));

  // Anything else logs everything.
  EXPECT_EQ(google::INFO, logging::getLogSeverity("VERBOSE"));
}


TEST(LoggingTest, Flags)
{
  logging::Flags flags;

  EXPECT_FALSE(flags.quiet);
  EXPECT_EQ("INFO", flags.logging_level);
  EXPECT_NONE(flags.log_dir);
  EXPECT_EQ(0, flags.logbufsecs);

  map<string, Option<string>> values;
  values["logging_level"] = Option<string>::some("WARNING");
  values["log_dir"] = Option<string>::some("/tmp/dataflow");
  values["logbufsecs"] = Option<string>::some("5");

  Try<flags::Warnings> load = flags.load(values);
  ASSERT_SOME(load);

  EXPECT_EQ("WARNING", flags.logging_level);
  EXPECT_SOME_EQ("/tmp/dataflow", flags.log_dir);
  EXPECT_EQ(5, flags.logbufsecs);
}

} // namespace tests {
} // namespace internal {
} // namespace dataflow {
