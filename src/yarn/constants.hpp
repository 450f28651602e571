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

#ifndef __YARN_CONSTANTS_HPP__
#define __YARN_CONSTANTS_HPP__

namespace dataflow {
namespace internal {
namespace yarn {

// Fraction of the container memory given to the heap of the process
// running in the container. The rest is left for off-heap memory,
// thread stacks, code cache, etc.
constexpr double DEFAULT_HEAP_CUTOFF_RATIO = 0.8;

// Upper bound (in MB) on the memory held back from the heap.
constexpr int DEFAULT_HEAP_LIMIT_CAP = 500;

constexpr int DEFAULT_CONTAINER_MEMORY = 1024;

// Directory (relative to the staging root) under which the files of
// every application are staged.
constexpr char STAGING_DIRECTORY[] = ".dataflow";

constexpr char CLASSPATH[] = "CLASSPATH";

// The resource manager's default application classpath.
constexpr char DEFAULT_APPLICATION_CLASSPATH[] =
  "$HADOOP_CONF_DIR,"
  "$HADOOP_COMMON_HOME/share/hadoop/common/*,"
  "$HADOOP_COMMON_HOME/share/hadoop/common/lib/*,"
  "$HADOOP_HDFS_HOME/share/hadoop/hdfs/*,"
  "$HADOOP_HDFS_HOME/share/hadoop/hdfs/lib/*,"
  "$HADOOP_YARN_HOME/share/hadoop/yarn/*,"
  "$HADOOP_YARN_HOME/share/hadoop/yarn/lib/*";

// Separator between the entries of a path list environment variable
// and the container's working directory as seen by the launch script.
#ifdef __WINDOWS__
constexpr char PATH_LIST_SEPARATOR[] = ";";
constexpr char WORKING_DIRECTORY_WILDCARD[] = "%PWD%\\*";
#else
constexpr char PATH_LIST_SEPARATOR[] = ":";
constexpr char WORKING_DIRECTORY_WILDCARD[] = "$PWD/*";
#endif // __WINDOWS__

// Points to the token storage file of the current user.
constexpr char TOKEN_FILE_LOCATION[] = "HADOOP_TOKEN_FILE_LOCATION";

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {

#endif // __YARN_CONSTANTS_HPP__
