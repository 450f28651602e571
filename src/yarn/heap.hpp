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

#ifndef __YARN_HEAP_HPP__
#define __YARN_HEAP_HPP__

#include "yarn/constants.hpp"

namespace dataflow {
namespace internal {
namespace yarn {

// Calculates the heap size (in MB) for the process started in a
// container with 'memory' MB. Processes allocate more than just the
// heap and the resource manager is very fast at killing containers
// that use memory beyond their limit, so only 'cutoffRatio' of the
// memory is used for the heap. If that holds back more than 'cap' MB
// we hold back exactly 'cap' MB instead.
//
// The result never exceeds 'memory', which must be positive.
int computeHeapLimit(
    int memory,
    double cutoffRatio = DEFAULT_HEAP_CUTOFF_RATIO,
    int cap = DEFAULT_HEAP_LIMIT_CAP);

} // namespace yarn {
} // namespace internal {
} // namespace dataflow {

#endif // __YARN_HEAP_HPP__
