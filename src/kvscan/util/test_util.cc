// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "kvscan/util/test_util.h"

#include <cstdlib>
#include <ctime>

#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_int32(test_random_seed, 0, "Random seed to use for randomized tests");

namespace kvscan {

KvScanTest::KvScanTest()
    : saved_v_(FLAGS_v) {
}

KvScanTest::~KvScanTest() {
  FLAGS_v = saved_v_;
}

void KvScanTest::SetUp() {
  ::testing::Test::SetUp();
}

int SeedRandom() {
  int seed = FLAGS_test_random_seed;
  if (seed == 0) {
    seed = static_cast<int>(time(nullptr));
  }
  LOG(INFO) << "Using random seed: " << seed;
  srand(seed);
  return seed;
}

} // namespace kvscan
