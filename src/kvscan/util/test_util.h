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
#ifndef KVSCAN_UTIL_TEST_UTIL_H
#define KVSCAN_UTIL_TEST_UTIL_H

#include <gtest/gtest.h>

#include "kvscan/gutil/macros.h"

namespace kvscan {

// Base fixture for kvscan tests. Resets verbose logging so that tests which
// bump it do not leak it into the next test.
class KvScanTest : public ::testing::Test {
 public:
  KvScanTest();
  ~KvScanTest() override;

 protected:
  void SetUp() override;

 private:
  int saved_v_;

  DISALLOW_COPY_AND_ASSIGN(KvScanTest);
};

// Seeds rand() for randomized tests, from --test_random_seed when it is
// non-zero, otherwise from the clock, and returns the seed. The seed is
// logged so a failing run can be reproduced.
int SeedRandom();

} // namespace kvscan

#endif // KVSCAN_UTIL_TEST_UTIL_H
