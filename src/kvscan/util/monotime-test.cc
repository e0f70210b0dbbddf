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

#include <gtest/gtest.h>

#include "kvscan/util/monotime.h"

namespace kvscan {

TEST(TestMonoTime, TestMonotonicity) {
  MonoTime prev = MonoTime::Now();
  for (int i = 0; i < 1000; i++) {
    MonoTime now = MonoTime::Now();
    ASSERT_GE(now, prev);
    prev = now;
  }
}

TEST(TestMonoTime, TestTimeVal) {
  MonoDelta d = MonoDelta::FromMilliseconds(1500);
  ASSERT_EQ(1500, d.ToMilliseconds());
  ASSERT_EQ(1500000, d.ToMicroseconds());
  ASSERT_EQ(1500000000, d.ToNanoseconds());
  ASSERT_DOUBLE_EQ(1.5, d.ToSeconds());
  ASSERT_EQ("1.500s", d.ToString());
}

TEST(TestMonoTime, TestDeltas) {
  MonoDelta a = MonoDelta::FromMilliseconds(10);
  MonoDelta b = MonoDelta::FromMilliseconds(20);
  ASSERT_LT(a, b);
  ASSERT_GT(b, a);
  ASSERT_EQ(MonoDelta::FromMilliseconds(30), a + b);
  ASSERT_EQ(MonoDelta::FromMilliseconds(10), b - a);
  ASSERT_FALSE(MonoDelta().Initialized());
  ASSERT_TRUE(MonoDelta::FromNanoseconds(0).Initialized());
}

TEST(TestMonoTime, TestTimeArithmetic) {
  MonoTime start = MonoTime::Now();
  MonoTime later = start + MonoDelta::FromSeconds(2);
  ASSERT_GT(later, start);
  ASSERT_EQ(2000, (later - start).ToMilliseconds());
  ASSERT_EQ(start, later - MonoDelta::FromSeconds(2));
  ASSERT_FALSE(MonoTime().Initialized());
  ASSERT_TRUE(start.Initialized());
}

TEST(TestMonoTime, TestSleepFor) {
  MonoTime start = MonoTime::Now();
  SleepFor(MonoDelta::FromMilliseconds(50));
  ASSERT_GE((MonoTime::Now() - start).ToMilliseconds(), 50);
}

} // namespace kvscan
