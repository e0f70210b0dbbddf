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

#include "kvscan/client/scan_spec.h"

#include <gtest/gtest.h>

#include "kvscan/client/client.pb.h"
#include "kvscan/client/scan_configuration.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

namespace kvscan {
namespace client {

class ScanSpecTest : public KvScanTest {
};

TEST_F(ScanSpecTest, TestNormalizeFillsOpenBounds) {
  ScanSpec spec;
  ASSERT_FALSE(spec.normalized());
  spec.set_start_row("b", false);
  spec.Normalize();
  ASSERT_TRUE(spec.normalized());
  ASSERT_EQ("b", spec.start_row());
  ASSERT_FALSE(spec.include_start_row());
  ASSERT_EQ("", spec.stop_row());
  ASSERT_FALSE(spec.include_stop_row());

  // Idempotent.
  spec.Normalize();
  ASSERT_EQ("b", spec.start_row());
  ASSERT_FALSE(spec.include_start_row());
}

TEST_F(ScanSpecTest, TestValidate) {
  {
    ScanSpec spec;
    ASSERT_OK(spec.Validate());
  }
  {
    ScanSpec spec;
    spec.set_caching(0);
    Status s = spec.Validate();
    ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
    ASSERT_STR_CONTAINS(s.ToString(), "caching must be positive");
  }
  {
    ScanSpec spec;
    spec.set_limit(-1);
    ASSERT_TRUE(spec.Validate().IsInvalidArgument());
  }
  {
    ScanSpec spec;
    spec.set_max_batch_rows(-2);
    ASSERT_TRUE(spec.Validate().IsInvalidArgument());
  }
  {
    ScanSpec spec;
    spec.set_start_row("z").set_stop_row("a");
    Status s = spec.Validate();
    ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
    ASSERT_STR_CONTAINS(s.ToString(), "start row must not sort after stop row");
  }
  {
    // An empty stop row is an open end, not a bound below "z".
    ScanSpec spec;
    spec.set_start_row("z").set_stop_row("");
    ASSERT_OK(spec.Validate());
  }
}

TEST_F(ScanSpecTest, TestRegionMetricsImplyMetrics) {
  ScanSpec spec;
  spec.set_region_metrics_enabled(true);
  ASSERT_TRUE(spec.metrics_enabled());
  spec.set_metrics_enabled(false);
  ASSERT_FALSE(spec.region_metrics_enabled());
}

TEST_F(ScanSpecTest, TestToPB) {
  ScanSpec spec;
  spec.set_stop_row("q", true)
      .set_caching(7)
      .set_max_result_size(4096)
      .set_allow_partial_results(true)
      .set_consistency(ScanSpec::Consistency::TIMELINE)
      .AddAttribute("tenant", "t1");
  spec.Normalize();

  ScanPB pb;
  spec.ToPB("c", false, &pb);
  ASSERT_EQ("c", pb.start_row());
  ASSERT_FALSE(pb.include_start_row());
  ASSERT_EQ("q", pb.stop_row());
  ASSERT_TRUE(pb.include_stop_row());
  ASSERT_EQ(7U, pb.caching());
  ASSERT_EQ(4096U, pb.max_result_size());
  ASSERT_TRUE(pb.allow_partial_results());
  ASSERT_EQ(TIMELINE, pb.consistency());
  ASSERT_EQ(1, pb.attribute_size());
  ASSERT_EQ("tenant", pb.attribute(0).name());
  ASSERT_EQ("t1", pb.attribute(0).value());
}

TEST_F(ScanSpecTest, TestToString) {
  ScanSpec spec;
  spec.set_start_row("a").set_caching(2).set_limit(10);
  ASSERT_EQ("ScanSpec([a, <unset>), caching=2, limit=10, consistency=STRONG)",
            spec.ToString());
}

TEST_F(ScanSpecTest, TestConfigurationValidation) {
  ScanConfiguration config;
  ASSERT_OK(config.SetPause(MonoDelta::FromMilliseconds(50)));
  ASSERT_TRUE(config.SetMaxAttempts(0).IsInvalidArgument());
  ASSERT_TRUE(config.SetScanTimeout(MonoDelta::FromMilliseconds(0)).IsInvalidArgument());
  ASSERT_TRUE(config.SetRpcTimeout(MonoDelta()).IsInvalidArgument());
  ASSERT_OK(config.SetPrimaryCallTimeout(MonoDelta::FromMilliseconds(0)));
  ASSERT_TRUE(config.SetStartLogErrorsCount(-1).IsInvalidArgument());

  // The overloaded pause never drops below the regular pause.
  Status s = config.SetPauseServerOverloaded(MonoDelta::FromMilliseconds(10));
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_OK(config.SetPause(MonoDelta::FromSeconds(5)));
  ASSERT_EQ(MonoDelta::FromSeconds(5), config.pause_server_overloaded());
  ASSERT_OK(config.SetMaxAttempts(3));
  ASSERT_EQ(3, config.max_attempts());
}

} // namespace client
} // namespace kvscan
