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

#include "kvscan/client/scan_metrics.h"

#include <cstdint>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

using std::map;
using std::string;
using std::thread;
using std::vector;

namespace kvscan {
namespace client {

class ScanMetricsTest : public KvScanTest {
};

TEST_F(ScanMetricsTest, TestScanWideCounters) {
  ScanMetrics metrics(false);
  metrics.MoveToNextRegion();
  metrics.InitRegionInfo("r1", "rs-0-0:16020");
  metrics.IncrementRpcCall(false);
  metrics.IncrementRpcCall(true);
  metrics.IncrementRpcRetry(true);
  metrics.IncrementNotServingRegion();
  metrics.AddRowsScanned(4, 100);

  map<string, int64_t> m = metrics.Get();
  ASSERT_EQ(2, m[ScanMetrics::kRpcCalls]);
  ASSERT_EQ(1, m[ScanMetrics::kRemoteRpcCalls]);
  ASSERT_EQ(1, m[ScanMetrics::kRpcRetries]);
  ASSERT_EQ(1, m[ScanMetrics::kRemoteRpcRetries]);
  ASSERT_EQ(1, m[ScanMetrics::kRegionsScanned]);
  ASSERT_EQ(1, m[ScanMetrics::kNotServingRegionExceptions]);
  ASSERT_EQ(4, m[ScanMetrics::kRowsScanned]);
  ASSERT_EQ(100, m[ScanMetrics::kBytesScanned]);

  // Region metrics are off: no per-region state is kept.
  ASSERT_TRUE(metrics.GetRegionMetrics().empty());
  ASSERT_STR_CONTAINS(metrics.ToString(), "ROWS_SCANNED=4");
}

TEST_F(ScanMetricsTest, TestPerRegionCounters) {
  ScanMetrics metrics(true);
  metrics.MoveToNextRegion();
  metrics.InitRegionInfo("r1", "rs-0-0:16020");
  metrics.IncrementRpcCall(false);
  metrics.AddRowsScanned(2, 20);

  metrics.MoveToNextRegion();
  // Counted scan-wide only: no region is attached until InitRegionInfo().
  metrics.IncrementRpcCall(false);
  metrics.InitRegionInfo("r2", "rs-1-0:16020");
  metrics.IncrementRpcCall(false);
  metrics.IncrementRpcRetry(false);
  metrics.AddRowsScanned(3, 30);

  ASSERT_EQ(2, metrics.regions_scanned());
  ASSERT_EQ(3, metrics.rpc_calls());

  map<string, ScanMetrics::RegionMetrics> regions = metrics.GetRegionMetrics();
  ASSERT_EQ(2U, regions.size());
  const ScanMetrics::RegionMetrics& r1 = regions["r1"];
  ASSERT_EQ("rs-0-0:16020", r1.server_name);
  ASSERT_EQ(1, r1.rpc_calls);
  ASSERT_EQ(0, r1.rpc_retries);
  ASSERT_EQ(2, r1.rows_scanned);
  const ScanMetrics::RegionMetrics& r2 = regions["r2"];
  ASSERT_EQ(1, r2.rpc_calls);
  ASSERT_EQ(1, r2.rpc_retries);
  ASSERT_EQ(30, r2.Get()[ScanMetrics::kBytesScanned]);
}

TEST_F(ScanMetricsTest, TestReturningToRegionAccumulates) {
  ScanMetrics metrics(true);
  metrics.MoveToNextRegion();
  metrics.InitRegionInfo("r1", "rs-0-0:16020");
  metrics.AddRowsScanned(1, 10);
  metrics.MoveToNextRegion();
  metrics.InitRegionInfo("r1", "rs-0-1:16020");
  metrics.AddRowsScanned(1, 10);

  map<string, ScanMetrics::RegionMetrics> regions = metrics.GetRegionMetrics();
  ASSERT_EQ(1U, regions.size());
  ASSERT_EQ(2, regions["r1"].rows_scanned);
  ASSERT_EQ("rs-0-1:16020", regions["r1"].server_name);
}

TEST_F(ScanMetricsTest, TestPendingCallsBookedOnAttach) {
  ScanMetrics metrics(true);
  metrics.MoveToNextRegion();
  metrics.InitRegionInfo("r1", "rs-0-0:16020");
  metrics.AddRowsScanned(1, 10);

  // Two open calls race for the next region while "r1" is still attached.
  metrics.MoveToNextRegion();
  ScanMetrics::RegionMetrics winner;
  ScanMetrics::RegionMetrics loser;
  metrics.IncrementRpcCall(true, &winner);
  metrics.IncrementRpcCall(true, &loser);
  metrics.IncrementRpcRetry(true, &loser);
  metrics.IncrementNotServingRegion(&winner);
  metrics.IncrementRpcCall(false, &winner);
  metrics.IncrementRpcRetry(false, &winner);
  metrics.InitRegionInfo("r2", "rs-1-0:16020", winner);
  metrics.AddRowsScanned(3, 30);
  // A late call of the loser leaves the region counters alone.
  metrics.IncrementRpcCall(true, &loser);

  ASSERT_EQ(4, metrics.rpc_calls());
  ASSERT_EQ(2, metrics.rpc_retries());
  ASSERT_EQ(1, metrics.not_serving_region_exceptions());

  map<string, ScanMetrics::RegionMetrics> regions = metrics.GetRegionMetrics();
  ASSERT_EQ(2U, regions.size());
  const ScanMetrics::RegionMetrics& r1 = regions["r1"];
  ASSERT_EQ(0, r1.rpc_calls);
  ASSERT_EQ(1, r1.rows_scanned);
  const ScanMetrics::RegionMetrics& r2 = regions["r2"];
  ASSERT_EQ("rs-1-0:16020", r2.server_name);
  ASSERT_EQ(2, r2.rpc_calls);
  ASSERT_EQ(1, r2.remote_rpc_calls);
  ASSERT_EQ(1, r2.rpc_retries);
  ASSERT_EQ(0, r2.remote_rpc_retries);
  ASSERT_EQ(1, r2.not_serving_region_exceptions);
  ASSERT_EQ(3, r2.rows_scanned);
}

TEST_F(ScanMetricsTest, TestConcurrentIncrements) {
  const int kThreads = 4;
  const int kIncrements = 1000;
  ScanMetrics metrics(true);
  metrics.MoveToNextRegion();
  metrics.InitRegionInfo("r1", "rs-0-0:16020");
  vector<thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&]() {
      for (int j = 0; j < kIncrements; j++) {
        metrics.IncrementRpcCall(j % 2 == 0);
        metrics.AddRowsScanned(1, 1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  ASSERT_EQ(kThreads * kIncrements, metrics.rpc_calls());
  ASSERT_EQ(kThreads * kIncrements / 2, metrics.remote_rpc_calls());
  ASSERT_EQ(kThreads * kIncrements, metrics.GetRegionMetrics()["r1"].rows_scanned);
}

} // namespace client
} // namespace kvscan
