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

#include "kvscan/client/async_table.h"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kvscan/client/row_result.h"
#include "kvscan/client/scan_configuration.h"
#include "kvscan/client/scan_consumer.h"
#include "kvscan/client/scan_driver.h"
#include "kvscan/client/scan_spec.h"
#include "kvscan/client/testing/manual_scheduler.h"
#include "kvscan/client/testing/mini_region_store.h"
#include "kvscan/rpc/timer_thread.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

using std::shared_ptr;
using std::string;
using std::vector;

namespace kvscan {
namespace client {

namespace {

// Stops the scan after 'max_batches' batches.
class StoppingConsumer : public ScanConsumer {
 public:
  explicit StoppingConsumer(int max_batches)
      : max_batches_(max_batches),
        num_batches_(0),
        num_rows_(0),
        completed_(false) {
  }

  bool OnNext(const vector<RowResult>& rows) override {
    num_batches_++;
    num_rows_ += rows.size();
    return num_batches_ < max_batches_;
  }

  void OnError(const Status& status) override {
    status_ = status;
  }

  void OnComplete() override {
    completed_ = true;
  }

  int num_batches() const { return num_batches_; }
  int num_rows() const { return num_rows_; }
  bool completed() const { return completed_; }
  const Status& status() const { return status_; }

 private:
  const int max_batches_;
  int num_batches_;
  int num_rows_;
  bool completed_;
  Status status_;
};

} // anonymous namespace

class AsyncTableTest : public KvScanTest {
 protected:
  static MiniRegionStore::Options StoreOptions() {
    MiniRegionStore::Options opts;
    opts.split_keys = { "row-3", "row-6" };
    return opts;
  }

  static void FillStore(MiniRegionStore* store) {
    for (int i = 0; i < 10; i++) {
      store->PutRow("row-" + std::to_string(i), 2);
    }
  }
};

TEST_F(AsyncTableTest, TestScanAll) {
  shared_ptr<rpc::TimerThread> timer = std::make_shared<rpc::TimerThread>();
  ASSERT_OK(timer->Start());
  shared_ptr<MiniRegionStore> store = std::make_shared<MiniRegionStore>(timer, StoreOptions());
  FillStore(store.get());
  // A slow server does not change what the scan returns.
  store->SetServerDelay(store->ServerFor(1), MonoDelta::FromMilliseconds(10));

  AsyncTable table("test-table", store, store, timer, ScanConfiguration());
  ScanSpec spec;
  spec.set_caching(2).set_start_row("row-1").set_stop_row("row-8");
  vector<RowResult> rows;
  ASSERT_OK(table.ScanAll(spec, &rows));
  ASSERT_EQ(7U, rows.size());
  for (int i = 0; i < 7; i++) {
    ASSERT_EQ("row-" + std::to_string(i + 1), rows[i].row());
    ASSERT_EQ(2U, rows[i].cells().size());
  }
  timer->Shutdown();
}

TEST_F(AsyncTableTest, TestScanAllReportsErrors) {
  shared_ptr<rpc::TimerThread> timer = std::make_shared<rpc::TimerThread>();
  ASSERT_OK(timer->Start());
  shared_ptr<MiniRegionStore> store = std::make_shared<MiniRegionStore>(timer, StoreOptions());
  FillStore(store.get());
  store->InjectFault(store->ServerFor(0), MiniRegionStore::Fault::DO_NOT_RETRY);

  AsyncTable table("test-table", store, store, timer, ScanConfiguration());
  vector<RowResult> rows;
  Status s = table.ScanAll(ScanSpec(), &rows);
  ASSERT_TRUE(s.IsRemoteError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "unable to scan table test-table");
  ASSERT_TRUE(rows.empty());
  timer->Shutdown();
}

TEST_F(AsyncTableTest, TestSimpleConsumerStopsEarly) {
  shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
  shared_ptr<MiniRegionStore> store =
      std::make_shared<MiniRegionStore>(scheduler, StoreOptions());
  FillStore(store.get());

  AsyncTable table("test-table", store, store, scheduler, ScanConfiguration());
  shared_ptr<StoppingConsumer> consumer = std::make_shared<StoppingConsumer>(2);
  ScanSpec spec;
  spec.set_caching(2);
  shared_ptr<ScanDriver> driver = table.Scan(spec, consumer);
  scheduler->RunUntilIdle();

  // Stopping early is not an error.
  ASSERT_TRUE(consumer->completed()) << consumer->status().ToString();
  ASSERT_EQ(2, consumer->num_batches());
  ASSERT_EQ(3, consumer->num_rows());
  ASSERT_EQ(ScanDriver::State::COMPLETED, driver->state());
  ASSERT_EQ(0, store->num_open_scanners());
}

} // namespace client
} // namespace kvscan
