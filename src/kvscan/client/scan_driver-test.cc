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

#include "kvscan/client/scan_driver.h"

#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include "kvscan/client/row_result.h"
#include "kvscan/client/scan_configuration.h"
#include "kvscan/client/scan_consumer.h"
#include "kvscan/client/scan_metrics.h"
#include "kvscan/client/scan_spec.h"
#include "kvscan/client/testing/manual_scheduler.h"
#include "kvscan/client/testing/mini_region_store.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"
#include "kvscan/util/trace.h"

using std::lock_guard;
using std::map;
using std::mutex;
using std::shared_ptr;
using std::string;
using std::vector;

namespace kvscan {
namespace client {

namespace {

// Records everything a scan hands to its consumer.
class RecordingConsumer : public AdvancedScanConsumer {
 public:
  // Runs after a batch was recorded. 'index' counts the batches from 0.
  typedef std::function<void(int index, ScanController* controller)> NextHook;

  RecordingConsumer()
      : num_heartbeats_(0),
        num_finishes_(0),
        completed_(false) {
  }

  void set_next_hook(NextHook hook) { next_hook_ = std::move(hook); }

  void OnScanMetricsCreated(const shared_ptr<ScanMetrics>& metrics) override {
    lock_guard<mutex> l(lock_);
    events_.push_back("metrics");
    metrics_ = metrics;
  }

  void OnNext(const vector<RowResult>& rows, ScanController* controller) override {
    int index;
    {
      lock_guard<mutex> l(lock_);
      events_.push_back("next");
      batches_.push_back(rows);
      index = batches_.size() - 1;
    }
    if (next_hook_) {
      next_hook_(index, controller);
    }
  }

  void OnHeartbeat(ScanController* /* controller */) override {
    lock_guard<mutex> l(lock_);
    num_heartbeats_++;
  }

  void OnError(const Status& status) override {
    lock_guard<mutex> l(lock_);
    events_.push_back("error");
    num_finishes_++;
    status_ = status;
  }

  void OnComplete() override {
    lock_guard<mutex> l(lock_);
    events_.push_back("complete");
    num_finishes_++;
    completed_ = true;
  }

  // The batches as "[a,b][c]"; fragments are shown with their cell count,
  // as "a:3+".
  string BatchKeys() const {
    lock_guard<mutex> l(lock_);
    string ret;
    for (const auto& batch : batches_) {
      ret += "[";
      for (size_t i = 0; i < batch.size(); i++) {
        if (i > 0) {
          ret += ",";
        }
        ret += batch[i].row();
        if (batch[i].partial()) {
          ret += ":" + std::to_string(batch[i].cells().size()) + "+";
        }
      }
      ret += "]";
    }
    return ret;
  }

  // The row keys of every row delivered, as "a,b,c".
  string RowKeys() const {
    lock_guard<mutex> l(lock_);
    string ret;
    for (const auto& batch : batches_) {
      for (const auto& row : batch) {
        if (!ret.empty()) {
          ret += ",";
        }
        ret += row.row();
      }
    }
    return ret;
  }

  vector<vector<RowResult>> batches() const {
    lock_guard<mutex> l(lock_);
    return batches_;
  }

  vector<string> events() const {
    lock_guard<mutex> l(lock_);
    return events_;
  }

  int num_heartbeats() const {
    lock_guard<mutex> l(lock_);
    return num_heartbeats_;
  }

  int num_finishes() const {
    lock_guard<mutex> l(lock_);
    return num_finishes_;
  }

  bool completed() const {
    lock_guard<mutex> l(lock_);
    return completed_;
  }

  Status status() const {
    lock_guard<mutex> l(lock_);
    return status_;
  }

  shared_ptr<ScanMetrics> metrics() const {
    lock_guard<mutex> l(lock_);
    return metrics_;
  }

 private:
  NextHook next_hook_;

  mutable mutex lock_;
  vector<vector<RowResult>> batches_;
  vector<string> events_;
  int num_heartbeats_;
  int num_finishes_;
  bool completed_;
  Status status_;
  shared_ptr<ScanMetrics> metrics_;
};

} // anonymous namespace

class ScanDriverTest : public KvScanTest {
 protected:
  ScanDriverTest()
      : scheduler_(std::make_shared<ManualScheduler>()),
        consumer_(std::make_shared<RecordingConsumer>()) {
  }

  void TearDown() override {
    // Ends any scan still waiting on the scheduler.
    scheduler_->AbortAll();
    KvScanTest::TearDown();
  }

  void BuildStore(MiniRegionStore::Options opts = MiniRegionStore::Options()) {
    store_ = std::make_shared<MiniRegionStore>(scheduler_, std::move(opts));
  }

  void PutRows(const vector<string>& rows) {
    for (const string& row : rows) {
      store_->PutRow(row);
    }
  }

  void StartScan(const ScanSpec& spec,
                 const ScanConfiguration& config = ScanConfiguration(),
                 const string& table = "test-table") {
    driver_ = std::make_shared<ScanDriver>(table, spec, config, store_, store_,
                                           scheduler_, consumer_);
    driver_->Start();
  }

  // Runs a scan to its end.
  void RunScan(const ScanSpec& spec,
               const ScanConfiguration& config = ScanConfiguration(),
               const string& table = "test-table") {
    StartScan(spec, config, table);
    scheduler_->RunUntilIdle();
    ASSERT_EQ(1, consumer_->num_finishes());
  }

  vector<MiniRegionStore::Call> CallsOfKind(MiniRegionStore::Call::Kind kind) const {
    vector<MiniRegionStore::Call> ret;
    for (const auto& call : store_->calls()) {
      if (call.kind == kind) {
        ret.push_back(call);
      }
    }
    return ret;
  }

  string DumpCalls() const {
    string ret;
    for (const auto& call : store_->calls()) {
      ret += call.ToString() + "\n";
    }
    return ret;
  }

  shared_ptr<ManualScheduler> scheduler_;
  shared_ptr<MiniRegionStore> store_;
  shared_ptr<RecordingConsumer> consumer_;
  shared_ptr<ScanDriver> driver_;
};

TEST_F(ScanDriverTest, TestStateTransitions) {
  typedef ScanDriver::State State;
  typedef ScanDriver::Event Event;
  State next;
  ASSERT_OK(ScanDriver::NextState(State::IDLE, Event::START, &next));
  ASSERT_EQ(State::LOCATING_REGION, next);
  ASSERT_OK(ScanDriver::NextState(State::IDLE, Event::INVALID_SPEC, &next));
  ASSERT_EQ(State::FAILED, next);
  ASSERT_OK(ScanDriver::NextState(State::LOCATING_REGION, Event::OPEN_ISSUED, &next));
  ASSERT_EQ(State::OPENING_CURSOR, next);
  ASSERT_OK(ScanDriver::NextState(State::OPENING_CURSOR, Event::CURSOR_OPENED, &next));
  ASSERT_EQ(State::PULLING, next);
  ASSERT_OK(ScanDriver::NextState(State::OPENING_CURSOR, Event::OPEN_FAILED, &next));
  ASSERT_EQ(State::FAILED, next);
  ASSERT_OK(ScanDriver::NextState(State::PULLING, Event::REGION_EXHAUSTED, &next));
  ASSERT_EQ(State::LOCATING_REGION, next);
  ASSERT_OK(ScanDriver::NextState(State::PULLING, Event::SCAN_COMPLETE, &next));
  ASSERT_EQ(State::COMPLETED, next);
  ASSERT_OK(ScanDriver::NextState(State::PULLING, Event::PULL_FAILED, &next));
  ASSERT_EQ(State::FAILED, next);

  Status s = ScanDriver::NextState(State::IDLE, Event::CURSOR_OPENED, &next);
  ASSERT_TRUE(s.IsIllegalState()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "CURSOR_OPENED in state IDLE");
  ASSERT_TRUE(ScanDriver::NextState(State::COMPLETED, Event::START, &next).IsIllegalState());
  ASSERT_TRUE(ScanDriver::NextState(State::FAILED, Event::PULL_FAILED, &next).IsIllegalState());
  ASSERT_TRUE(ScanDriver::NextState(State::LOCATING_REGION, Event::SCAN_COMPLETE,
                                    &next).IsIllegalState());
}

TEST_F(ScanDriverTest, TestScanAcrossRegions) {
  MiniRegionStore::Options opts;
  opts.split_keys = { "m" };
  BuildStore(opts);
  PutRows({ "a", "b", "c", "d", "m", "n" });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));

  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("[a,b][c,d][m,n]", consumer_->BatchKeys());
  ASSERT_EQ(ScanDriver::State::COMPLETED, driver_->state());
  ASSERT_TRUE(driver_->trace()->ended());
  ASSERT_OK(driver_->trace()->final_status());

  vector<MiniRegionStore::Call> calls = store_->calls();
  ASSERT_EQ(3U, calls.size()) << DumpCalls();
  ASSERT_EQ(MiniRegionStore::Call::OPEN, calls[0].kind);
  ASSERT_EQ(store_->ServerFor(0), calls[0].server);
  ASSERT_EQ(2U, calls[0].number_of_rows);
  ASSERT_EQ(MiniRegionStore::Call::CONTINUE, calls[1].kind);
  ASSERT_EQ(0U, calls[1].call_seq);
  ASSERT_EQ(MiniRegionStore::Call::OPEN, calls[2].kind);
  ASSERT_EQ(store_->ServerFor(1), calls[2].server);
  ASSERT_EQ("m", calls[2].start_row);
  ASSERT_TRUE(calls[2].include_start_row);

  // The servers closed their scanners once they ran out of rows.
  ASSERT_EQ(0, store_->num_open_scanners());
}

TEST_F(ScanDriverTest, TestKeyRangeBounds) {
  MiniRegionStore::Options opts;
  opts.split_keys = { "d" };
  BuildStore(opts);
  PutRows({ "a", "b", "c", "d", "e", "f" });

  ScanSpec spec;
  spec.set_start_row("b", false).set_stop_row("e", true);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ("c,d,e", consumer_->RowKeys());
}

TEST_F(ScanDriverTest, TestEmptyTable) {
  MiniRegionStore::Options opts;
  opts.split_keys = { "g", "p" };
  BuildStore(opts);

  ScanSpec spec;
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_TRUE(consumer_->batches().empty());
  // Every region was visited.
  ASSERT_EQ(3U, CallsOfKind(MiniRegionStore::Call::OPEN).size());
}

TEST_F(ScanDriverTest, TestMetrics) {
  MiniRegionStore::Options opts;
  opts.split_keys = { "h", "p" };
  opts.local_server = "rs-0-0:16020";
  BuildStore(opts);
  PutRows({ "a", "b", "i", "j", "q", "r" });
  store_->InjectFault(store_->ServerFor(1), MiniRegionStore::Fault::REGION_OPENING);

  ScanSpec spec;
  spec.set_caching(10).set_region_metrics_enabled(true);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("a,b,i,j,q,r", consumer_->RowKeys());

  vector<string> events = consumer_->events();
  ASSERT_EQ("metrics", events.front());
  ASSERT_EQ("complete", events.back());

  shared_ptr<ScanMetrics> metrics = consumer_->metrics();
  ASSERT_TRUE(metrics);
  ASSERT_EQ(metrics.get(), driver_->metrics().get());
  map<string, int64_t> m = metrics->Get();
  ASSERT_EQ(4, m[ScanMetrics::kRpcCalls]);
  ASSERT_EQ(3, m[ScanMetrics::kRemoteRpcCalls]);
  ASSERT_EQ(1, m[ScanMetrics::kRpcRetries]);
  ASSERT_EQ(1, m[ScanMetrics::kRemoteRpcRetries]);
  ASSERT_EQ(3, m[ScanMetrics::kRegionsScanned]);
  ASSERT_EQ(6, m[ScanMetrics::kRowsScanned]);
  ASSERT_EQ(0, m[ScanMetrics::kNotServingRegionExceptions]);
  ASSERT_GT(m[ScanMetrics::kBytesScanned], 0);

  map<string, ScanMetrics::RegionMetrics> regions = metrics->GetRegionMetrics();
  ASSERT_EQ(3U, regions.size());
  for (const auto& e : regions) {
    const ScanMetrics::RegionMetrics& r = e.second;
    SCOPED_TRACE(r.server_name);
    ASSERT_EQ(2, r.rows_scanned);
    if (r.server_name == store_->ServerFor(1)) {
      ASSERT_EQ(2, r.rpc_calls);
      ASSERT_EQ(1, r.rpc_retries);
    } else {
      ASSERT_EQ(1, r.rpc_calls);
      ASSERT_EQ(0, r.rpc_retries);
    }
  }
}

TEST_F(ScanDriverTest, TestNoMetricsUnlessEnabled) {
  BuildStore();
  PutRows({ "a" });
  NO_FATALS(RunScan(ScanSpec()));
  ASSERT_FALSE(driver_->metrics());
  ASSERT_FALSE(consumer_->metrics());
  ASSERT_EQ("next", consumer_->events().front());
}

TEST_F(ScanDriverTest, TestTerminateFromConsumer) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e", "f" });
  consumer_->set_next_hook([](int index, ScanController* controller) {
    controller->Terminate();
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ("[a,b]", consumer_->BatchKeys());

  // The scanner which still had rows was closed.
  vector<MiniRegionStore::Call> closes = CallsOfKind(MiniRegionStore::Call::CLOSE);
  ASSERT_EQ(1U, closes.size()) << DumpCalls();
  ASSERT_NE(0U, closes[0].scanner_id);
  ASSERT_EQ(0, store_->num_open_scanners());
  ASSERT_TRUE(CallsOfKind(MiniRegionStore::Call::CONTINUE).empty());
}

TEST_F(ScanDriverTest, TestRowLimit) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e" });

  ScanSpec spec;
  spec.set_caching(2).set_limit(3);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ("[a,b][c]", consumer_->BatchKeys());

  vector<MiniRegionStore::Call> continues = CallsOfKind(MiniRegionStore::Call::CONTINUE);
  ASSERT_EQ(1U, continues.size()) << DumpCalls();
  // Only the missing row is asked for.
  ASSERT_EQ(1U, continues[0].number_of_rows);
  ASSERT_EQ(1U, CallsOfKind(MiniRegionStore::Call::CLOSE).size());
}

TEST_F(ScanDriverTest, TestBatchLimit) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e" });

  ScanSpec spec;
  spec.set_caching(10).set_max_batch_rows(2);
  NO_FATALS(RunScan(spec));
  ASSERT_EQ("[a,b][c,d][e]", consumer_->BatchKeys());
  ASSERT_EQ(1U, store_->calls().size());
}

TEST_F(ScanDriverTest, TestBufferedRowsBoundRequests) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e", "f", "g" });

  ScanSpec spec;
  spec.set_caching(10).set_max_buffered_rows(3);
  NO_FATALS(RunScan(spec));
  ASSERT_EQ("[a,b,c][d,e,f][g]", consumer_->BatchKeys());
  vector<MiniRegionStore::Call> calls = store_->calls();
  ASSERT_EQ(3U, calls.size()) << DumpCalls();
  for (const auto& call : calls) {
    ASSERT_EQ(3U, call.number_of_rows) << DumpCalls();
  }
}

TEST_F(ScanDriverTest, TestRequestOptionsPropagate) {
  MiniRegionStore::Options opts;
  opts.split_keys = { "c" };
  BuildStore(opts);
  PutRows({ "a", "b", "c", "d" });

  ScanSpec spec;
  spec.set_caching(1).set_priority(7).AddAttribute("tenant", "t1");
  NO_FATALS(RunScan(spec));
  ASSERT_EQ("a,b,c,d", consumer_->RowKeys());
  for (const auto& call : store_->calls()) {
    SCOPED_TRACE(call.ToString());
    ASSERT_EQ(7U, call.priority);
    auto it = call.attributes.find("tenant");
    ASSERT_TRUE(it != call.attributes.end());
    ASSERT_EQ("t1", it->second);
  }
}

TEST_F(ScanDriverTest, TestTimelineReadRacesSecondaries) {
  MiniRegionStore::Options opts;
  opts.num_replicas = 2;
  BuildStore(opts);
  PutRows({ "a", "b", "c" });
  // The primary answers only long after the primary call timeout.
  store_->SetServerDelay(store_->ServerFor(0, 0), MonoDelta::FromSeconds(5));

  ScanSpec spec;
  spec.set_consistency(ScanSpec::Consistency::TIMELINE);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  // The late answer of the primary does not deliver the rows again.
  ASSERT_EQ("a,b,c", consumer_->RowKeys());

  vector<MiniRegionStore::Call> opens = CallsOfKind(MiniRegionStore::Call::OPEN);
  ASSERT_EQ(2U, opens.size()) << DumpCalls();
  ASSERT_EQ(store_->ServerFor(0, 0), opens[0].server);
  ASSERT_EQ(store_->ServerFor(0, 1), opens[1].server);

  string trace = driver_->trace()->DumpToString();
  ASSERT_STR_CONTAINS(trace, "Replica 1 won the open race");
  ASSERT_STR_CONTAINS(trace, "may be stale");
}

// The primary wins the race after the secondary was already asked. Only the
// region the rows came from gets region counters; the open call sent to the
// secondary counts toward the scan-wide counters only.
TEST_F(ScanDriverTest, TestTimelineReadLateWinnerOwnsRegionMetrics) {
  MiniRegionStore::Options opts;
  opts.num_replicas = 2;
  BuildStore(opts);
  PutRows({ "a", "b", "c", "d" });
  // The secondaries are asked after one second; the primary answers first.
  store_->SetServerDelay(store_->ServerFor(0, 0), MonoDelta::FromMilliseconds(1500));
  store_->SetServerDelay(store_->ServerFor(0, 1), MonoDelta::FromSeconds(5));

  ScanSpec spec;
  spec.set_consistency(ScanSpec::Consistency::TIMELINE)
      .set_caching(2)
      .set_region_metrics_enabled(true);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("a,b,c,d", consumer_->RowKeys());

  vector<MiniRegionStore::Call> opens = CallsOfKind(MiniRegionStore::Call::OPEN);
  ASSERT_EQ(2U, opens.size()) << DumpCalls();
  ASSERT_EQ(store_->ServerFor(0, 1), opens[1].server);
  vector<MiniRegionStore::Call> continues = CallsOfKind(MiniRegionStore::Call::CONTINUE);
  ASSERT_FALSE(continues.empty());
  for (const auto& call : continues) {
    ASSERT_EQ(store_->ServerFor(0, 0), call.server) << DumpCalls();
  }

  shared_ptr<ScanMetrics> metrics = driver_->metrics();
  ASSERT_EQ(2 + static_cast<int64_t>(continues.size()), metrics->rpc_calls());
  ASSERT_EQ(1, metrics->regions_scanned());
  ASSERT_EQ(4, metrics->rows_scanned());

  map<string, ScanMetrics::RegionMetrics> regions = metrics->GetRegionMetrics();
  ASSERT_EQ(1U, regions.size());
  const ScanMetrics::RegionMetrics& r = regions.begin()->second;
  ASSERT_EQ(store_->ServerFor(0, 0), r.server_name);
  ASSERT_EQ(4, r.rows_scanned);
  ASSERT_EQ(1 + static_cast<int64_t>(continues.size()), r.rpc_calls);
  ASSERT_EQ(0, r.rpc_retries);
}

TEST_F(ScanDriverTest, TestTimelineReadPrimaryAnswersInTime) {
  MiniRegionStore::Options opts;
  opts.num_replicas = 3;
  BuildStore(opts);
  PutRows({ "a", "b" });

  ScanSpec spec;
  spec.set_consistency(ScanSpec::Consistency::TIMELINE);
  NO_FATALS(RunScan(spec));
  ASSERT_EQ("a,b", consumer_->RowKeys());
  for (const auto& call : store_->calls()) {
    ASSERT_EQ(store_->ServerFor(0, 0), call.server) << DumpCalls();
  }
}

TEST_F(ScanDriverTest, TestTimelineReadPrimaryFails) {
  MiniRegionStore::Options opts;
  opts.num_replicas = 2;
  BuildStore(opts);
  PutRows({ "a", "b" });
  store_->InjectFault(store_->ServerFor(0, 0), MiniRegionStore::Fault::DO_NOT_RETRY);

  ScanSpec spec;
  spec.set_consistency(ScanSpec::Consistency::TIMELINE);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("a,b", consumer_->RowKeys());
  ASSERT_EQ(store_->ServerFor(0, 1), CallsOfKind(MiniRegionStore::Call::OPEN).back().server);
}

TEST_F(ScanDriverTest, TestTimelineReadAllReplicasFail) {
  MiniRegionStore::Options opts;
  opts.num_replicas = 2;
  BuildStore(opts);
  PutRows({ "a" });
  store_->InjectFault(store_->ServerFor(0, 0), MiniRegionStore::Fault::DO_NOT_RETRY);
  store_->InjectFault(store_->ServerFor(0, 1), MiniRegionStore::Fault::DO_NOT_RETRY);

  ScanSpec spec;
  spec.set_consistency(ScanSpec::Consistency::TIMELINE);
  NO_FATALS(RunScan(spec));
  Status s = consumer_->status();
  ASSERT_TRUE(s.IsRemoteError()) << s.ToString();
  // The error of the primary is the one reported.
  ASSERT_STR_CONTAINS(s.ToString(), store_->ServerFor(0, 0));
}

TEST_F(ScanDriverTest, TestReplayedRowsDeliveredOnce) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e", "f" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::REPLAY);
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ("[a,b][c,d][e,f]", consumer_->BatchKeys());
  ASSERT_EQ(3U, CallsOfKind(MiniRegionStore::Call::CONTINUE).size()) << DumpCalls();
}

TEST_F(ScanDriverTest, TestLostResponseReopensScanner) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e", "f" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::LOST_RESPONSE);
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("a,b,c,d,e,f", consumer_->RowKeys());

  // The retried call carries a sequence number the server already saw, so
  // the scanner is re-opened right after the last row delivered.
  vector<MiniRegionStore::Call> opens = CallsOfKind(MiniRegionStore::Call::OPEN);
  ASSERT_EQ(2U, opens.size()) << DumpCalls();
  ASSERT_EQ("b", opens[1].start_row);
  ASSERT_FALSE(opens[1].include_start_row);
}

TEST_F(ScanDriverTest, TestRegionMoved) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e", "f" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->MoveRegion(0, 0, "rs-moved:16020");
    }
  });

  ScanSpec spec;
  spec.set_caching(2).set_metrics_enabled(true);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("a,b,c,d,e,f", consumer_->RowKeys());
  ASSERT_EQ(1, store_->num_invalidations());
  ASSERT_EQ(1, driver_->metrics()->not_serving_region_exceptions());

  vector<MiniRegionStore::Call> opens = CallsOfKind(MiniRegionStore::Call::OPEN);
  ASSERT_EQ(2U, opens.size()) << DumpCalls();
  ASSERT_EQ("rs-moved:16020", opens[1].server);
  ASSERT_EQ("b", opens[1].start_row);
}

TEST_F(ScanDriverTest, TestScannerExpiredOnServer) {
  BuildStore();
  PutRows({ "a", "b", "c", "d" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::SCANNER_EXPIRED);
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ("a,b,c,d", consumer_->RowKeys());
  ASSERT_EQ(2U, CallsOfKind(MiniRegionStore::Call::OPEN).size()) << DumpCalls();
  // A dropped scanner does not mean the region moved.
  ASSERT_EQ(0, store_->num_invalidations());
}

TEST_F(ScanDriverTest, TestLeaseExpiredWhileConsuming) {
  MiniRegionStore::Options opts;
  opts.scanner_ttl_ms = 50;
  BuildStore(opts);
  PutRows({ "a", "b", "c", "d", "e", "f" });
  consumer_->set_next_hook([](int index, ScanController* controller) {
    if (index == 0) {
      SleepFor(MonoDelta::FromMilliseconds(100));
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("[a,b][c,d][e,f]", consumer_->BatchKeys());

  // No call was wasted on the expired scanner.
  vector<MiniRegionStore::Call> opens = CallsOfKind(MiniRegionStore::Call::OPEN);
  ASSERT_EQ(2U, opens.size()) << DumpCalls();
  ASSERT_EQ("b", opens[1].start_row);
  ASSERT_FALSE(opens[1].include_start_row);
  ASSERT_EQ(1U, CallsOfKind(MiniRegionStore::Call::CONTINUE).size()) << DumpCalls();
  ASSERT_STR_CONTAINS(driver_->trace()->DumpToString(), "expired");
}

TEST_F(ScanDriverTest, TestSuspendAndResume) {
  BuildStore();
  PutRows({ "a", "b", "c", "d" });
  shared_ptr<ScanResumer> resumer;
  consumer_->set_next_hook([&](int index, ScanController* controller) {
    if (index == 0) {
      resumer = controller->Suspend();
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  StartScan(spec);
  scheduler_->RunUntilIdle(20);
  ASSERT_TRUE(resumer);
  ASSERT_EQ(0, consumer_->num_finishes());
  ASSERT_EQ("[a,b]", consumer_->BatchKeys());
  ASSERT_EQ(ScanDriver::State::PULLING, driver_->state());
  // The lease is kept alive while the scan is suspended.
  ASSERT_GE(CallsOfKind(MiniRegionStore::Call::RENEW).size(), 1U);
  ASSERT_TRUE(CallsOfKind(MiniRegionStore::Call::CONTINUE).empty());

  resumer->Resume();
  // Resuming twice is harmless.
  resumer->Resume();
  scheduler_->RunUntilIdle();
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ("[a,b][c,d]", consumer_->BatchKeys());
  ASSERT_EQ(1, consumer_->num_finishes());
}

TEST_F(ScanDriverTest, TestResumeWithinCallback) {
  BuildStore();
  PutRows({ "a", "b", "c", "d" });
  consumer_->set_next_hook([](int index, ScanController* controller) {
    if (index == 0) {
      controller->Suspend()->Resume();
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  ASSERT_EQ("[a,b][c,d]", consumer_->BatchKeys());
  ASSERT_TRUE(CallsOfKind(MiniRegionStore::Call::RENEW).empty());
}

TEST_F(ScanDriverTest, TestHeartbeat) {
  BuildStore();
  PutRows({ "a", "b", "c", "d" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::HEARTBEAT);
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ(1, consumer_->num_heartbeats());
  ASSERT_EQ("[a,b][c,d]", consumer_->BatchKeys());
}

TEST_F(ScanDriverTest, TestPartialRowsAssembled) {
  MiniRegionStore::Options opts;
  opts.max_cells_per_response = 3;
  opts.use_cell_blocks = true;
  BuildStore(opts);
  store_->PutRow("a", 5);
  store_->PutRow("b", 2);

  ScanSpec spec;
  spec.set_caching(10);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  vector<vector<RowResult>> batches = consumer_->batches();
  ASSERT_EQ("[a][b]", consumer_->BatchKeys());
  ASSERT_EQ(5U, batches[0][0].cells().size());
  ASSERT_FALSE(batches[0][0].partial());
  ASSERT_EQ(2U, batches[1][0].cells().size());
  ASSERT_EQ("a-4", batches[0][0].cells().back().value);
}

TEST_F(ScanDriverTest, TestPartialRowsDelivered) {
  MiniRegionStore::Options opts;
  opts.max_cells_per_response = 3;
  opts.use_cell_blocks = true;
  BuildStore(opts);
  store_->PutRow("a", 5);
  store_->PutRow("b", 2);

  ScanSpec spec;
  spec.set_caching(10).set_allow_partial_results(true);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("[a:3+][a,b:1+][b]", consumer_->BatchKeys());
}

TEST_F(ScanDriverTest, TestOverloadedServerPausesLonger) {
  BuildStore();
  PutRows({ "a", "b", "c", "d", "e", "f" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::SERVER_OVERLOADED);
    }
  });

  ScanSpec spec;
  spec.set_caching(2).set_metrics_enabled(true);
  NO_FATALS(RunScan(spec));
  ASSERT_TRUE(consumer_->completed());
  ASSERT_EQ("a,b,c,d,e,f", consumer_->RowKeys());
  ASSERT_EQ(4, driver_->metrics()->rpc_calls());
  ASSERT_EQ(1, driver_->metrics()->rpc_retries());

  bool found = false;
  for (const MonoDelta& d : scheduler_->delays()) {
    if (d.ToMilliseconds() >= 1000 && d.ToMilliseconds() <= 1010) {
      found = true;
    }
  }
  ASSERT_TRUE(found);
}

TEST_F(ScanDriverTest, TestNetworkErrorsRetried) {
  BuildStore();
  PutRows({ "a", "b" });
  store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::NETWORK_ERROR, 2);
  store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::TIMED_OUT);

  NO_FATALS(RunScan(ScanSpec()));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("a,b", consumer_->RowKeys());
  ASSERT_EQ(4U, CallsOfKind(MiniRegionStore::Call::OPEN).size());
}

TEST_F(ScanDriverTest, TestRetriesExhausted) {
  BuildStore();
  PutRows({ "a" });
  store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::NETWORK_ERROR, 5);

  ScanConfiguration config;
  ASSERT_OK(config.SetMaxAttempts(3));
  NO_FATALS(RunScan(ScanSpec(), config));
  Status s = consumer_->status();
  ASSERT_TRUE(s.IsNetworkError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "retries exhausted");
  ASSERT_STR_CONTAINS(s.ToString(), "after 3 attempt(s)");
  ASSERT_EQ(3U, CallsOfKind(MiniRegionStore::Call::OPEN).size());
  ASSERT_EQ(ScanDriver::State::FAILED, driver_->state());
}

// The continue step keeps failing until its backoff would cross the step
// deadline; the scan then fails with a timeout naming the last error.
TEST_F(ScanDriverTest, TestStepDeadlineFailsScan) {
  BuildStore();
  PutRows({ "a", "b", "c" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::NETWORK_ERROR, 10);
    }
  });

  ScanSpec spec;
  spec.set_caching(1);
  ScanConfiguration config;
  ASSERT_OK(config.SetPause(MonoDelta::FromMilliseconds(40)));
  ASSERT_OK(config.SetScanTimeout(MonoDelta::FromMilliseconds(100)));
  NO_FATALS(RunScan(spec, config));

  ASSERT_EQ("a", consumer_->RowKeys());
  Status s = consumer_->status();
  ASSERT_TRUE(s.IsTimedOut()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "timeout 0.100s");
  ASSERT_STR_CONTAINS(s.ToString(), "last retryable error: Network error");
  ASSERT_EQ("error", consumer_->events().back());
  ASSERT_EQ(ScanDriver::State::FAILED, driver_->state());
  ASSERT_TRUE(driver_->trace()->final_status().IsTimedOut());
  ASSERT_EQ(1U, CallsOfKind(MiniRegionStore::Call::OPEN).size());
}

// Scans a table split in three regions while every server fails a random
// number of calls with a random recoverable fault. Every row must come out
// once, in order.
TEST_F(ScanDriverTest, TestRandomRecoverableFaults) {
  const MiniRegionStore::Fault kFaults[] = {
    MiniRegionStore::Fault::NETWORK_ERROR,
    MiniRegionStore::Fault::TIMED_OUT,
    MiniRegionStore::Fault::REGION_OPENING,
    MiniRegionStore::Fault::SERVER_OVERLOADED,
    MiniRegionStore::Fault::NOT_SERVING_REGION,
    MiniRegionStore::Fault::SCANNER_EXPIRED,
    MiniRegionStore::Fault::OUT_OF_ORDER,
    MiniRegionStore::Fault::HEARTBEAT,
    MiniRegionStore::Fault::REPLAY,
    MiniRegionStore::Fault::LOST_RESPONSE,
  };
  const int kNumFaults = sizeof(kFaults) / sizeof(kFaults[0]);
  const int kIterations = 20;
  SeedRandom();

  vector<string> rows;
  string expected;
  for (char c = 'a'; c <= 'z'; c++) {
    rows.emplace_back(1, c);
    if (!expected.empty()) {
      expected += ",";
    }
    expected += c;
  }

  for (int iter = 0; iter < kIterations; iter++) {
    SCOPED_TRACE(iter);
    MiniRegionStore::Options opts;
    opts.split_keys = { "g", "p" };
    BuildStore(opts);
    PutRows(rows);
    consumer_ = std::make_shared<RecordingConsumer>();

    std::set<string> servers;
    for (int region = 0; region < 3; region++) {
      servers.insert(store_->ServerFor(region));
    }
    for (const string& server : servers) {
      int count = rand() % 4;
      for (int i = 0; i < count; i++) {
        MiniRegionStore::Fault fault = kFaults[rand() % kNumFaults];
        VLOG(1) << "Failing a call to " << server << " with " << FaultToString(fault);
        store_->InjectFault(server, fault);
      }
    }

    ScanSpec spec;
    spec.set_caching(1 + rand() % 4).set_metrics_enabled(true);
    NO_FATALS(RunScan(spec));
    ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString() << "\n" << DumpCalls();
    ASSERT_EQ(expected, consumer_->RowKeys()) << DumpCalls();
    ASSERT_EQ(26, driver_->metrics()->rows_scanned());
    ASSERT_EQ(ScanDriver::State::COMPLETED, driver_->state());
  }
}

TEST_F(ScanDriverTest, TestDoNotRetryFailsScan) {
  BuildStore();
  PutRows({ "a" });
  store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::DO_NOT_RETRY);

  NO_FATALS(RunScan(ScanSpec()));
  Status s = consumer_->status();
  ASSERT_TRUE(s.IsRemoteError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "DoNotRetryIOException");
  ASSERT_STR_CONTAINS(s.ToString(), "unable to open scanner");
  ASSERT_EQ(1U, store_->calls().size());
  ASSERT_EQ(ScanDriver::State::FAILED, driver_->state());
  ASSERT_TRUE(driver_->trace()->ended());
  ASSERT_FALSE(driver_->trace()->final_status().ok());
  ASSERT_EQ("error", consumer_->events().back());
}

TEST_F(ScanDriverTest, TestConnectionFatalErrorFailsScan) {
  BuildStore();
  PutRows({ "a", "b", "c", "d" });
  consumer_->set_next_hook([this](int index, ScanController* controller) {
    if (index == 0) {
      store_->InjectFault(store_->ServerFor(0), MiniRegionStore::Fault::CONNECTION_FATAL);
    }
  });

  ScanSpec spec;
  spec.set_caching(2);
  NO_FATALS(RunScan(spec));
  Status s = consumer_->status();
  ASSERT_TRUE(s.IsRemoteError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "FatalConnectionException");
  ASSERT_EQ("[a,b]", consumer_->BatchKeys());
  ASSERT_FALSE(consumer_->completed());
}

TEST_F(ScanDriverTest, TestLocateErrors) {
  BuildStore();
  PutRows({ "a" });
  store_->InjectLocateFault(Status::NetworkError("meta region unavailable"));

  NO_FATALS(RunScan(ScanSpec()));
  ASSERT_TRUE(consumer_->completed()) << consumer_->status().ToString();
  ASSERT_EQ("a", consumer_->RowKeys());
  ASSERT_EQ(2, store_->num_locate_calls());
}

TEST_F(ScanDriverTest, TestUnknownTable) {
  BuildStore();
  NO_FATALS(RunScan(ScanSpec(), ScanConfiguration(), "no-such-table"));
  Status s = consumer_->status();
  ASSERT_TRUE(s.IsNotFound()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "unable to locate region");
  ASSERT_TRUE(store_->calls().empty());
}

TEST_F(ScanDriverTest, TestInvalidSpec) {
  BuildStore();
  ScanSpec spec;
  spec.set_caching(0);
  StartScan(spec);
  // Rejected synchronously, before any RPC.
  ASSERT_EQ(1, consumer_->num_finishes());
  Status s = consumer_->status();
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "invalid scan");
  ASSERT_EQ(ScanDriver::State::FAILED, driver_->state());
  ASSERT_EQ(0U, scheduler_->num_pending());
  ASSERT_EQ(0, store_->num_locate_calls());
}

} // namespace client
} // namespace kvscan
