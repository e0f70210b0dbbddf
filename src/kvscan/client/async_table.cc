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

#include <mutex>
#include <utility>

#include <glog/logging.h>

#include "kvscan/client/region_locator.h"
#include "kvscan/client/region_server_stub.h"
#include "kvscan/client/scan_consumer.h"
#include "kvscan/client/scan_driver.h"
#include "kvscan/client/scan_spec.h"
#include "kvscan/rpc/scheduler.h"
#include "kvscan/util/async_util.h"

using std::shared_ptr;
using std::string;
using std::vector;

namespace kvscan {
namespace client {

namespace {

// Collects the rows of a scan and reports its end to a status callback.
class CollectingConsumer : public ScanConsumer {
 public:
  CollectingConsumer(vector<RowResult>* rows, StatusCallback done)
      : rows_(rows),
        done_(std::move(done)) {
  }

  bool OnNext(const vector<RowResult>& rows) override {
    std::lock_guard<std::mutex> l(lock_);
    rows_->insert(rows_->end(), rows.begin(), rows.end());
    return true;
  }

  void OnError(const Status& status) override {
    done_(status);
  }

  void OnComplete() override {
    done_(Status::OK());
  }

 private:
  std::mutex lock_;
  vector<RowResult>* rows_;
  StatusCallback done_;
};

} // anonymous namespace

AsyncTable::AsyncTable(string name,
                       shared_ptr<RegionLocator> locator,
                       shared_ptr<StubFactory> stub_factory,
                       shared_ptr<rpc::Scheduler> scheduler,
                       ScanConfiguration config)
    : name_(std::move(name)),
      locator_(std::move(locator)),
      stub_factory_(std::move(stub_factory)),
      scheduler_(std::move(scheduler)),
      config_(std::move(config)) {
}

AsyncTable::~AsyncTable() {
}

shared_ptr<ScanDriver> AsyncTable::Scan(const ScanSpec& spec,
                                        shared_ptr<AdvancedScanConsumer> consumer) {
  shared_ptr<ScanDriver> driver = std::make_shared<ScanDriver>(
      name_, spec, config_, locator_, stub_factory_, scheduler_, std::move(consumer));
  driver->Start();
  return driver;
}

shared_ptr<ScanDriver> AsyncTable::Scan(const ScanSpec& spec,
                                        shared_ptr<ScanConsumer> consumer) {
  return Scan(spec, shared_ptr<AdvancedScanConsumer>(
      std::make_shared<SimpleConsumerAdapter>(std::move(consumer))));
}

Status AsyncTable::ScanAll(const ScanSpec& spec, vector<RowResult>* rows) {
  Synchronizer sync;
  vector<RowResult> collected;
  shared_ptr<ScanConsumer> consumer =
      std::make_shared<CollectingConsumer>(&collected, sync.AsStatusCallback());
  Scan(spec, consumer);
  RETURN_NOT_OK_PREPEND(sync.Wait(), "unable to scan table " + name_);
  rows->insert(rows->end(), collected.begin(), collected.end());
  return Status::OK();
}

} // namespace client
} // namespace kvscan
