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

#include "kvscan/client/scan_consumer.h"

#include <utility>

#include <glog/logging.h>

using std::shared_ptr;
using std::vector;

namespace kvscan {
namespace client {

SimpleConsumerAdapter::SimpleConsumerAdapter(shared_ptr<ScanConsumer> consumer)
    : consumer_(std::move(consumer)) {
  CHECK(consumer_);
}

void SimpleConsumerAdapter::OnScanMetricsCreated(const shared_ptr<ScanMetrics>& metrics) {
  consumer_->OnScanMetricsCreated(metrics);
}

void SimpleConsumerAdapter::OnNext(const vector<RowResult>& rows,
                                   ScanController* controller) {
  if (!consumer_->OnNext(rows)) {
    controller->Terminate();
  }
}

void SimpleConsumerAdapter::OnError(const Status& status) {
  consumer_->OnError(status);
}

void SimpleConsumerAdapter::OnComplete() {
  consumer_->OnComplete();
}

} // namespace client
} // namespace kvscan
