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
//
// Utility functions which are handy when doing async/callback-based programming.
#ifndef KVSCAN_UTIL_ASYNC_UTIL_H
#define KVSCAN_UTIL_ASYNC_UTIL_H

#include <functional>
#include <memory>

#include "kvscan/gutil/macros.h"
#include "kvscan/util/countdown_latch.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"
#include "kvscan/util/status_callback.h"

namespace kvscan {

// Simple class which can be used to make async methods synchronous.
// For example:
//   Synchronizer s;
//   SomeAsyncMethod(s.AsStatusCallback());
//   CHECK_OK(s.Wait());
//
// The callback produced by AsStatusCallback() shares ownership of the
// synchronization state, so it may safely outlive the Synchronizer.
class Synchronizer {
 public:
  Synchronizer()
      : data_(std::make_shared<Data>()) {
  }

  void StatusCB(const Status& status) {
    Data::Callback(data_, status);
  }

  StatusCallback AsStatusCallback() {
    std::weak_ptr<Data> weak = data_;
    return [weak](const Status& s) {
      Data::Callback(weak.lock(), s);
    };
  }

  Status Wait() const {
    data_->latch.Wait();
    return data_->status;
  }

  // Waits for the callback to fire, or returns TimedOut if 'delta' elapses
  // first.
  Status WaitFor(const MonoDelta& delta) const {
    if (!data_->latch.WaitFor(delta)) {
      return Status::TimedOut("timed out while waiting for the callback to be called");
    }
    return data_->status;
  }

  void Reset() {
    data_->latch.Reset(1);
  }

 private:
  struct Data {
    Data() : latch(1) {}
    CountDownLatch latch;
    Status status;

    static void Callback(const std::shared_ptr<Data>& data, const Status& s) {
      if (data) {
        data->status = s;
        data->latch.CountDown();
      }
    }
  };

  std::shared_ptr<Data> data_;

  DISALLOW_COPY_AND_ASSIGN(Synchronizer);
};

} // namespace kvscan

#endif // KVSCAN_UTIL_ASYNC_UTIL_H
