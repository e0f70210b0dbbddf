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
#ifndef KVSCAN_CLIENT_ASYNC_TABLE_H
#define KVSCAN_CLIENT_ASYNC_TABLE_H

#include <memory>
#include <string>
#include <vector>

#include "kvscan/client/row_result.h"
#include "kvscan/client/scan_configuration.h"
#include "kvscan/gutil/macros.h"
#include "kvscan/util/status.h"

namespace kvscan {

namespace rpc {
class Scheduler;
} // namespace rpc

namespace client {

class AdvancedScanConsumer;
class RegionLocator;
class ScanConsumer;
class ScanDriver;
class ScanSpec;
class StubFactory;

// Entry point for scanning a table.
//
// Example usage:
//   AsyncTable table("t1", locator, stubs, scheduler, ScanConfiguration());
//   ScanSpec spec;
//   spec.set_start_row("a").set_stop_row("z").set_caching(2);
//   table.Scan(spec, consumer);
//
// This class is thread-safe; any number of scans may run concurrently.
class AsyncTable {
 public:
  AsyncTable(std::string name,
             std::shared_ptr<RegionLocator> locator,
             std::shared_ptr<StubFactory> stub_factory,
             std::shared_ptr<rpc::Scheduler> scheduler,
             ScanConfiguration config);
  ~AsyncTable();

  // Starts a scan and returns at once. The driver is returned so that the
  // caller may look at its state, trace and metrics.
  std::shared_ptr<ScanDriver> Scan(const ScanSpec& spec,
                                   std::shared_ptr<AdvancedScanConsumer> consumer);
  std::shared_ptr<ScanDriver> Scan(const ScanSpec& spec,
                                   std::shared_ptr<ScanConsumer> consumer);

  // Scans synchronously, appending every row to 'rows'.
  Status ScanAll(const ScanSpec& spec, std::vector<RowResult>* rows) WARN_UNUSED_RESULT;

  const std::string& name() const { return name_; }
  const ScanConfiguration& config() const { return config_; }

 private:
  const std::string name_;
  const std::shared_ptr<RegionLocator> locator_;
  const std::shared_ptr<StubFactory> stub_factory_;
  const std::shared_ptr<rpc::Scheduler> scheduler_;
  const ScanConfiguration config_;

  DISALLOW_COPY_AND_ASSIGN(AsyncTable);
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_ASYNC_TABLE_H
