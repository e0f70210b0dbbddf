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
#ifndef KVSCAN_CLIENT_SCAN_CONTEXT_H
#define KVSCAN_CLIENT_SCAN_CONTEXT_H

#include <memory>
#include <string>

#include "kvscan/client/scan_configuration.h"
#include "kvscan/client/scan_spec.h"
#include "kvscan/rpc/scheduler.h"

namespace kvscan {

class Trace;

namespace client {

class RegionLocator;
class ScanMetrics;
class StubFactory;

// What every component of one scan needs: the options of the scan and the
// collaborators it talks to. Created by the driver when the scan starts and
// shared, read-only, with the components it spawns.
struct ScanContext {
  std::string table_name;

  // Normalized and validated.
  ScanSpec spec;

  ScanConfiguration config;

  std::shared_ptr<RegionLocator> locator;
  std::shared_ptr<StubFactory> stub_factory;
  std::shared_ptr<rpc::Scheduler> scheduler;

  // Null unless the scan has metrics enabled.
  std::shared_ptr<ScanMetrics> metrics;

  // Spans the whole scan.
  std::shared_ptr<Trace> trace;
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_CONTEXT_H
