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

#include <glog/logging.h>

using std::lock_guard;
using std::map;
using std::mutex;
using std::string;

namespace kvscan {
namespace client {

const char* const ScanMetrics::kRpcCalls = "RPC_CALLS";
const char* const ScanMetrics::kRemoteRpcCalls = "REMOTE_RPC_CALLS";
const char* const ScanMetrics::kRpcRetries = "RPC_RETRIES";
const char* const ScanMetrics::kRemoteRpcRetries = "REMOTE_RPC_RETRIES";
const char* const ScanMetrics::kRegionsScanned = "REGIONS_SCANNED";
const char* const ScanMetrics::kNotServingRegionExceptions = "NOT_SERVING_REGION_EXCEPTION";
const char* const ScanMetrics::kRowsScanned = "ROWS_SCANNED";
const char* const ScanMetrics::kBytesScanned = "BYTES_IN_RESULTS";

map<string, int64_t> ScanMetrics::RegionMetrics::Get() const {
  return {
    { kRpcCalls, rpc_calls },
    { kRemoteRpcCalls, remote_rpc_calls },
    { kRpcRetries, rpc_retries },
    { kRemoteRpcRetries, remote_rpc_retries },
    { kNotServingRegionExceptions, not_serving_region_exceptions },
    { kRowsScanned, rows_scanned },
    { kBytesScanned, bytes_scanned },
  };
}

ScanMetrics::ScanMetrics(bool region_metrics_enabled)
    : region_metrics_enabled_(region_metrics_enabled),
      rpc_calls_(0),
      remote_rpc_calls_(0),
      rpc_retries_(0),
      remote_rpc_retries_(0),
      regions_scanned_(0),
      not_serving_region_exceptions_(0),
      rows_scanned_(0),
      bytes_scanned_(0) {
}

template<class F>
void ScanMetrics::UpdateCurrentRegion(const F& fn) {
  if (!region_metrics_enabled_) {
    return;
  }
  lock_guard<mutex> l(lock_);
  if (current_region_.empty()) {
    return;
  }
  auto it = region_metrics_.find(current_region_);
  DCHECK(it != region_metrics_.end());
  fn(&it->second);
}

void ScanMetrics::MoveToNextRegion() {
  regions_scanned_++;
  if (region_metrics_enabled_) {
    lock_guard<mutex> l(lock_);
    current_region_.clear();
  }
}

void ScanMetrics::InitRegionInfo(const string& encoded_region_name,
                                 const string& server_name,
                                 const RegionMetrics& pending) {
  if (!region_metrics_enabled_) {
    return;
  }
  lock_guard<mutex> l(lock_);
  RegionMetrics& m = region_metrics_[encoded_region_name];
  m.encoded_region_name = encoded_region_name;
  m.server_name = server_name;
  m.rpc_calls += pending.rpc_calls;
  m.remote_rpc_calls += pending.remote_rpc_calls;
  m.rpc_retries += pending.rpc_retries;
  m.remote_rpc_retries += pending.remote_rpc_retries;
  m.not_serving_region_exceptions += pending.not_serving_region_exceptions;
  m.rows_scanned += pending.rows_scanned;
  m.bytes_scanned += pending.bytes_scanned;
  current_region_ = encoded_region_name;
}

namespace {

void CountRpcCall(bool is_remote, ScanMetrics::RegionMetrics* m) {
  m->rpc_calls++;
  if (is_remote) {
    m->remote_rpc_calls++;
  }
}

void CountRpcRetry(bool is_remote, ScanMetrics::RegionMetrics* m) {
  m->rpc_retries++;
  if (is_remote) {
    m->remote_rpc_retries++;
  }
}

} // anonymous namespace

void ScanMetrics::IncrementRpcCall(bool is_remote) {
  rpc_calls_++;
  if (is_remote) {
    remote_rpc_calls_++;
  }
  UpdateCurrentRegion([is_remote](RegionMetrics* m) { CountRpcCall(is_remote, m); });
}

void ScanMetrics::IncrementRpcRetry(bool is_remote) {
  rpc_retries_++;
  if (is_remote) {
    remote_rpc_retries_++;
  }
  UpdateCurrentRegion([is_remote](RegionMetrics* m) { CountRpcRetry(is_remote, m); });
}

void ScanMetrics::IncrementNotServingRegion() {
  not_serving_region_exceptions_++;
  UpdateCurrentRegion([](RegionMetrics* m) {
    m->not_serving_region_exceptions++;
  });
}

void ScanMetrics::IncrementRpcCall(bool is_remote, RegionMetrics* pending) {
  rpc_calls_++;
  if (is_remote) {
    remote_rpc_calls_++;
  }
  CountRpcCall(is_remote, pending);
}

void ScanMetrics::IncrementRpcRetry(bool is_remote, RegionMetrics* pending) {
  rpc_retries_++;
  if (is_remote) {
    remote_rpc_retries_++;
  }
  CountRpcRetry(is_remote, pending);
}

void ScanMetrics::IncrementNotServingRegion(RegionMetrics* pending) {
  not_serving_region_exceptions_++;
  pending->not_serving_region_exceptions++;
}

void ScanMetrics::AddRowsScanned(int64_t rows, int64_t bytes) {
  rows_scanned_ += rows;
  bytes_scanned_ += bytes;
  UpdateCurrentRegion([rows, bytes](RegionMetrics* m) {
    m->rows_scanned += rows;
    m->bytes_scanned += bytes;
  });
}

map<string, int64_t> ScanMetrics::Get() const {
  return {
    { kRpcCalls, rpc_calls() },
    { kRemoteRpcCalls, remote_rpc_calls() },
    { kRpcRetries, rpc_retries() },
    { kRemoteRpcRetries, remote_rpc_retries() },
    { kRegionsScanned, regions_scanned() },
    { kNotServingRegionExceptions, not_serving_region_exceptions() },
    { kRowsScanned, rows_scanned() },
    { kBytesScanned, bytes_scanned() },
  };
}

map<string, ScanMetrics::RegionMetrics> ScanMetrics::GetRegionMetrics() const {
  lock_guard<mutex> l(lock_);
  return region_metrics_;
}

string ScanMetrics::ToString() const {
  string ret;
  for (const auto& e : Get()) {
    if (!ret.empty()) {
      ret += ", ";
    }
    ret += e.first + "=" + std::to_string(e.second);
  }
  return ret;
}

} // namespace client
} // namespace kvscan
