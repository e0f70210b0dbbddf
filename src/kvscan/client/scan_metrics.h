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
#ifndef KVSCAN_CLIENT_SCAN_METRICS_H
#define KVSCAN_CLIENT_SCAN_METRICS_H

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "kvscan/gutil/macros.h"

namespace kvscan {
namespace client {

// Counters of one scan. The scan increments them from whichever thread runs
// its continuations; readers may snapshot them at any time, typically once
// the scan finished.
//
// With region metrics enabled, every increment is also recorded against the
// region currently being scanned.
//
// This class is thread-safe.
class ScanMetrics {
 public:
  // Counter names, as found in the maps returned by Get().
  static const char* const kRpcCalls;
  static const char* const kRemoteRpcCalls;
  static const char* const kRpcRetries;
  static const char* const kRemoteRpcRetries;
  static const char* const kRegionsScanned;
  static const char* const kNotServingRegionExceptions;
  static const char* const kRowsScanned;
  static const char* const kBytesScanned;

  // The counters kept for one region.
  struct RegionMetrics {
    RegionMetrics()
        : rpc_calls(0),
          remote_rpc_calls(0),
          rpc_retries(0),
          remote_rpc_retries(0),
          not_serving_region_exceptions(0),
          rows_scanned(0),
          bytes_scanned(0) {
    }

    std::map<std::string, int64_t> Get() const;

    std::string encoded_region_name;
    std::string server_name;
    int64_t rpc_calls;
    int64_t remote_rpc_calls;
    int64_t rpc_retries;
    int64_t remote_rpc_retries;
    int64_t not_serving_region_exceptions;
    int64_t rows_scanned;
    int64_t bytes_scanned;
  };

  explicit ScanMetrics(bool region_metrics_enabled);

  bool region_metrics_enabled() const { return region_metrics_enabled_; }

  // Counts a newly visited region. With region metrics enabled, also detaches
  // the current region context; the next InitRegionInfo() attaches the new one.
  void MoveToNextRegion();

  // Attaches the region being scanned, creating its counters on first use,
  // and books the calls collected in 'pending' against it. No-op for the
  // region counters unless region metrics are enabled.
  void InitRegionInfo(const std::string& encoded_region_name,
                      const std::string& server_name,
                      const RegionMetrics& pending);
  void InitRegionInfo(const std::string& encoded_region_name,
                      const std::string& server_name) {
    InitRegionInfo(encoded_region_name, server_name, RegionMetrics());
  }

  void IncrementRpcCall(bool is_remote);
  void IncrementRpcRetry(bool is_remote);
  void IncrementNotServingRegion();

  // Variants for calls sent while the scan has not settled on a region yet,
  // such as the open calls of a replica race. They move the scan-wide
  // counters and record the call in 'pending' instead of the current region.
  void IncrementRpcCall(bool is_remote, RegionMetrics* pending);
  void IncrementRpcRetry(bool is_remote, RegionMetrics* pending);
  void IncrementNotServingRegion(RegionMetrics* pending);
  void AddRowsScanned(int64_t rows, int64_t bytes);

  int64_t rpc_calls() const { return rpc_calls_.load(); }
  int64_t remote_rpc_calls() const { return remote_rpc_calls_.load(); }
  int64_t rpc_retries() const { return rpc_retries_.load(); }
  int64_t remote_rpc_retries() const { return remote_rpc_retries_.load(); }
  int64_t regions_scanned() const { return regions_scanned_.load(); }
  int64_t not_serving_region_exceptions() const {
    return not_serving_region_exceptions_.load();
  }
  int64_t rows_scanned() const { return rows_scanned_.load(); }
  int64_t bytes_scanned() const { return bytes_scanned_.load(); }

  // Returns a copy of the scan-wide counters.
  std::map<std::string, int64_t> Get() const;

  // Returns a copy of the per-region counters, keyed by encoded region name.
  std::map<std::string, RegionMetrics> GetRegionMetrics() const;

  std::string ToString() const;

 private:
  // Applies 'fn' to the counters of the current region, if any.
  template<class F>
  void UpdateCurrentRegion(const F& fn);

  const bool region_metrics_enabled_;

  std::atomic<int64_t> rpc_calls_;
  std::atomic<int64_t> remote_rpc_calls_;
  std::atomic<int64_t> rpc_retries_;
  std::atomic<int64_t> remote_rpc_retries_;
  std::atomic<int64_t> regions_scanned_;
  std::atomic<int64_t> not_serving_region_exceptions_;
  std::atomic<int64_t> rows_scanned_;
  std::atomic<int64_t> bytes_scanned_;

  // Protects the per-region state below.
  mutable std::mutex lock_;
  std::map<std::string, RegionMetrics> region_metrics_;
  std::string current_region_;

  DISALLOW_COPY_AND_ASSIGN(ScanMetrics);
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_METRICS_H
