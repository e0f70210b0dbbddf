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
#ifndef KVSCAN_CLIENT_SCAN_SPEC_H
#define KVSCAN_CLIENT_SCAN_SPEC_H

#include <cstdint>
#include <map>
#include <string>

#include <boost/optional/optional.hpp>
#include <glog/logging.h>

#include "kvscan/gutil/macros.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace client {

class ScanPB;

// Describes one logical range scan: the key range, the batching hints and the
// read options. Setters return the scan spec so that calls can be chained:
//
//   ScanSpec spec;
//   spec.set_start_row("a").set_stop_row("z").set_caching(2);
//
// A bound which was never set means "open end". Normalize() replaces unset
// bounds by the empty row key so that, once normalized, both bounds are
// always present.
class ScanSpec {
 public:
  enum class Consistency {
    // Reads are served by the primary replica only.
    STRONG,
    // Reads may be served by a secondary replica when the primary is slow.
    TIMELINE,
  };

  ScanSpec();

  ScanSpec& set_start_row(const std::string& row, bool inclusive = true);
  ScanSpec& set_stop_row(const std::string& row, bool inclusive = false);

  // Number of rows to request per RPC.
  ScanSpec& set_caching(int32_t rows);

  // Maximum response size in bytes hinted to the server; zero for no hint.
  ScanSpec& set_max_result_size(int64_t bytes);

  // Stop the scan after this many complete rows; zero means no limit.
  ScanSpec& set_limit(int64_t rows);

  ScanSpec& set_priority(uint32_t priority);

  // Opaque request attribute sent with every RPC of the scan.
  ScanSpec& AddAttribute(const std::string& name, const std::string& value);

  ScanSpec& set_consistency(Consistency consistency);

  // Deliver row fragments as soon as they arrive instead of reassembling
  // whole rows.
  ScanSpec& set_allow_partial_results(bool allow);

  // Maximum number of rows handed to the consumer per callback; zero means
  // one callback per response.
  ScanSpec& set_max_batch_rows(int32_t rows);

  // Maximum number of rows buffered on the client; the scan stops fetching
  // while that many rows wait for delivery. Zero means unbounded.
  ScanSpec& set_max_buffered_rows(int32_t rows);

  ScanSpec& set_metrics_enabled(bool enabled);

  // Also keep counters per visited region. Implies set_metrics_enabled().
  ScanSpec& set_region_metrics_enabled(bool enabled);

  // Replaces unset bounds by the empty row key. Idempotent.
  void Normalize();

  // Returns InvalidArgument if the options are inconsistent.
  Status Validate() const WARN_UNUSED_RESULT;

  // Fills the scan options sent when opening a scanner, starting at
  // 'start_row'. REQUIRES: Normalize() was called.
  void ToPB(const std::string& start_row, bool include_start_row, ScanPB* pb) const;

  bool normalized() const {
    return start_row_ != boost::none && stop_row_ != boost::none;
  }

  // REQUIRES: normalized() or the bound was set.
  const std::string& start_row() const {
    CHECK(start_row_ != boost::none);
    return *start_row_;
  }
  bool include_start_row() const { return include_start_row_; }

  const std::string& stop_row() const {
    CHECK(stop_row_ != boost::none);
    return *stop_row_;
  }
  bool include_stop_row() const { return include_stop_row_; }

  int32_t caching() const { return caching_; }
  int64_t max_result_size() const { return max_result_size_; }

  bool has_limit() const { return limit_ > 0; }
  int64_t limit() const { return limit_; }

  uint32_t priority() const { return priority_; }
  const std::map<std::string, std::string>& attributes() const { return attributes_; }
  Consistency consistency() const { return consistency_; }
  bool allow_partial_results() const { return allow_partial_results_; }
  int32_t max_batch_rows() const { return max_batch_rows_; }
  int32_t max_buffered_rows() const { return max_buffered_rows_; }
  bool metrics_enabled() const { return metrics_enabled_; }
  bool region_metrics_enabled() const { return region_metrics_enabled_; }

  std::string ToString() const;

 private:
  boost::optional<std::string> start_row_;
  bool include_start_row_;
  boost::optional<std::string> stop_row_;
  bool include_stop_row_;
  int32_t caching_;
  int64_t max_result_size_;
  int64_t limit_;
  uint32_t priority_;
  std::map<std::string, std::string> attributes_;
  Consistency consistency_;
  bool allow_partial_results_;
  int32_t max_batch_rows_;
  int32_t max_buffered_rows_;
  bool metrics_enabled_;
  bool region_metrics_enabled_;
};

const char* ConsistencyToString(ScanSpec::Consistency consistency);

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_SPEC_H
