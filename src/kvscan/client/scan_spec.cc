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

#include "kvscan/client/scan_spec.h"

#include <gflags/gflags.h>

#include "kvscan/client/client.pb.h"
#include "kvscan/common/key_util.h"
#include "kvscan/util/slice.h"

DECLARE_int32(scanner_caching);

using std::string;

namespace kvscan {
namespace client {

const char* ConsistencyToString(ScanSpec::Consistency consistency) {
  switch (consistency) {
    case ScanSpec::Consistency::STRONG: return "STRONG";
    case ScanSpec::Consistency::TIMELINE: return "TIMELINE";
  }
  LOG(FATAL) << "unknown consistency " << static_cast<int>(consistency);
  return "UNKNOWN";
}

ScanSpec::ScanSpec()
    : include_start_row_(true),
      include_stop_row_(false),
      caching_(FLAGS_scanner_caching),
      max_result_size_(0),
      limit_(0),
      priority_(0),
      consistency_(Consistency::STRONG),
      allow_partial_results_(false),
      max_batch_rows_(0),
      max_buffered_rows_(0),
      metrics_enabled_(false),
      region_metrics_enabled_(false) {
}

ScanSpec& ScanSpec::set_start_row(const string& row, bool inclusive) {
  start_row_ = row;
  include_start_row_ = inclusive;
  return *this;
}

ScanSpec& ScanSpec::set_stop_row(const string& row, bool inclusive) {
  stop_row_ = row;
  include_stop_row_ = inclusive;
  return *this;
}

ScanSpec& ScanSpec::set_caching(int32_t rows) {
  caching_ = rows;
  return *this;
}

ScanSpec& ScanSpec::set_max_result_size(int64_t bytes) {
  max_result_size_ = bytes;
  return *this;
}

ScanSpec& ScanSpec::set_limit(int64_t rows) {
  limit_ = rows;
  return *this;
}

ScanSpec& ScanSpec::set_priority(uint32_t priority) {
  priority_ = priority;
  return *this;
}

ScanSpec& ScanSpec::AddAttribute(const string& name, const string& value) {
  attributes_[name] = value;
  return *this;
}

ScanSpec& ScanSpec::set_consistency(Consistency consistency) {
  consistency_ = consistency;
  return *this;
}

ScanSpec& ScanSpec::set_allow_partial_results(bool allow) {
  allow_partial_results_ = allow;
  return *this;
}

ScanSpec& ScanSpec::set_max_batch_rows(int32_t rows) {
  max_batch_rows_ = rows;
  return *this;
}

ScanSpec& ScanSpec::set_max_buffered_rows(int32_t rows) {
  max_buffered_rows_ = rows;
  return *this;
}

ScanSpec& ScanSpec::set_metrics_enabled(bool enabled) {
  metrics_enabled_ = enabled;
  if (!enabled) {
    region_metrics_enabled_ = false;
  }
  return *this;
}

ScanSpec& ScanSpec::set_region_metrics_enabled(bool enabled) {
  region_metrics_enabled_ = enabled;
  if (enabled) {
    metrics_enabled_ = true;
  }
  return *this;
}

void ScanSpec::Normalize() {
  if (start_row_ == boost::none) {
    start_row_ = kEmptyRowKey;
    include_start_row_ = true;
  }
  if (stop_row_ == boost::none) {
    stop_row_ = kEmptyRowKey;
    include_stop_row_ = false;
  }
}

Status ScanSpec::Validate() const {
  if (caching_ <= 0) {
    return Status::InvalidArgument("caching must be positive", std::to_string(caching_));
  }
  if (limit_ < 0) {
    return Status::InvalidArgument("limit must not be negative", std::to_string(limit_));
  }
  if (max_result_size_ < 0) {
    return Status::InvalidArgument("max result size must not be negative",
                                   std::to_string(max_result_size_));
  }
  if (max_batch_rows_ < 0 || max_buffered_rows_ < 0) {
    return Status::InvalidArgument("batching limits must not be negative");
  }
  if (start_row_ != boost::none && stop_row_ != boost::none &&
      !stop_row_->empty() && *start_row_ > *stop_row_) {
    return Status::InvalidArgument(
        "start row must not sort after stop row",
        Slice(*start_row_).ToDebugString() + " > " + Slice(*stop_row_).ToDebugString());
  }
  return Status::OK();
}

void ScanSpec::ToPB(const string& start_row, bool include_start_row, ScanPB* pb) const {
  DCHECK(normalized());
  pb->Clear();
  pb->set_start_row(start_row);
  pb->set_include_start_row(include_start_row);
  pb->set_stop_row(stop_row());
  pb->set_include_stop_row(include_stop_row_);
  if (max_result_size_ > 0) {
    pb->set_max_result_size(max_result_size_);
  }
  pb->set_allow_partial_results(allow_partial_results_);
  pb->set_consistency(consistency_ == Consistency::TIMELINE ? TIMELINE : STRONG);
  pb->set_caching(caching_);
  for (const auto& attr : attributes_) {
    rpc::NameBytesPairPB* pair = pb->add_attribute();
    pair->set_name(attr.first);
    pair->set_value(attr.second);
  }
}

string ScanSpec::ToString() const {
  string ret = "ScanSpec(";
  ret += include_start_row_ ? "[" : "(";
  ret += start_row_ == boost::none ? "<unset>" : Slice(*start_row_).ToDebugString();
  ret += ", ";
  ret += stop_row_ == boost::none ? "<unset>" : Slice(*stop_row_).ToDebugString();
  ret += include_stop_row_ ? "]" : ")";
  ret += ", caching=" + std::to_string(caching_);
  if (has_limit()) {
    ret += ", limit=" + std::to_string(limit_);
  }
  ret += ", consistency=";
  ret += ConsistencyToString(consistency_);
  if (allow_partial_results_) {
    ret += ", allow_partial";
  }
  ret += ")";
  return ret;
}

} // namespace client
} // namespace kvscan
