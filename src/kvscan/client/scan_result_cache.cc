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

#include "kvscan/client/scan_result_cache.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "kvscan/client/scan_spec.h"
#include "kvscan/util/slice.h"

using std::string;
using std::unique_ptr;
using std::vector;

namespace kvscan {
namespace client {

ScanResultCache::ScanResultCache(const Options& options)
    : options_(options),
      num_complete_rows_(0),
      limit_reached_(false) {
}

ScanResultCache::~ScanResultCache() {
}

void ScanResultCache::Accept(const vector<RowResult>& rows, bool is_heartbeat) {
  vector<RowResult> ready;
  Filter(rows, is_heartbeat, &ready);
  Enqueue(&ready);
}

void ScanResultCache::Enqueue(vector<RowResult>* rows) {
  for (auto& row : *rows) {
    queue_.emplace_back(std::move(row));
  }
  rows->clear();
}

bool ScanResultCache::NextBatch(vector<RowResult>* rows) {
  rows->clear();
  if (limit_reached_) {
    queue_.clear();
    return false;
  }
  while (!queue_.empty()) {
    if (options_.max_batch_rows > 0 &&
        rows->size() >= static_cast<size_t>(options_.max_batch_rows)) {
      break;
    }
    RowResult row = std::move(queue_.front());
    queue_.pop_front();
    bool complete = !row.partial();
    rows->emplace_back(std::move(row));
    if (complete) {
      num_complete_rows_++;
      if (options_.limit > 0 && num_complete_rows_ >= options_.limit) {
        limit_reached_ = true;
        queue_.clear();
        break;
      }
    }
  }
  return !rows->empty();
}

int32_t ScanResultCache::RowBudget(int32_t caching) const {
  int64_t budget = caching;
  if (options_.max_buffered_rows > 0) {
    budget = std::min<int64_t>(budget, options_.max_buffered_rows -
                               static_cast<int64_t>(queue_.size()));
  }
  if (options_.limit > 0) {
    budget = std::min<int64_t>(budget, options_.limit - num_complete_rows_ -
                               static_cast<int64_t>(queue_.size()));
  }
  return static_cast<int32_t>(std::max<int64_t>(budget, 1));
}

CompleteScanResultCache::CompleteScanResultCache(const Options& options)
    : ScanResultCache(options),
      has_last_row_(false) {
}

void CompleteScanResultCache::Filter(const vector<RowResult>& rows,
                                     bool /* is_heartbeat */,
                                     vector<RowResult>* out) {
  for (const RowResult& r : rows) {
    if (r.empty()) {
      continue;
    }
    if (has_last_row_ && r.row() <= last_row_) {
      VLOG(2) << "Dropping already delivered row " << Slice(r.row()).ToDebugString();
      continue;
    }
    if (!partial_row_.empty()) {
      const string& assembling = partial_row_.row();
      if (r.row() < assembling) {
        VLOG(2) << "Dropping stale fragment of row " << Slice(r.row()).ToDebugString();
        continue;
      }
      if (r.row() == assembling) {
        AppendFragment(r);
        if (!r.partial()) {
          EmitPartialRow(out);
        }
        continue;
      }
      // A new row started, so the one being assembled has no more cells.
      EmitPartialRow(out);
    }
    if (r.partial()) {
      partial_row_ = r;
    } else {
      Emit(r, out);
    }
  }
}

void CompleteScanResultCache::AppendFragment(const RowResult& fragment) {
  vector<Cell>* cells = partial_row_.mutable_cells();
  for (const Cell& cell : fragment.cells()) {
    if (CompareCellsInRow(cell, cells->back()) > 0) {
      cells->push_back(cell);
    }
  }
}

void CompleteScanResultCache::EmitPartialRow(vector<RowResult>* out) {
  RowResult row = std::move(partial_row_);
  partial_row_ = RowResult();
  Emit(std::move(row), out);
}

void CompleteScanResultCache::Emit(RowResult row, vector<RowResult>* out) {
  row.set_partial(false);
  last_row_ = row.row();
  has_last_row_ = true;
  out->emplace_back(std::move(row));
}

void CompleteScanResultCache::Clear() {
  partial_row_ = RowResult();
}

void CompleteScanResultCache::Flush() {
  if (partial_row_.empty()) {
    return;
  }
  vector<RowResult> ready;
  EmitPartialRow(&ready);
  Enqueue(&ready);
}

bool CompleteScanResultCache::ResumePosition(string* row, bool* inclusive) const {
  if (!has_last_row_) {
    return false;
  }
  *row = last_row_;
  *inclusive = false;
  return true;
}

AllowPartialScanResultCache::AllowPartialScanResultCache(const Options& options)
    : ScanResultCache(options),
      has_last_row_(false),
      last_row_partial_(false) {
}

void AllowPartialScanResultCache::Filter(const vector<RowResult>& rows,
                                         bool /* is_heartbeat */,
                                         vector<RowResult>* out) {
  for (const RowResult& r : rows) {
    if (r.empty()) {
      continue;
    }
    if (has_last_row_) {
      int c = r.row().compare(last_row_);
      if (c < 0 || (c == 0 && !last_row_partial_)) {
        VLOG(2) << "Dropping already delivered row " << Slice(r.row()).ToDebugString();
        continue;
      }
      if (c == 0) {
        vector<Cell> fresh;
        for (const Cell& cell : r.cells()) {
          if (CompareCellsInRow(cell, last_cell_) > 0) {
            fresh.push_back(cell);
          }
        }
        if (fresh.empty()) {
          if (!r.partial()) {
            last_row_partial_ = false;
          }
          continue;
        }
        Emit(RowResult(std::move(fresh), r.partial()), out);
        continue;
      }
    }
    Emit(r, out);
  }
}

void AllowPartialScanResultCache::Emit(RowResult row, vector<RowResult>* out) {
  last_row_ = row.row();
  has_last_row_ = true;
  last_row_partial_ = row.partial();
  last_cell_ = row.cells().back();
  out->emplace_back(std::move(row));
}

void AllowPartialScanResultCache::Clear() {
}

bool AllowPartialScanResultCache::ResumePosition(string* row, bool* inclusive) const {
  if (!has_last_row_) {
    return false;
  }
  *row = last_row_;
  *inclusive = last_row_partial_;
  return true;
}

unique_ptr<ScanResultCache> NewScanResultCache(const ScanSpec& spec) {
  ScanResultCache::Options opts;
  opts.max_batch_rows = spec.max_batch_rows();
  opts.max_buffered_rows = spec.max_buffered_rows();
  opts.limit = spec.limit();
  if (spec.allow_partial_results()) {
    return unique_ptr<ScanResultCache>(new AllowPartialScanResultCache(opts));
  }
  return unique_ptr<ScanResultCache>(new CompleteScanResultCache(opts));
}

} // namespace client
} // namespace kvscan
