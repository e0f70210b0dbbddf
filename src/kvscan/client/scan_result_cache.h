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
// Result caches turn the rows of successive scan responses into the stream
// handed to the consumer: strictly increasing by key, without duplicates,
// even when a retried or re-opened scanner sends rows which were already
// accepted.
#ifndef KVSCAN_CLIENT_SCAN_RESULT_CACHE_H
#define KVSCAN_CLIENT_SCAN_RESULT_CACHE_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "kvscan/client/row_result.h"
#include "kvscan/common/cell.h"
#include "kvscan/gutil/macros.h"

namespace kvscan {
namespace client {

class ScanSpec;

// Base class of the result caches. Subclasses decide which rows of a
// response are ready for delivery; the base class queues them and hands
// them out in batches, honoring the batching limits and the row limit of
// the scan.
//
// A cache is used by one scan, from one continuation at a time, and is not
// thread-safe.
class ScanResultCache {
 public:
  struct Options {
    Options()
        : max_batch_rows(0),
          max_buffered_rows(0),
          limit(0) {
    }

    // Maximum number of rows per batch; zero for one batch per response.
    int32_t max_batch_rows;

    // Number of rows the client may hold queued; RowBudget() never asks the
    // server for more than the free room. Zero for no bound.
    int32_t max_buffered_rows;

    // Number of complete rows after which no more rows are handed out;
    // zero for no limit.
    int64_t limit;
  };

  explicit ScanResultCache(const Options& options);
  virtual ~ScanResultCache();

  // Accepts the rows of one response. Rows at or before the last accepted
  // position are dropped. 'is_heartbeat' is set for responses sent only to
  // show progress.
  void Accept(const std::vector<RowResult>& rows, bool is_heartbeat);

  // Moves the next batch of queued rows into 'rows'. Returns false if no row
  // is queued, or if the row limit was reached.
  bool NextBatch(std::vector<RowResult>* rows);

  // Number of rows to ask the server for in the next call, given the
  // caching of the scan. Always at least 1.
  int32_t RowBudget(int32_t caching) const;

  // Drops the fragments of a row which is still being assembled. Called
  // before a scanner is re-opened: the server sends the row again.
  virtual void Clear() = 0;

  // Returns the position at which a re-opened scanner must start so that no
  // accepted row is lost: the row key and whether the row itself must be
  // fetched again. Returns false if no row was accepted yet.
  virtual bool ResumePosition(std::string* row, bool* inclusive) const = 0;

  // Queues the row still being assembled, if any. Called once the server
  // reported that no more cells follow in the region.
  virtual void Flush() {}

  bool limit_reached() const { return limit_reached_; }

  // Number of complete rows handed out by NextBatch().
  int64_t num_complete_rows() const { return num_complete_rows_; }

  size_t num_queued_rows() const { return queue_.size(); }

 protected:
  // Appends the rows of 'rows' which are ready for delivery to 'out'.
  virtual void Filter(const std::vector<RowResult>& rows,
                      bool is_heartbeat,
                      std::vector<RowResult>* out) = 0;

  // Appends 'rows' to the delivery queue.
  void Enqueue(std::vector<RowResult>* rows);

 private:
  const Options options_;
  std::deque<RowResult> queue_;
  int64_t num_complete_rows_;
  bool limit_reached_;

  DISALLOW_COPY_AND_ASSIGN(ScanResultCache);
};

// Delivers whole rows only. Fragments of a row are buffered and assembled;
// duplicate cells sent again by a retried call are dropped.
class CompleteScanResultCache : public ScanResultCache {
 public:
  explicit CompleteScanResultCache(const Options& options);

  void Clear() override;
  bool ResumePosition(std::string* row, bool* inclusive) const override;
  void Flush() override;

  bool has_partial_row() const { return !partial_row_.empty(); }

 protected:
  void Filter(const std::vector<RowResult>& rows,
              bool is_heartbeat,
              std::vector<RowResult>* out) override;

 private:
  void AppendFragment(const RowResult& fragment);
  void EmitPartialRow(std::vector<RowResult>* out);
  void Emit(RowResult row, std::vector<RowResult>* out);

  // The row being assembled.
  RowResult partial_row_;

  // Key of the last complete row accepted.
  std::string last_row_;
  bool has_last_row_;
};

// Delivers row fragments as they arrive. A fragment which overlaps what was
// already accepted is trimmed at cell granularity.
class AllowPartialScanResultCache : public ScanResultCache {
 public:
  explicit AllowPartialScanResultCache(const Options& options);

  void Clear() override;
  bool ResumePosition(std::string* row, bool* inclusive) const override;

 protected:
  void Filter(const std::vector<RowResult>& rows,
              bool is_heartbeat,
              std::vector<RowResult>* out) override;

 private:
  void Emit(RowResult row, std::vector<RowResult>* out);

  std::string last_row_;
  bool has_last_row_;

  // Whether more cells of 'last_row_' may follow.
  bool last_row_partial_;

  // Last cell accepted for 'last_row_'.
  Cell last_cell_;
};

// Creates the cache matching the options of 'spec'.
std::unique_ptr<ScanResultCache> NewScanResultCache(const ScanSpec& spec);

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_SCAN_RESULT_CACHE_H
