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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kvscan/client/row_result.h"
#include "kvscan/client/scan_spec.h"
#include "kvscan/common/cell.h"
#include "kvscan/util/test_macros.h"
#include "kvscan/util/test_util.h"

using std::string;
using std::unique_ptr;
using std::vector;

namespace kvscan {
namespace client {

namespace {

Cell MakeCell(const string& row, const string& qualifier) {
  return Cell(row, "f", qualifier, 1, row + "/" + qualifier);
}

// A row of cells with qualifiers q[first, last).
RowResult MakeRow(const string& row, int first, int last, bool partial = false) {
  vector<Cell> cells;
  for (int i = first; i < last; i++) {
    cells.push_back(MakeCell(row, "q" + std::to_string(i)));
  }
  return RowResult(std::move(cells), partial);
}

// Row keys and cell counts of 'rows', as "a:2,b:1" (a '+' marks a fragment).
string Describe(const vector<RowResult>& rows) {
  string ret;
  for (const auto& r : rows) {
    if (!ret.empty()) {
      ret += ",";
    }
    ret += r.row() + ":" + std::to_string(r.cells().size());
    if (r.partial()) {
      ret += "+";
    }
  }
  return ret;
}

string DrainAll(ScanResultCache* cache) {
  vector<RowResult> all;
  vector<RowResult> batch;
  while (cache->NextBatch(&batch)) {
    all.insert(all.end(), batch.begin(), batch.end());
  }
  return Describe(all);
}

} // anonymous namespace

class ScanResultCacheTest : public KvScanTest {
};

TEST_F(ScanResultCacheTest, TestCompleteRowsPassThrough) {
  CompleteScanResultCache cache((ScanResultCache::Options()));
  cache.Accept({ MakeRow("a", 0, 2), MakeRow("b", 0, 1) }, false);
  vector<RowResult> batch;
  ASSERT_TRUE(cache.NextBatch(&batch));
  ASSERT_EQ("a:2,b:1", Describe(batch));
  ASSERT_FALSE(cache.NextBatch(&batch));
  ASSERT_EQ(2, cache.num_complete_rows());
}

TEST_F(ScanResultCacheTest, TestDuplicateRowsDropped) {
  CompleteScanResultCache cache((ScanResultCache::Options()));
  cache.Accept({ MakeRow("a", 0, 1), MakeRow("b", 0, 1) }, false);
  // A replayed response resends rows already accepted.
  cache.Accept({ MakeRow("a", 0, 1), MakeRow("b", 0, 1), MakeRow("c", 0, 1) }, false);
  ASSERT_EQ("a:1,b:1,c:1", DrainAll(&cache));

  string row;
  bool inclusive;
  ASSERT_TRUE(cache.ResumePosition(&row, &inclusive));
  ASSERT_EQ("c", row);
  ASSERT_FALSE(inclusive);
}

TEST_F(ScanResultCacheTest, TestFragmentsAssembled) {
  CompleteScanResultCache cache((ScanResultCache::Options()));
  cache.Accept({ MakeRow("a", 0, 1), MakeRow("b", 0, 2, true) }, false);
  ASSERT_TRUE(cache.has_partial_row());
  ASSERT_EQ("a:1", DrainAll(&cache));

  // The next response repeats one cell of the fragment, then completes it.
  cache.Accept({ MakeRow("b", 1, 4) }, false);
  ASSERT_FALSE(cache.has_partial_row());
  ASSERT_EQ("b:4", DrainAll(&cache));
}

TEST_F(ScanResultCacheTest, TestFragmentEndsWhenNextRowStarts) {
  CompleteScanResultCache cache((ScanResultCache::Options()));
  cache.Accept({ MakeRow("a", 0, 2, true) }, false);
  cache.Accept({ MakeRow("b", 0, 1) }, false);
  ASSERT_EQ("a:2,b:1", DrainAll(&cache));
}

TEST_F(ScanResultCacheTest, TestFlushAtRegionEnd) {
  CompleteScanResultCache cache((ScanResultCache::Options()));
  cache.Accept({ MakeRow("z", 0, 3, true) }, false);
  ASSERT_EQ("", DrainAll(&cache));
  cache.Flush();
  ASSERT_EQ("z:3", DrainAll(&cache));
}

TEST_F(ScanResultCacheTest, TestClearDropsFragment) {
  CompleteScanResultCache cache((ScanResultCache::Options()));
  cache.Accept({ MakeRow("a", 0, 1), MakeRow("b", 0, 2, true) }, false);
  cache.Clear();
  ASSERT_FALSE(cache.has_partial_row());
  string row;
  bool inclusive;
  ASSERT_TRUE(cache.ResumePosition(&row, &inclusive));
  ASSERT_EQ("a", row);
  ASSERT_FALSE(inclusive);
  // The re-opened scanner sends the whole row again.
  cache.Accept({ MakeRow("b", 0, 3) }, false);
  ASSERT_EQ("a:1,b:3", DrainAll(&cache));
}

TEST_F(ScanResultCacheTest, TestHeartbeatDeliversNothing) {
  CompleteScanResultCache cache((ScanResultCache::Options()));
  string row;
  bool inclusive;
  ASSERT_FALSE(cache.ResumePosition(&row, &inclusive));
  cache.Accept({}, true);
  vector<RowResult> batch;
  ASSERT_FALSE(cache.NextBatch(&batch));
}

TEST_F(ScanResultCacheTest, TestPartialCacheTrimsOverlap) {
  AllowPartialScanResultCache cache((ScanResultCache::Options()));
  cache.Accept({ MakeRow("a", 0, 2, true) }, false);
  string row;
  bool inclusive;
  ASSERT_TRUE(cache.ResumePosition(&row, &inclusive));
  ASSERT_EQ("a", row);
  ASSERT_TRUE(inclusive);

  // The re-opened scanner starts over at row "a".
  cache.Accept({ MakeRow("a", 0, 3), MakeRow("b", 0, 1) }, false);
  ASSERT_EQ("a:2+,a:1,b:1", DrainAll(&cache));
  ASSERT_EQ(2, cache.num_complete_rows());

  // Everything in this response was already seen.
  cache.Accept({ MakeRow("a", 0, 3), MakeRow("b", 0, 1) }, false);
  ASSERT_EQ("", DrainAll(&cache));
  ASSERT_TRUE(cache.ResumePosition(&row, &inclusive));
  ASSERT_EQ("b", row);
  ASSERT_FALSE(inclusive);
}

TEST_F(ScanResultCacheTest, TestBatchLimit) {
  ScanResultCache::Options opts;
  opts.max_batch_rows = 2;
  CompleteScanResultCache cache(opts);
  cache.Accept({ MakeRow("a", 0, 1), MakeRow("b", 0, 1), MakeRow("c", 0, 1) }, false);
  vector<RowResult> batch;
  ASSERT_TRUE(cache.NextBatch(&batch));
  ASSERT_EQ("a:1,b:1", Describe(batch));
  ASSERT_TRUE(cache.NextBatch(&batch));
  ASSERT_EQ("c:1", Describe(batch));
  ASSERT_FALSE(cache.NextBatch(&batch));
}

TEST_F(ScanResultCacheTest, TestRowLimit) {
  ScanResultCache::Options opts;
  opts.limit = 3;
  CompleteScanResultCache cache(opts);
  ASSERT_EQ(3, cache.RowBudget(100));
  cache.Accept({ MakeRow("a", 0, 1), MakeRow("b", 0, 1) }, false);
  ASSERT_EQ(1, cache.RowBudget(100));
  ASSERT_EQ("a:1,b:1", DrainAll(&cache));
  ASSERT_FALSE(cache.limit_reached());

  cache.Accept({ MakeRow("c", 0, 1), MakeRow("d", 0, 1) }, false);
  ASSERT_EQ("c:1", DrainAll(&cache));
  ASSERT_TRUE(cache.limit_reached());
  ASSERT_EQ(0U, cache.num_queued_rows());
  ASSERT_EQ(1, cache.RowBudget(100));
}

TEST_F(ScanResultCacheTest, TestBufferedRowsBoundRowBudget) {
  ScanResultCache::Options opts;
  opts.max_buffered_rows = 2;
  CompleteScanResultCache cache(opts);
  ASSERT_EQ(2, cache.RowBudget(10));
  cache.Accept({ MakeRow("a", 0, 1) }, false);
  ASSERT_EQ(1, cache.RowBudget(10));
  cache.Accept({ MakeRow("b", 0, 1) }, false);
  ASSERT_EQ(2U, cache.num_queued_rows());
  // Full: the next call still asks for one row.
  ASSERT_EQ(1, cache.RowBudget(10));
  DrainAll(&cache);
  ASSERT_EQ(2, cache.RowBudget(10));
}

TEST_F(ScanResultCacheTest, TestNewScanResultCache) {
  ScanSpec spec;
  unique_ptr<ScanResultCache> cache = NewScanResultCache(spec);
  ASSERT_TRUE(dynamic_cast<CompleteScanResultCache*>(cache.get()) != nullptr);
  spec.set_allow_partial_results(true);
  cache = NewScanResultCache(spec);
  ASSERT_TRUE(dynamic_cast<AllowPartialScanResultCache*>(cache.get()) != nullptr);
}

} // namespace client
} // namespace kvscan
