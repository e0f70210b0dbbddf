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

#include "kvscan/common/key_util.h"

#include "kvscan/util/slice.h"

using std::string;

namespace kvscan {

const string kEmptyRowKey;

namespace key_util {

string ClosestRowAfter(const string& row) {
  string next(row);
  next.push_back('\0');
  return next;
}

bool IsLastRegionForScan(const string& region_end_key,
                         const string& stop_row,
                         bool include_stop_row) {
  if (region_end_key.empty()) {
    return true;
  }
  if (stop_row.empty()) {
    return false;
  }
  int c = Slice(region_end_key).compare(Slice(stop_row));
  // A stop row equal to the region end key only lives in the next region if
  // the scan includes it.
  return c > 0 || (c == 0 && !include_stop_row);
}

bool KeyInRange(const string& row,
                const string& start_key,
                const string& end_key) {
  if (Slice(row).compare(Slice(start_key)) < 0) {
    return false;
  }
  return end_key.empty() || Slice(row).compare(Slice(end_key)) < 0;
}

} // namespace key_util
} // namespace kvscan
