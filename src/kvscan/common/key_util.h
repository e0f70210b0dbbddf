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
// Utility functions for working with row keys.
#ifndef KVSCAN_COMMON_KEY_UTIL_H
#define KVSCAN_COMMON_KEY_UTIL_H

#include <string>

namespace kvscan {

// The empty row key. As a start key it means "from the first row", as a stop
// key or a region end key it means "to the last row".
extern const std::string kEmptyRowKey;

namespace key_util {

// Returns the smallest row key which sorts strictly after 'row'.
std::string ClosestRowAfter(const std::string& row);

// Returns true if a region whose exclusive end key is 'region_end_key' is the
// last region which may hold rows for a scan stopping at 'stop_row'.
//
// An empty region end key means the region extends to the end of the table.
// An empty stop row means the scan has no upper bound.
bool IsLastRegionForScan(const std::string& region_end_key,
                         const std::string& stop_row,
                         bool include_stop_row);

// Returns true if 'row' falls within [start_key, end_key), treating an empty
// end key as unbounded.
bool KeyInRange(const std::string& row,
                const std::string& start_key,
                const std::string& end_key);

} // namespace key_util
} // namespace kvscan

#endif // KVSCAN_COMMON_KEY_UTIL_H
