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

#include "kvscan/client/region_location.h"

#include <cstdio>
#include <utility>

#include "kvscan/common/key_util.h"
#include "kvscan/util/slice.h"

using std::string;
using std::vector;

namespace kvscan {
namespace client {

namespace {

// 64-bit FNV-1a, printed as 16 hex digits.
string EncodeRegionName(const string& name) {
  uint64_t hash = 14695981039346656037ULL;
  for (char c : name) {
    hash ^= static_cast<uint8_t>(c);
    hash *= 1099511628211ULL;
  }
  char buf[17];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
  return buf;
}

} // anonymous namespace

RegionInfo::RegionInfo()
    : region_id_(0),
      replica_id_(0) {
}

RegionInfo::RegionInfo(string table, string start_key, string end_key,
                       int64_t region_id, int replica_id)
    : table_(std::move(table)),
      start_key_(std::move(start_key)),
      end_key_(std::move(end_key)),
      region_id_(region_id),
      replica_id_(replica_id) {
  region_name_ = table_ + "," + start_key_ + "," + std::to_string(region_id_);
  if (replica_id_ != 0) {
    char suffix[8];
    snprintf(suffix, sizeof(suffix), "_%04d", replica_id_);
    region_name_ += suffix;
  }
  encoded_name_ = EncodeRegionName(region_name_);
}

bool RegionInfo::ContainsRow(const string& row) const {
  return key_util::KeyInRange(row, start_key_, end_key_);
}

RegionInfo RegionInfo::ForReplica(int replica_id) const {
  return RegionInfo(table_, start_key_, end_key_, region_id_, replica_id);
}

string RegionInfo::ToString() const {
  return region_name_ + " [" + Slice(start_key_).ToDebugString() + ", " +
      Slice(end_key_).ToDebugString() + ")";
}

string RegionLocation::ToString() const {
  return region.ToString() + " on " + server + (is_remote ? "" : " (local)");
}

RegionLocations::RegionLocations(vector<RegionLocation> locations) {
  for (auto& loc : locations) {
    int id = loc.region.replica_id();
    if (id >= static_cast<int>(locations_.size())) {
      locations_.resize(id + 1);
    }
    locations_[id] = std::move(loc);
  }
}

const RegionLocation* RegionLocations::GetRegionLocation(int replica_id) const {
  if (replica_id < 0 || replica_id >= static_cast<int>(locations_.size())) {
    return nullptr;
  }
  const RegionLocation& loc = locations_[replica_id];
  if (loc.server.empty()) {
    return nullptr;
  }
  return &loc;
}

} // namespace client
} // namespace kvscan
