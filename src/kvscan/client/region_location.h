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
#ifndef KVSCAN_CLIENT_REGION_LOCATION_H
#define KVSCAN_CLIENT_REGION_LOCATION_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace kvscan {
namespace client {

// Identity and key range of one region replica.
//
// The region name is "<table>,<start key>,<region id>", with a
// "_<replica id>" suffix for secondary replicas. The encoded name is a
// short printable digest of the name, used to key per-region metrics.
class RegionInfo {
 public:
  RegionInfo();
  RegionInfo(std::string table, std::string start_key, std::string end_key,
             int64_t region_id, int replica_id = 0);

  const std::string& table() const { return table_; }

  // Inclusive start key; empty for the first region of the table.
  const std::string& start_key() const { return start_key_; }

  // Exclusive end key; empty for the last region of the table.
  const std::string& end_key() const { return end_key_; }

  int64_t region_id() const { return region_id_; }
  int replica_id() const { return replica_id_; }
  bool is_default_replica() const { return replica_id_ == 0; }

  const std::string& region_name() const { return region_name_; }
  const std::string& encoded_name() const { return encoded_name_; }

  bool ContainsRow(const std::string& row) const;

  // Returns the info of replica 'replica_id' of the same region.
  RegionInfo ForReplica(int replica_id) const;

  std::string ToString() const;

 private:
  std::string table_;
  std::string start_key_;
  std::string end_key_;
  int64_t region_id_;
  int replica_id_;
  std::string region_name_;
  std::string encoded_name_;
};

// Where one region replica is served.
struct RegionLocation {
  RegionLocation() : is_remote(true) {}
  RegionLocation(RegionInfo region, std::string server, bool is_remote)
      : region(std::move(region)),
        server(std::move(server)),
        is_remote(is_remote) {
  }

  // True if the location was reached through a secondary replica.
  bool via_replica() const { return !region.is_default_replica(); }

  std::string ToString() const;

  RegionInfo region;

  // "host:port" of the serving region server.
  std::string server;

  // Whether the server runs on another host than this client. Calls to
  // remote servers are counted separately in the scan metrics.
  bool is_remote;
};

// The locations of all the replicas of one region, indexed by replica id.
class RegionLocations {
 public:
  RegionLocations() {}
  explicit RegionLocations(std::vector<RegionLocation> locations);

  // Returns nullptr if there is no location for 'replica_id'.
  const RegionLocation* GetRegionLocation(int replica_id) const;

  // The location of the primary replica, or nullptr.
  const RegionLocation* GetDefault() const { return GetRegionLocation(0); }

  size_t size() const { return locations_.size(); }
  bool empty() const { return locations_.empty(); }
  const std::vector<RegionLocation>& locations() const { return locations_; }

 private:
  std::vector<RegionLocation> locations_;
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_REGION_LOCATION_H
