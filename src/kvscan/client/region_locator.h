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
#ifndef KVSCAN_CLIENT_REGION_LOCATOR_H
#define KVSCAN_CLIENT_REGION_LOCATOR_H

#include <functional>
#include <string>

#include "kvscan/client/region_location.h"
#include "kvscan/util/monotime.h"
#include "kvscan/util/status.h"

namespace kvscan {
namespace client {

typedef std::function<void(const Status& status,
                           const RegionLocation& location)> RegionLocationCallback;
typedef std::function<void(const Status& status,
                           const RegionLocations& locations)> RegionLocationsCallback;

// Resolves which server hosts the region of a table containing a row key.
// Implementations cache locations and may retry internally on stale
// metadata; the callbacks may run on any thread.
class RegionLocator {
 public:
  virtual ~RegionLocator() {}

  // Looks up replica 'replica_id' of the region containing 'row'. With
  // 'reload', any cached location is ignored. Fails with TimedOut if the
  // location cannot be resolved before 'deadline'.
  virtual void LocateRegion(const std::string& table,
                            const std::string& row,
                            int replica_id,
                            bool reload,
                            const MonoTime& deadline,
                            const RegionLocationCallback& callback) = 0;

  // Looks up the locations of every replica of the region containing 'row'.
  virtual void LocateRegionReplicas(const std::string& table,
                                    const std::string& row,
                                    bool reload,
                                    const MonoTime& deadline,
                                    const RegionLocationsCallback& callback) = 0;

  // Drops 'location' from the cache after the server reported that it no
  // longer serves the region.
  virtual void InvalidateCachedLocation(const RegionLocation& location) = 0;
};

} // namespace client
} // namespace kvscan

#endif // KVSCAN_CLIENT_REGION_LOCATOR_H
