// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef ROUTEOPT_PERSISTENCE_ROUTE_STORE_H_
#define ROUTEOPT_PERSISTENCE_ROUTE_STORE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "routeopt/persistence/saved_route.pb.h"

namespace route_optimization {

// Storage of saved routes. Implementations must be thread-safe: every
// operation is atomic on its own.
class RouteStore {
 public:
  virtual ~RouteStore() = default;

  // Stores a new route and returns its id. Returns InvalidArgument when the
  // name or the owner is empty.
  virtual absl::StatusOr<std::string> SaveRoute(
      const SavedRoutePayload& payload, absl::string_view name,
      absl::string_view description, absl::string_view owner) = 0;

  // Returns the routes whose name contains `search`, ignoring case, and that
  // belong to `owner`, in the order they were saved. An empty `search` or
  // `owner` matches every route.
  virtual absl::StatusOr<std::vector<SavedRoute>> GetSavedRoutes(
      absl::string_view search, absl::string_view owner) = 0;

  // The operations below return NotFound for an unknown id.
  virtual absl::Status DeleteSavedRoute(absl::string_view id) = 0;
  virtual absl::Status ReassignSavedRoute(absl::string_view id,
                                          absl::string_view new_owner) = 0;
  // Increments the usage counter of the route and records the time of use.
  virtual absl::Status MarkRouteUsed(absl::string_view id) = 0;
};

// A RouteStore keeping its routes in memory, for tests and single process
// deployments.
class InMemoryRouteStore : public RouteStore {
 public:
  InMemoryRouteStore() = default;

  InMemoryRouteStore(const InMemoryRouteStore&) = delete;
  InMemoryRouteStore& operator=(const InMemoryRouteStore&) = delete;

  absl::StatusOr<std::string> SaveRoute(const SavedRoutePayload& payload,
                                        absl::string_view name,
                                        absl::string_view description,
                                        absl::string_view owner) override;
  absl::StatusOr<std::vector<SavedRoute>> GetSavedRoutes(
      absl::string_view search, absl::string_view owner) override;
  absl::Status DeleteSavedRoute(absl::string_view id) override;
  absl::Status ReassignSavedRoute(absl::string_view id,
                                  absl::string_view new_owner) override;
  absl::Status MarkRouteUsed(absl::string_view id) override;

 private:
  // Returns the route with the given id, or NotFound.
  absl::StatusOr<SavedRoute*> FindRoute(absl::string_view id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  absl::Mutex mutex_;
  // Keyed by save sequence number.
  absl::btree_map<int64_t, SavedRoute> routes_ ABSL_GUARDED_BY(mutex_);
  int64_t next_sequence_ ABSL_GUARDED_BY(mutex_) = 1;
};

}  // namespace route_optimization

#endif  // ROUTEOPT_PERSISTENCE_ROUTE_STORE_H_
