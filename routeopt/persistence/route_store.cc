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


#include "routeopt/persistence/route_store.h"

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "routeopt/base/logging.h"
#include "routeopt/base/protoutil.h"
#include "routeopt/base/status_macros.h"
#include "routeopt/persistence/saved_route.pb.h"

namespace route_optimization {
namespace {

constexpr absl::string_view kIdPrefix = "route-";

}  // namespace

absl::StatusOr<std::string> InMemoryRouteStore::SaveRoute(
    const SavedRoutePayload& payload, absl::string_view name,
    absl::string_view description, absl::string_view owner) {
  if (name.empty()) {
    return absl::InvalidArgumentError("A saved route needs a name");
  }
  if (owner.empty()) {
    return absl::InvalidArgumentError("A saved route needs an owner");
  }
  ASSIGN_OR_RETURN(const google::protobuf::Timestamp created_at,
                   util_time::EncodeGoogleApiProto(absl::Now()));
  absl::MutexLock lock(&mutex_);
  const int64_t sequence = next_sequence_++;
  SavedRoute& route = routes_[sequence];
  route.set_id(absl::StrCat(kIdPrefix, sequence));
  route.set_name(std::string(name));
  route.set_description(std::string(description));
  route.set_owner(std::string(owner));
  *route.mutable_payload() = payload;
  *route.mutable_created_at() = created_at;
  VLOG(1) << "Saved route " << route.id() << " (" << name << ") for "
          << owner;
  return route.id();
}

absl::StatusOr<std::vector<SavedRoute>> InMemoryRouteStore::GetSavedRoutes(
    absl::string_view search, absl::string_view owner) {
  const std::string needle = absl::AsciiStrToLower(search);
  std::vector<SavedRoute> matches;
  absl::MutexLock lock(&mutex_);
  for (const auto& [sequence, route] : routes_) {
    if (!owner.empty() && route.owner() != owner) continue;
    if (!absl::StrContains(absl::AsciiStrToLower(route.name()), needle)) {
      continue;
    }
    matches.push_back(route);
  }
  return matches;
}

absl::StatusOr<SavedRoute*> InMemoryRouteStore::FindRoute(
    absl::string_view id) {
  absl::string_view number = id;
  int64_t sequence = 0;
  if (absl::ConsumePrefix(&number, kIdPrefix) &&
      absl::SimpleAtoi(number, &sequence)) {
    const auto it = routes_.find(sequence);
    if (it != routes_.end()) return &it->second;
  }
  return absl::NotFoundError(absl::StrCat("No saved route ", id));
}

absl::Status InMemoryRouteStore::DeleteSavedRoute(absl::string_view id) {
  absl::MutexLock lock(&mutex_);
  RETURN_IF_ERROR(FindRoute(id).status());
  int64_t sequence = 0;
  CHECK(absl::SimpleAtoi(absl::StripPrefix(id, kIdPrefix), &sequence));
  routes_.erase(sequence);
  VLOG(1) << "Deleted saved route " << id;
  return absl::OkStatus();
}

absl::Status InMemoryRouteStore::ReassignSavedRoute(
    absl::string_view id, absl::string_view new_owner) {
  if (new_owner.empty()) {
    return absl::InvalidArgumentError("A saved route needs an owner");
  }
  absl::MutexLock lock(&mutex_);
  ASSIGN_OR_RETURN(SavedRoute* const route, FindRoute(id));
  route->set_owner(std::string(new_owner));
  return absl::OkStatus();
}

absl::Status InMemoryRouteStore::MarkRouteUsed(absl::string_view id) {
  ASSIGN_OR_RETURN(const google::protobuf::Timestamp now,
                   util_time::EncodeGoogleApiProto(absl::Now()));
  absl::MutexLock lock(&mutex_);
  ASSIGN_OR_RETURN(SavedRoute* const route, FindRoute(id));
  route->set_usage_count(route->usage_count() + 1);
  *route->mutable_last_used_at() = now;
  return absl::OkStatus();
}

}  // namespace route_optimization
