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


// Conversion of enriched routes to and from their persisted form.

#ifndef ROUTEOPT_PERSISTENCE_ROUTE_SERIALIZER_H_
#define ROUTEOPT_PERSISTENCE_ROUTE_SERIALIZER_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "routeopt/model/types.h"
#include "routeopt/persistence/saved_route.pb.h"

namespace route_optimization {

absl::StatusOr<SavedRoutePayload> ToSavedRoutePayload(
    absl::string_view request_id, const RouteOutcome& outcome);

// Rebuilds the route of a payload. The cost and sustainability of the result
// only carry the totals kept in the payload.
absl::StatusOr<RouteOutcome> FromSavedRoutePayload(
    const SavedRoutePayload& payload);

}  // namespace route_optimization

#endif  // ROUTEOPT_PERSISTENCE_ROUTE_SERIALIZER_H_
