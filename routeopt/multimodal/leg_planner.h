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


#ifndef ROUTEOPT_MULTIMODAL_LEG_PLANNER_H_
#define ROUTEOPT_MULTIMODAL_LEG_PLANNER_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// Leg templates in evaluation order.
inline constexpr LegTemplate kAllLegTemplates[] = {
    LegTemplate::kRoad,   LegTemplate::kSea,     LegTemplate::kAir,
    LegTemplate::kSeaAir, LegTemplate::kRoadSea, LegTemplate::kRail};

// Service booked for `cargo` on a leg of the given mode.
ServiceType SelectServiceType(TransportMode mode, const CargoProfile& cargo,
                              const MultimodalParameters& params);

// Builds the leg sequence of one template for `shipment`. Main-haul distances
// are the great-circle distance scaled by the circuity factor of the mode;
// road feeders to and from terminals have a fixed length. Terminals are
// placed at the shipment end points, except for the transshipment points of
// the combined templates which lie on the great circle.
absl::StatusOr<MultimodalRoute> BuildMultimodalRoute(
    const Shipment& shipment, LegTemplate route_template,
    const MultimodalParameters& params);

// Builds one route per template of kAllLegTemplates, unranked. Returns an
// InvalidArgument error for negative cargo or identical end points.
absl::StatusOr<std::vector<MultimodalRoute>> PlanMultimodalRoutes(
    const Shipment& shipment, const MultimodalParameters& params);

// Checks that legs are numbered 1, 2, ... and that each leg starts where the
// previous one ends.
absl::Status ValidateLegSequence(const MultimodalRoute& route);

}  // namespace route_optimization

#endif  // ROUTEOPT_MULTIMODAL_LEG_PLANNER_H_
