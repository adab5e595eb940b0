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


#ifndef ROUTEOPT_COST_COST_MODEL_H_
#define ROUTEOPT_COST_COST_MODEL_H_

#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// Fuel burnt over `distance_km`, in liters (kWh for electric vehicles): the
// per-km consumption of the fuel type, scaled by the time-of-day traffic
// multiplier and by the road condition.
double FuelConsumption(double distance_km, FuelType fuel_type,
                       const RealTimeContext& context,
                       const CostParameters& params);

// Operating cost of driving `route` with a vehicle of the given fuel type
// under `context`. The total is always the sum of the five components and the
// savings against the un-optimized baseline are never negative.
CostBreakdown ComputeCost(const CandidateRoute& route, FuelType fuel_type,
                          const RealTimeContext& context,
                          const Constraints& constraints,
                          const CostParameters& params);

}  // namespace route_optimization

#endif  // ROUTEOPT_COST_COST_MODEL_H_
