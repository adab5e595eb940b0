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


#include "routeopt/cost/cost_model.h"

#include "absl/time/time.h"
#include "routeopt/base/logging.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

double RoadConditionFuelMultiplier(RoadCondition condition,
                                   const CostParameters& params) {
  switch (condition) {
    case RoadCondition::kDry:
      return 1.0;
    case RoadCondition::kWet:
      return params.wet_fuel_multiplier();
    case RoadCondition::kIcy:
      return params.icy_fuel_multiplier();
    case RoadCondition::kSnowy:
      return params.snowy_fuel_multiplier();
  }
  return 1.0;
}

}  // namespace

double FuelConsumption(double distance_km, FuelType fuel_type,
                       const RealTimeContext& context,
                       const CostParameters& params) {
  return distance_km * FuelTypeRate(params.consumption_per_km(), fuel_type) *
         context.time_factors.traffic_multiplier *
         RoadConditionFuelMultiplier(context.weather.road_condition, params);
}

CostBreakdown ComputeCost(const CandidateRoute& route, FuelType fuel_type,
                          const RealTimeContext& context,
                          const Constraints& constraints,
                          const CostParameters& params) {
  CostBreakdown cost;
  cost.fuel_consumption =
      FuelConsumption(route.total_distance_km, fuel_type, context, params);
  cost.fuel_cost =
      cost.fuel_consumption * context.fuel_prices.PriceFor(fuel_type);
  cost.driver_cost =
      absl::ToDoubleHours(route.total_duration) * params.driver_hourly_rate();
  cost.vehicle_cost = route.total_distance_km * params.vehicle_cost_per_km();
  cost.toll_cost = constraints.avoid_tolls
                       ? 0.0
                       : route.total_distance_km * params.toll_cost_per_km();
  for (const Stop& stop : route.stops) {
    cost.penalty_cost += absl::ToDoubleMinutes(stop.lateness) *
                         params.lateness_penalty_per_minute();
  }
  cost.total_cost = cost.fuel_cost + cost.driver_cost + cost.vehicle_cost +
                    cost.toll_cost + cost.penalty_cost;
  cost.cost_savings = (params.baseline_multiplier() - 1.0) * cost.total_cost;
  DCHECK_GE(cost.cost_savings, 0.0);
  return cost;
}

}  // namespace route_optimization
