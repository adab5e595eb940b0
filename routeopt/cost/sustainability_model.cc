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


#include "routeopt/cost/sustainability_model.h"

#include <algorithm>

#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

SustainabilityMetrics ComputeSustainability(
    double distance_km, double fuel_consumption, FuelType fuel_type,
    const SustainabilityParameters& params) {
  SustainabilityMetrics metrics;
  metrics.co2_emissions_kg =
      fuel_consumption * FuelTypeRate(params.emission_factor(), fuel_type);
  metrics.fuel_efficiency =
      fuel_consumption > 0 ? distance_km / fuel_consumption : 0.0;
  const double co2_score = std::clamp(
      100.0 - metrics.co2_emissions_kg * params.co2_penalty_per_kg(), 0.0,
      100.0);
  const double efficiency_score = std::clamp(
      metrics.fuel_efficiency * params.efficiency_points_per_unit(), 0.0,
      100.0);
  metrics.environmental_score = (co2_score + efficiency_score) / 2;

  if (metrics.co2_emissions_kg > params.high_co2_threshold_kg()) {
    metrics.recommendations.push_back(
        "High CO2 emissions: consider an electric or hybrid vehicle");
  }
  if (fuel_consumption > 0 &&
      metrics.fuel_efficiency < params.low_efficiency_threshold()) {
    metrics.recommendations.push_back(
        "Low fuel efficiency: schedule vehicle maintenance");
  }
  if (fuel_type == FuelType::kDiesel &&
      metrics.co2_emissions_kg > params.diesel_co2_threshold_kg()) {
    metrics.recommendations.push_back(
        "Replace the diesel vehicle with a hybrid or electric one");
  }
  return metrics;
}

}  // namespace route_optimization
