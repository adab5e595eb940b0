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


#include "routeopt/scoring/recommendations.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

std::vector<std::string> GenerateRecommendations(
    const RealTimeContext& context, const RecommendationInputs& inputs,
    const RecommendationParameters& params) {
  std::vector<std::string> recommendations;
  if (context.traffic.congestion_level > params.congestion_threshold()) {
    recommendations.push_back(
        "Heavy traffic congestion: consider alternative routes");
  }
  const RoadCondition road = context.weather.road_condition;
  if (road == RoadCondition::kIcy || road == RoadCondition::kSnowy) {
    recommendations.push_back(absl::StrCat(
        "Hazardous ", RoadConditionName(road),
        " road conditions: take additional safety measures"));
  }
  if (context.fuel_prices.PriceFor(inputs.fuel_type) >
      params.fuel_price_ceiling()) {
    recommendations.push_back(absl::StrCat(
        "High ", FuelTypeName(inputs.fuel_type),
        " prices: consider electric vehicles"));
  }
  if (context.time_factors.is_rush_hour) {
    recommendations.push_back(
        "Rush hour departure: consider rescheduling deliveries");
  }
  if (!context.traffic.incidents.empty()) {
    int high_severity = 0;
    for (const TrafficIncident& incident : context.traffic.incidents) {
      if (incident.severity == Severity::kHigh) ++high_severity;
    }
    recommendations.push_back(absl::StrCat(
        context.traffic.incidents.size(), " traffic incident(s) reported (",
        high_severity, " high severity): allow extra travel time"));
  }
  for (const std::string& warning : context.weather.warnings) {
    recommendations.push_back(absl::StrCat("Weather warning: ", warning));
  }
  if (!inputs.unassigned_destination_ids.empty()) {
    recommendations.push_back(absl::StrCat(
        "Destinations exceeding the vehicle capacity were not assigned (",
        absl::StrJoin(inputs.unassigned_destination_ids, ", "),
        "): schedule an additional vehicle"));
  }
  if (inputs.below_feasibility_threshold) {
    recommendations.push_back(
        "No route meets the feasibility threshold: relax time windows or "
        "split the delivery");
  }
  return recommendations;
}

}  // namespace route_optimization
