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


#include "routeopt/validation/simulation.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/base/logging.h"
#include "routeopt/base/status_macros.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/cost/cost_model.h"
#include "routeopt/cost/sustainability_model.h"
#include "routeopt/model/types.h"
#include "routeopt/solvers/route_evaluator.h"
#include "routeopt/validation/route_validator.h"

namespace route_optimization {
namespace {

// Risk added by every warning of a scenario that breaches no constraint.
constexpr double kRiskPerWarning = 0.1;

absl::Status ValidateScenario(const Scenario& scenario) {
  if (scenario.name.empty()) {
    return absl::InvalidArgumentError("Scenario without a name");
  }
  const auto error = [&scenario](absl::string_view what) {
    return absl::InvalidArgumentError(
        absl::StrCat("Scenario ", scenario.name, ": ", what));
  };
  if (!(scenario.probability >= 0.0 && scenario.probability <= 1.0)) {
    return error("probability must be in [0, 1]");
  }
  if (scenario.congestion_level.has_value() &&
      !(*scenario.congestion_level >= 0.0 &&
        *scenario.congestion_level <= 1.0)) {
    return error("congestion level must be in [0, 1]");
  }
  if (scenario.traffic_multiplier.has_value() &&
      !(*scenario.traffic_multiplier > 0.0)) {
    return error("traffic multiplier must be positive");
  }
  if (scenario.average_speed_kmh.has_value() &&
      !(*scenario.average_speed_kmh > 0.0)) {
    return error("average speed must be positive");
  }
  if (scenario.fuel_price.has_value() && !(*scenario.fuel_price >= 0.0)) {
    return error("fuel price must be non-negative");
  }
  return absl::OkStatus();
}

// Drives the stops of `route` again, in the same order and over the same
// distances, at `speed_kmh`.
CandidateRoute RetimeRoute(const CandidateRoute& route, double speed_kmh,
                           const CostParameters& cost) {
  CandidateRoute retimed = route;
  absl::Time current = route.departure_time;
  for (Stop& stop : retimed.stops) {
    const absl::Time previous_departure = current;
    Stop replayed =
        ScheduleStop(current, stop.distance_from_previous_km, speed_kmh,
                     stop.time_window, stop.service_time);
    replayed.destination_id = std::move(stop.destination_id);
    replayed.estimated_cost =
        replayed.distance_from_previous_km * cost.vehicle_cost_per_km() +
        absl::ToDoubleHours(replayed.arrival_time - previous_departure +
                            replayed.waiting_time) *
            cost.driver_hourly_rate();
    current = replayed.departure_time;
    stop = std::move(replayed);
  }
  retimed.total_duration = current - route.departure_time;
  return retimed;
}

double ScenarioRisk(const ValidationResult& validation) {
  if (!validation.is_valid) return 1.0;
  return std::clamp(0.5 * (1.0 - validation.feasibility_score) +
                        kRiskPerWarning * validation.warnings.size(),
                    0.0, 1.0);
}

absl::string_view MitigationFor(absl::string_view constraint) {
  if (constraint == "time_window") {
    return "Depart earlier or negotiate wider delivery time windows";
  }
  if (constraint == "max_route_duration") {
    return "Split the stops across an additional vehicle to shorten the route";
  }
  if (constraint == "max_distance") {
    return "Assign a vehicle with a longer range or plan a refuelling stop";
  }
  return "Move part of the load to another vehicle";
}

RiskAnalysis AnalyzeRisk(absl::Span<const Scenario> scenarios,
                         absl::Span<const ScenarioResult> results,
                         const OptimizerParameters& params) {
  RiskAnalysis analysis;
  absl::flat_hash_set<std::string> seen;
  const auto add_mitigation = [&analysis, &seen](absl::string_view text) {
    if (seen.insert(std::string(text)).second) {
      analysis.mitigation_strategies.emplace_back(text);
    }
  };
  for (int i = 0; i < results.size(); ++i) {
    const ScenarioResult& result = results[i];
    if (result.risk < params.validation().high_risk_threshold()) continue;
    analysis.high_risk_scenarios.push_back(result.scenario);
    for (const ConstraintViolation& violation :
         result.validation.violations) {
      add_mitigation(MitigationFor(violation.constraint));
    }
    const Scenario& scenario = scenarios[i];
    if (scenario.road_condition == RoadCondition::kIcy ||
        scenario.road_condition == RoadCondition::kSnowy) {
      add_mitigation("Fit winter equipment and lower the planned speed");
    }
    if (scenario.congestion_level.has_value() &&
        *scenario.congestion_level >
            params.recommendations().congestion_threshold()) {
      add_mitigation("Reroute around congested corridors");
    }
    analysis.contingency_plans.push_back(absl::StrCat(
        "If ", result.scenario,
        " materializes: keep a standby vehicle ready and notify the "
        "affected customers"));
  }
  return analysis;
}

}  // namespace

RealTimeContext ApplyScenario(const RealTimeContext& base,
                              const Scenario& scenario, FuelType fuel_type) {
  RealTimeContext context = base;
  if (scenario.congestion_level.has_value()) {
    context.traffic.congestion_level = *scenario.congestion_level;
  }
  if (scenario.traffic_multiplier.has_value()) {
    context.time_factors.traffic_multiplier = *scenario.traffic_multiplier;
  }
  if (scenario.average_speed_kmh.has_value()) {
    context.traffic.average_speed_kmh = *scenario.average_speed_kmh;
  }
  if (scenario.road_condition.has_value()) {
    context.weather.road_condition = *scenario.road_condition;
  }
  if (scenario.fuel_price.has_value()) {
    switch (fuel_type) {
      case FuelType::kDiesel:
        context.fuel_prices.diesel = *scenario.fuel_price;
        break;
      case FuelType::kGasoline:
      case FuelType::kHybrid:
        context.fuel_prices.gasoline = *scenario.fuel_price;
        break;
      case FuelType::kElectric:
        context.fuel_prices.electric = *scenario.fuel_price;
        break;
    }
  }
  return context;
}

absl::StatusOr<SimulationResult> SimulateRoute(
    const CandidateRoute& route, FuelType fuel_type,
    const Constraints& constraints, const RealTimeContext& base_context,
    absl::Span<const Scenario> scenarios, const OptimizerParameters& params) {
  if (scenarios.empty()) {
    return absl::InvalidArgumentError("No scenario to simulate");
  }
  for (const Scenario& scenario : scenarios) {
    RETURN_IF_ERROR(ValidateScenario(scenario));
  }

  SimulationResult simulation;
  simulation.results.reserve(scenarios.size());
  for (const Scenario& scenario : scenarios) {
    const RealTimeContext context =
        ApplyScenario(base_context, scenario, fuel_type);
    ScenarioResult result;
    result.scenario = scenario.name;
    result.probability = scenario.probability;
    result.route = RetimeRoute(
        route, EffectiveSpeedKmh(context, params.travel()), params.cost());
    result.validation = ValidateRoute(result.route, constraints, params);
    result.route.feasibility = result.validation.feasibility_score;
    result.cost = ComputeCost(result.route, fuel_type, context, constraints,
                              params.cost());
    result.sustainability =
        ComputeSustainability(result.route.total_distance_km,
                              result.cost.fuel_consumption, fuel_type,
                              params.sustainability());
    result.risk = ScenarioRisk(result.validation);
    VLOG(1) << "Scenario " << scenario.name << ": risk " << result.risk
            << ", cost " << result.cost.total_cost;
    simulation.results.push_back(std::move(result));
  }

  const auto best = std::min_element(
      simulation.results.begin(), simulation.results.end(),
      [](const ScenarioResult& a, const ScenarioResult& b) {
        if (a.risk != b.risk) return a.risk < b.risk;
        return a.cost.total_cost < b.cost.total_cost;
      });
  simulation.best_scenario.scenario = best->scenario;
  simulation.best_scenario.score = 1.0 - best->risk;
  std::vector<std::string>& reasons = simulation.best_scenario.reasons;
  reasons.push_back(absl::StrFormat("Lowest risk (%.2f)", best->risk));
  if (best->validation.is_valid) reasons.push_back("Meets every constraint");
  reasons.push_back(
      absl::StrFormat("Total cost %.2f", best->cost.total_cost));
  reasons.push_back(absl::StrCat(
      "Duration ", absl::FormatDuration(best->route.total_duration)));

  simulation.risk_analysis =
      AnalyzeRisk(scenarios, simulation.results, params);
  return simulation;
}

}  // namespace route_optimization
