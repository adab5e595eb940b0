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


#ifndef ROUTEOPT_VALIDATION_SIMULATION_H_
#define ROUTEOPT_VALIDATION_SIMULATION_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"
#include "routeopt/validation/route_validator.h"

namespace route_optimization {

// A what-if assumption on the conditions a route is driven in. Unset fields
// keep the value of the base context.
struct Scenario {
  std::string name;
  // Likelihood of the scenario, in [0, 1]. Reported, not used for scoring.
  double probability = 1.0;
  std::optional<double> congestion_level;
  std::optional<double> traffic_multiplier;
  std::optional<double> average_speed_kmh;
  std::optional<RoadCondition> road_condition;
  // Price of the fuel of the simulated vehicle.
  std::optional<double> fuel_price;
};

struct ScenarioResult {
  std::string scenario;
  double probability = 0.0;
  // The route re-timed under the scenario.
  CandidateRoute route;
  CostBreakdown cost;
  SustainabilityMetrics sustainability;
  ValidationResult validation;
  // In [0, 1]. Any breached constraint makes it 1.
  double risk = 0.0;
};

struct BestScenario {
  std::string scenario;
  // One minus the risk of the scenario.
  double score = 0.0;
  std::vector<std::string> reasons;
};

struct RiskAnalysis {
  std::vector<std::string> high_risk_scenarios;
  std::vector<std::string> mitigation_strategies;
  std::vector<std::string> contingency_plans;
};

struct SimulationResult {
  // In the order of the scenarios.
  std::vector<ScenarioResult> results;
  BestScenario best_scenario;
  RiskAnalysis risk_analysis;
};

// Returns `base` with the overrides of `scenario` applied. A fuel price
// override applies to `fuel_type`.
RealTimeContext ApplyScenario(const RealTimeContext& base,
                              const Scenario& scenario, FuelType fuel_type);

// Replays `route` under every scenario: the stops are re-timed at the speed
// the scenario allows, then cost, sustainability and validation are
// recomputed. `route` itself is left untouched. The best scenario has the
// lowest risk, ties broken by the lowest cost and then by scenario order.
//
// Returns InvalidArgument when no scenario is given or when a scenario holds
// an out of range value.
absl::StatusOr<SimulationResult> SimulateRoute(
    const CandidateRoute& route, FuelType fuel_type,
    const Constraints& constraints, const RealTimeContext& base_context,
    absl::Span<const Scenario> scenarios, const OptimizerParameters& params);

}  // namespace route_optimization

#endif  // ROUTEOPT_VALIDATION_SIMULATION_H_
