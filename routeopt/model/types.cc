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

#include "routeopt/model/types.h"

#include "absl/strings/string_view.h"

namespace route_optimization {

bool operator==(const GeoPoint& a, const GeoPoint& b) {
  return a.latitude == b.latitude && a.longitude == b.longitude;
}

bool operator==(const Place& a, const Place& b) {
  return a.name == b.name && a.location == b.location;
}

double FuelPrices::PriceFor(FuelType fuel_type) const {
  switch (fuel_type) {
    case FuelType::kDiesel:
      return diesel;
    case FuelType::kGasoline:
    case FuelType::kHybrid:
      return gasoline;
    case FuelType::kElectric:
      return electric;
  }
  return diesel;
}

absl::string_view PriorityName(Priority priority) {
  switch (priority) {
    case Priority::kHigh:
      return "high";
    case Priority::kMedium:
      return "medium";
    case Priority::kLow:
      return "low";
  }
  return "unknown";
}

absl::string_view FuelTypeName(FuelType fuel_type) {
  switch (fuel_type) {
    case FuelType::kDiesel:
      return "diesel";
    case FuelType::kGasoline:
      return "gasoline";
    case FuelType::kElectric:
      return "electric";
    case FuelType::kHybrid:
      return "hybrid";
  }
  return "unknown";
}

absl::string_view RoadConditionName(RoadCondition condition) {
  switch (condition) {
    case RoadCondition::kDry:
      return "dry";
    case RoadCondition::kWet:
      return "wet";
    case RoadCondition::kIcy:
      return "icy";
    case RoadCondition::kSnowy:
      return "snowy";
  }
  return "unknown";
}

absl::string_view SolverAlgorithmName(SolverAlgorithm algorithm) {
  switch (algorithm) {
    case SolverAlgorithm::kNearestNeighbor:
      return "nearest_neighbor";
    case SolverAlgorithm::kSavings:
      return "savings_algorithm";
    case SolverAlgorithm::kSimulatedAnnealing:
      return "simulated_annealing";
    case SolverAlgorithm::kGenetic:
      return "genetic_algorithm";
    case SolverAlgorithm::kAntColony:
      return "ant_colony_optimization";
  }
  return "unknown";
}

absl::string_view OptimizationStateName(OptimizationState state) {
  switch (state) {
    case OptimizationState::kCollectingContext:
      return "CollectingContext";
    case OptimizationState::kRunningSolvers:
      return "RunningSolvers";
    case OptimizationState::kSelectingBest:
      return "SelectingBest";
    case OptimizationState::kEnriching:
      return "Enriching";
    case OptimizationState::kRecommending:
      return "Recommending";
    case OptimizationState::kCompleted:
      return "Completed";
    case OptimizationState::kFailed:
      return "Failed";
  }
  return "unknown";
}

absl::string_view TransportModeName(TransportMode mode) {
  switch (mode) {
    case TransportMode::kRoad:
      return "road";
    case TransportMode::kSea:
      return "sea";
    case TransportMode::kAir:
      return "air";
    case TransportMode::kRail:
      return "rail";
  }
  return "unknown";
}

absl::string_view ServiceTypeName(ServiceType service_type) {
  switch (service_type) {
    case ServiceType::kFtl:
      return "ftl";
    case ServiceType::kLtl:
      return "ltl";
    case ServiceType::kFcl:
      return "fcl";
    case ServiceType::kLcl:
      return "lcl";
    case ServiceType::kExpress:
      return "express";
    case ServiceType::kEconomy:
      return "economy";
  }
  return "unknown";
}

absl::string_view LegTemplateName(LegTemplate leg_template) {
  switch (leg_template) {
    case LegTemplate::kRoad:
      return "road";
    case LegTemplate::kSea:
      return "sea";
    case LegTemplate::kAir:
      return "air";
    case LegTemplate::kSeaAir:
      return "sea_air";
    case LegTemplate::kRoadSea:
      return "road_sea";
    case LegTemplate::kRail:
      return "rail";
  }
  return "unknown";
}

}  // namespace route_optimization
