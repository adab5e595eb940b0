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


#include "routeopt/engine/catalog.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

// Lists the singular fields of `message` with their current values.
std::vector<std::string> DescribeFields(
    const google::protobuf::Message& message) {
  std::vector<std::string> fields;
  const google::protobuf::Descriptor* descriptor = message.GetDescriptor();
  for (int i = 0; i < descriptor->field_count(); ++i) {
    const google::protobuf::FieldDescriptor* field = descriptor->field(i);
    if (field->is_repeated()) continue;
    std::string value;
    google::protobuf::TextFormat::PrintFieldValueToString(message, field, -1,
                                                          &value);
    fields.push_back(absl::StrCat(field->name(), ": ", value));
  }
  return fields;
}

AlgorithmInfo MakeInfo(SolverAlgorithm algorithm, std::string description,
                       std::vector<std::string> best_use_cases,
                       std::string speed, std::string accuracy,
                       std::string scalability) {
  AlgorithmInfo info;
  info.algorithm = algorithm;
  info.name = std::string(SolverAlgorithmName(algorithm));
  info.description = std::move(description);
  info.best_use_cases = std::move(best_use_cases);
  info.speed = std::move(speed);
  info.accuracy = std::move(accuracy);
  info.scalability = std::move(scalability);
  return info;
}

}  // namespace

std::vector<AlgorithmInfo> GetAlgorithmCatalog(
    const OptimizerParameters& params) {
  const SolverParameters& solver = params.solver();
  std::vector<AlgorithmInfo> catalog;

  catalog.push_back(MakeInfo(
      SolverAlgorithm::kNearestNeighbor,
      "Greedy construction always driving to the closest remaining "
      "destination",
      {"Quick estimates", "Fallback when the time budget is tight"},
      "very fast", "low", "high"));

  catalog.push_back(MakeInfo(
      SolverAlgorithm::kSavings,
      "Clarke & Wright savings: merges chains of destinations by decreasing "
      "detour savings",
      {"Clustered destinations", "Balanced speed and quality"}, "fast",
      "medium", "high"));
  catalog.back().parameters.push_back(absl::StrCat(
      "savings_arc_coefficient: ", solver.savings_arc_coefficient()));

  catalog.push_back(MakeInfo(
      SolverAlgorithm::kSimulatedAnnealing,
      "Local search over 2-opt, relocate and swap moves accepting worse "
      "routes with a decreasing probability",
      {"Tight time windows", "Escaping greedy local optima"}, "medium",
      "high", "medium"));
  catalog.back().parameters = DescribeFields(solver.simulated_annealing());

  catalog.push_back(MakeInfo(
      SolverAlgorithm::kGenetic,
      "Population of visiting orders evolved by order crossover, swap "
      "mutation and elitism",
      {"Large delivery sets", "Irregular geographies"}, "slow", "high",
      "medium"));
  catalog.back().parameters = DescribeFields(solver.genetic());

  catalog.push_back(MakeInfo(
      SolverAlgorithm::kAntColony,
      "Orders built by ants following pheromone trails reinforced along the "
      "best routes",
      {"Dense urban networks", "Recurring routes"}, "slow", "high", "low"));
  catalog.back().parameters = DescribeFields(solver.ant_colony());

  for (AlgorithmInfo& info : catalog) {
    info.parameters.push_back(
        absl::StrCat("random_seed: ", solver.random_seed()));
  }
  return catalog;
}

std::vector<ConstraintInfo> GetConstraintCatalog(
    const OptimizerParameters& params) {
  return {
      {"max_route_duration",
       "Longest time between departure and the end of the last service",
       "duration", "unbounded"},
      {"max_distance_km", "Longest total driving distance", "number",
       "unbounded"},
      {"time_window",
       "Arrival window of a destination. Arrivals later than the tolerance "
       "past its end are rejected",
       "time_window",
       absl::StrCat("tolerance ",
                    absl::FormatDuration(TimeWindowTolerance(params)))},
      {"max_load_weight_kg", "Heaviest load carried by the vehicle", "number",
       "vehicle capacity"},
      {"max_load_volume_m3", "Largest load volume carried by the vehicle",
       "number", "vehicle volume capacity"},
      {"avoid_tolls", "Plan without toll roads: no toll cost is charged",
       "boolean", "false"},
      {"avoid_highways", "Plan without highways", "boolean", "false"},
      {"prefer_electric_charging",
       "Prefer stops with electric charging stations", "boolean", "false"},
  };
}

}  // namespace route_optimization
