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


// Descriptions of the solver algorithms and of the route constraints the
// optimizer supports, for callers building requests.

#ifndef ROUTEOPT_ENGINE_CATALOG_H_
#define ROUTEOPT_ENGINE_CATALOG_H_

#include <string>
#include <vector>

#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

struct AlgorithmInfo {
  SolverAlgorithm algorithm = SolverAlgorithm::kNearestNeighbor;
  std::string name;
  std::string description;
  std::vector<std::string> best_use_cases;
  std::string speed;
  std::string accuracy;
  std::string scalability;
  // "field: value" for every tuning parameter, with its configured value.
  std::vector<std::string> parameters;
};

struct ConstraintInfo {
  std::string name;
  std::string description;
  // "duration", "number", "boolean" or "time_window".
  std::string type;
  std::string default_value;
};

std::vector<AlgorithmInfo> GetAlgorithmCatalog(
    const OptimizerParameters& params);
std::vector<ConstraintInfo> GetConstraintCatalog(
    const OptimizerParameters& params);

}  // namespace route_optimization

#endif  // ROUTEOPT_ENGINE_CATALOG_H_
