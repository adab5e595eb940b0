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

#include "routeopt/solvers/solver.h"

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "routeopt/base/logging.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"
#include "routeopt/solvers/route_evaluator.h"

namespace route_optimization {

SolverRegistry DefaultSolverRegistry() {
  return {
      {SolverAlgorithm::kNearestNeighbor, SolveNearestNeighbor},
      {SolverAlgorithm::kSavings, SolveSavings},
      {SolverAlgorithm::kSimulatedAnnealing, SolveSimulatedAnnealing},
      {SolverAlgorithm::kGenetic, SolveGenetic},
      {SolverAlgorithm::kAntColony, SolveAntColony},
  };
}

std::vector<int> NearestNeighborOrder(const RouteEvaluator& evaluator) {
  const int num_destinations = evaluator.num_destinations();
  std::vector<int> order;
  order.reserve(num_destinations);
  std::vector<bool> visited(num_destinations, false);
  int current_node = 0;
  for (int step = 0; step < num_destinations; ++step) {
    int closest = -1;
    for (int i = 0; i < num_destinations; ++i) {
      if (visited[i]) continue;
      if (closest == -1 || evaluator.NodeDistance(current_node, i + 1) <
                               evaluator.NodeDistance(current_node, closest + 1)) {
        closest = i;
      }
    }
    visited[closest] = true;
    order.push_back(closest);
    current_node = closest + 1;
  }
  return order;
}

absl::StatusOr<CandidateRoute> SolveNearestNeighbor(
    const RouteEvaluator& evaluator, const SolverParameters& /*params*/,
    absl::Time deadline) {
  const std::vector<int> order = NearestNeighborOrder(evaluator);
  if (absl::Now() > deadline) {
    return absl::DeadlineExceededError(
        "Nearest neighbor construction exceeded its time budget");
  }
  VLOG(2) << "Nearest neighbor objective: " << evaluator.Objective(order);
  return evaluator.BuildCandidate(SolverAlgorithm::kNearestNeighbor, order);
}

}  // namespace route_optimization
