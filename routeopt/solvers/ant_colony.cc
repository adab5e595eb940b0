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

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "routeopt/base/logging.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"
#include "routeopt/solvers/route_evaluator.h"
#include "routeopt/solvers/solver.h"

namespace route_optimization {
namespace {

constexpr double kMinArcDistance = 1e-9;
constexpr double kMinObjective = 1e-9;

// Pheromone trails and heuristic desirability of the arcs between nodes,
// node 0 being the origin.
class PheromoneMatrix {
 public:
  PheromoneMatrix(const RouteEvaluator& evaluator,
                  const AntColonyParameters& params)
      : params_(params),
        num_nodes_(evaluator.num_destinations() + 1),
        trail_(num_nodes_, std::vector<double>(num_nodes_, 1.0)),
        visibility_(num_nodes_, std::vector<double>(num_nodes_, 0.0)) {
    for (int i = 0; i < num_nodes_; ++i) {
      for (int j = 0; j < num_nodes_; ++j) {
        if (i == j) continue;
        visibility_[i][j] = std::pow(
            1.0 / std::max(kMinArcDistance, evaluator.NodeDistance(i, j)),
            params.beta());
      }
    }
  }

  double Weight(int from, int to) const {
    return std::pow(trail_[from][to], params_.alpha()) * visibility_[from][to];
  }

  void Evaporate() {
    for (std::vector<double>& row : trail_) {
      for (double& value : row) value *= 1.0 - params_.evaporation_rate();
    }
  }

  // Reinforces the arcs of `order`, starting from the origin.
  void Deposit(const std::vector<int>& order, double objective) {
    const double amount =
        params_.deposit() / std::max(kMinObjective, objective);
    int previous = 0;
    for (const int index : order) {
      trail_[previous][index + 1] += amount;
      trail_[index + 1][previous] += amount;
      previous = index + 1;
    }
  }

 private:
  const AntColonyParameters& params_;
  const int num_nodes_;
  std::vector<std::vector<double>> trail_;
  std::vector<std::vector<double>> visibility_;
};

// Builds the order of one ant by roulette wheel selection over the unvisited
// destinations. Falls back to the closest destination when every weight
// vanishes.
std::vector<int> ConstructOrder(const RouteEvaluator& evaluator,
                                const PheromoneMatrix& pheromones,
                                std::mt19937* rnd) {
  const int num_destinations = evaluator.num_destinations();
  std::uniform_real_distribution<double> probability(0.0, 1.0);
  std::vector<int> order;
  order.reserve(num_destinations);
  std::vector<int> unvisited(num_destinations);
  for (int i = 0; i < num_destinations; ++i) unvisited[i] = i;
  std::vector<double> weights(num_destinations);
  int current = 0;
  while (!unvisited.empty()) {
    double sum = 0.0;
    for (int k = 0; k < unvisited.size(); ++k) {
      weights[k] = pheromones.Weight(current, unvisited[k] + 1);
      sum += weights[k];
    }
    int chosen = unvisited.size() - 1;
    if (!(sum > std::numeric_limits<double>::min())) {
      for (int k = 0; k < unvisited.size(); ++k) {
        if (evaluator.NodeDistance(current, unvisited[k] + 1) <
            evaluator.NodeDistance(current, unvisited[chosen] + 1)) {
          chosen = k;
        }
      }
    } else {
      const double threshold = probability(*rnd) * sum;
      double accumulated = 0.0;
      for (int k = 0; k < unvisited.size(); ++k) {
        accumulated += weights[k];
        if (threshold <= accumulated) {
          chosen = k;
          break;
        }
      }
    }
    current = unvisited[chosen] + 1;
    order.push_back(unvisited[chosen]);
    unvisited.erase(unvisited.begin() + chosen);
  }
  return order;
}

}  // namespace

absl::StatusOr<CandidateRoute> SolveAntColony(const RouteEvaluator& evaluator,
                                              const SolverParameters& params,
                                              absl::Time deadline) {
  const AntColonyParameters& aco_params = params.ant_colony();
  std::mt19937 rnd(params.random_seed() +
                   static_cast<int>(SolverAlgorithm::kAntColony));
  PheromoneMatrix pheromones(evaluator, aco_params);

  std::vector<int> best = NearestNeighborOrder(evaluator);
  double best_objective = evaluator.Objective(best);
  int iteration = 0;
  for (; iteration < aco_params.iterations(); ++iteration) {
    if (absl::Now() >= deadline) break;
    std::vector<std::vector<int>> orders;
    std::vector<double> objectives;
    orders.reserve(aco_params.num_ants());
    objectives.reserve(aco_params.num_ants());
    for (int ant = 0; ant < aco_params.num_ants(); ++ant) {
      orders.push_back(ConstructOrder(evaluator, pheromones, &rnd));
      objectives.push_back(evaluator.Objective(orders.back()));
      if (objectives.back() < best_objective) {
        best = orders.back();
        best_objective = objectives.back();
      }
    }
    pheromones.Evaporate();
    for (int ant = 0; ant < orders.size(); ++ant) {
      pheromones.Deposit(orders[ant], objectives[ant]);
    }
  }
  VLOG(2) << "Ant colony objective after " << iteration
          << " iterations: " << best_objective;
  return evaluator.BuildCandidate(SolverAlgorithm::kAntColony, best);
}

}  // namespace route_optimization
