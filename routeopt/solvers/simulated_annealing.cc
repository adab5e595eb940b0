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
#include <random>
#include <utility>
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

enum class Move { kTwoOpt, kRelocate, kSwap };

// Lowers the temperature exponentially from `initial` to `final`, following
// the largest of the iteration and the time progress.
class ExponentialCoolingSchedule {
 public:
  ExponentialCoolingSchedule(double initial_temperature,
                             double final_temperature, int max_iterations,
                             absl::Time start, absl::Time deadline)
      : initial_temperature_(initial_temperature),
        temperature_ratio_(initial_temperature > 0
                               ? final_temperature / initial_temperature
                               : 1.0),
        max_iterations_(max_iterations),
        start_(start),
        budget_(deadline - start) {
    DCHECK_GE(initial_temperature, final_temperature);
  }

  double GetTemperature(int iteration, absl::Time now) const {
    double progress = static_cast<double>(iteration) / max_iterations_;
    if (budget_ > absl::ZeroDuration() && budget_ != absl::InfiniteDuration()) {
      progress = std::max(progress, absl::FDivDuration(now - start_, budget_));
    }
    return initial_temperature_ *
           std::pow(temperature_ratio_, std::min(1.0, progress));
  }

 private:
  const double initial_temperature_;
  const double temperature_ratio_;
  const int max_iterations_;
  const absl::Time start_;
  const absl::Duration budget_;
};

// Applies a random move of the given kind to `order`, which has at least two
// elements.
void ApplyRandomMove(Move move, std::vector<int>* order, std::mt19937* rnd) {
  const int size = order->size();
  std::uniform_int_distribution<int> position(0, size - 1);
  int i = position(*rnd);
  int j = position(*rnd);
  while (j == i) j = position(*rnd);
  switch (move) {
    case Move::kTwoOpt:
      if (i > j) std::swap(i, j);
      std::reverse(order->begin() + i, order->begin() + j + 1);
      break;
    case Move::kRelocate: {
      const int node = (*order)[i];
      order->erase(order->begin() + i);
      order->insert(order->begin() + j, node);
      break;
    }
    case Move::kSwap:
      std::swap((*order)[i], (*order)[j]);
      break;
  }
}

}  // namespace

absl::StatusOr<CandidateRoute> SolveSimulatedAnnealing(
    const RouteEvaluator& evaluator, const SolverParameters& params,
    absl::Time deadline) {
  const SimulatedAnnealingParameters& sa_params = params.simulated_annealing();
  std::vector<int> current = NearestNeighborOrder(evaluator);
  if (current.size() < 2) {
    return evaluator.BuildCandidate(SolverAlgorithm::kSimulatedAnnealing,
                                    current);
  }
  std::mt19937 rnd(params.random_seed() +
                   static_cast<int>(SolverAlgorithm::kSimulatedAnnealing));
  std::uniform_real_distribution<double> probability(0.0, 1.0);
  std::uniform_int_distribution<int> move_kind(0, 2);

  // Temperatures are relative to the arc lengths of the instance.
  const double mean_arc = evaluator.MeanArcDistance();
  const ExponentialCoolingSchedule cooling(
      mean_arc * sa_params.initial_temperature_ratio(),
      mean_arc * sa_params.final_temperature_ratio(), sa_params.iterations(),
      absl::Now(), deadline);

  double current_objective = evaluator.Objective(current);
  std::vector<int> best = current;
  double best_objective = current_objective;
  int iteration = 0;
  for (; iteration < sa_params.iterations(); ++iteration) {
    const absl::Time now = absl::Now();
    if (now >= deadline) break;
    std::vector<int> candidate = current;
    ApplyRandomMove(static_cast<Move>(move_kind(rnd)), &candidate, &rnd);
    const double candidate_objective = evaluator.Objective(candidate);
    const double temperature = cooling.GetTemperature(iteration, now);
    if (candidate_objective + temperature * std::log(probability(rnd)) <
        current_objective) {
      current = std::move(candidate);
      current_objective = candidate_objective;
      if (current_objective < best_objective) {
        best = current;
        best_objective = current_objective;
      }
    }
  }
  VLOG(2) << "Simulated annealing objective after " << iteration
          << " iterations: " << best_objective;
  return evaluator.BuildCandidate(SolverAlgorithm::kSimulatedAnnealing, best);
}

}  // namespace route_optimization
