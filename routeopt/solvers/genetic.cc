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

struct Individual {
  std::vector<int> order;
  double objective = 0.0;
};

bool BetterThan(const Individual& a, const Individual& b) {
  return a.objective < b.objective;
}

const Individual& TournamentSelect(const std::vector<Individual>& population,
                                   int tournament_size, std::mt19937* rnd) {
  std::uniform_int_distribution<int> pick(0, population.size() - 1);
  const Individual* winner = &population[pick(*rnd)];
  for (int i = 1; i < tournament_size; ++i) {
    const Individual& contender = population[pick(*rnd)];
    if (BetterThan(contender, *winner)) winner = &contender;
  }
  return *winner;
}

// Order crossover (OX): the child keeps a slice of `first` in place and
// receives the remaining destinations in the order they appear in `second`,
// starting right after the slice.
std::vector<int> OrderCrossover(const std::vector<int>& first,
                                const std::vector<int>& second,
                                std::mt19937* rnd) {
  const int size = first.size();
  std::uniform_int_distribution<int> position(0, size - 1);
  int begin = position(*rnd);
  int end = position(*rnd);
  if (begin > end) std::swap(begin, end);

  std::vector<int> child(size, -1);
  std::vector<bool> used(size, false);
  for (int i = begin; i <= end; ++i) {
    child[i] = first[i];
    used[first[i]] = true;
  }
  int write = (end + 1) % size;
  for (int k = 0; k < size; ++k) {
    const int node = second[(end + 1 + k) % size];
    if (used[node]) continue;
    child[write] = node;
    used[node] = true;
    write = (write + 1) % size;
  }
  return child;
}

void SwapMutation(std::vector<int>* order, std::mt19937* rnd) {
  std::uniform_int_distribution<int> position(0, order->size() - 1);
  std::swap((*order)[position(*rnd)], (*order)[position(*rnd)]);
}

}  // namespace

absl::StatusOr<CandidateRoute> SolveGenetic(const RouteEvaluator& evaluator,
                                            const SolverParameters& params,
                                            absl::Time deadline) {
  const GeneticAlgorithmParameters& ga_params = params.genetic();
  const int num_destinations = evaluator.num_destinations();
  std::vector<int> seed_order = NearestNeighborOrder(evaluator);
  if (num_destinations < 2) {
    return evaluator.BuildCandidate(SolverAlgorithm::kGenetic, seed_order);
  }
  std::mt19937 rnd(params.random_seed() +
                   static_cast<int>(SolverAlgorithm::kGenetic));
  std::uniform_real_distribution<double> probability(0.0, 1.0);

  // The nearest neighbor order seeds the population, the rest is random.
  std::vector<Individual> population;
  population.reserve(ga_params.population_size());
  population.push_back({seed_order, evaluator.Objective(seed_order)});
  while (population.size() < ga_params.population_size()) {
    std::vector<int> order = seed_order;
    std::shuffle(order.begin(), order.end(), rnd);
    const double objective = evaluator.Objective(order);
    population.push_back({std::move(order), objective});
  }
  std::sort(population.begin(), population.end(), BetterThan);

  int generation = 0;
  for (; generation < ga_params.generations(); ++generation) {
    if (absl::Now() >= deadline) break;
    std::vector<Individual> next(population.begin(),
                                 population.begin() + ga_params.elite_count());
    while (next.size() < population.size()) {
      const Individual& first =
          TournamentSelect(population, ga_params.tournament_size(), &rnd);
      const Individual& second =
          TournamentSelect(population, ga_params.tournament_size(), &rnd);
      std::vector<int> child = OrderCrossover(first.order, second.order, &rnd);
      if (probability(rnd) < ga_params.mutation_rate()) {
        SwapMutation(&child, &rnd);
      }
      const double objective = evaluator.Objective(child);
      next.push_back({std::move(child), objective});
    }
    population = std::move(next);
    std::sort(population.begin(), population.end(), BetterThan);
  }
  VLOG(2) << "Genetic algorithm objective after " << generation
          << " generations: " << population.front().objective;
  return evaluator.BuildCandidate(SolverAlgorithm::kGenetic,
                                  population.front().order);
}

}  // namespace route_optimization
