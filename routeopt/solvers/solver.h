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

#ifndef ROUTEOPT_SOLVERS_SOLVER_H_
#define ROUTEOPT_SOLVERS_SOLVER_H_

#include <functional>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"
#include "routeopt/solvers/route_evaluator.h"

namespace route_optimization {

// A route construction strategy. Solvers are pure functions of their inputs:
// randomized ones seed their generator from `params.random_seed()`.
//
// `deadline` is the end of the search budget. Iterative solvers stop
// improving when it is reached and return the best order found so far;
// constructive solvers give up with a DeadlineExceeded error. A solver returns
// a FailedPrecondition error, and never a candidate, when the order it found
// breaks a hard constraint.
using SolverFunction = std::function<absl::StatusOr<CandidateRoute>(
    const RouteEvaluator& evaluator, const SolverParameters& params,
    absl::Time deadline)>;

using SolverRegistry = absl::flat_hash_map<SolverAlgorithm, SolverFunction>;

// Registry with the five built-in strategies below.
SolverRegistry DefaultSolverRegistry();

// Greedy construction: always visits the closest remaining destination.
absl::StatusOr<CandidateRoute> SolveNearestNeighbor(
    const RouteEvaluator& evaluator, const SolverParameters& params,
    absl::Time deadline);

// Clarke & Wright savings, merging chains of destinations by decreasing
// saving(a, b) = d(a, origin) + d(origin, b) - coefficient * d(a, b).
absl::StatusOr<CandidateRoute> SolveSavings(const RouteEvaluator& evaluator,
                                            const SolverParameters& params,
                                            absl::Time deadline);

// Simulated annealing over 2-opt, relocate and swap moves, starting from the
// nearest neighbor order with an exponentially decreasing temperature.
absl::StatusOr<CandidateRoute> SolveSimulatedAnnealing(
    const RouteEvaluator& evaluator, const SolverParameters& params,
    absl::Time deadline);

// Genetic algorithm with order crossover, tournament selection, swap
// mutation and elitism.
absl::StatusOr<CandidateRoute> SolveGenetic(const RouteEvaluator& evaluator,
                                            const SolverParameters& params,
                                            absl::Time deadline);

// Ant colony optimization: ants build orders with probabilities proportional
// to pheromone^alpha * (1 / distance)^beta, trails evaporate and are
// reinforced in proportion to the inverse objective of each ant's order.
absl::StatusOr<CandidateRoute> SolveAntColony(const RouteEvaluator& evaluator,
                                              const SolverParameters& params,
                                              absl::Time deadline);

// Order of the nearest neighbor construction, shared with the solvers that
// start from it. Ties are broken by the lowest destination index.
std::vector<int> NearestNeighborOrder(const RouteEvaluator& evaluator);

}  // namespace route_optimization

#endif  // ROUTEOPT_SOLVERS_SOLVER_H_
