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
#include <deque>
#include <tuple>
#include <vector>

#include "absl/status/status.h"
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

struct Saving {
  double value;
  int before;
  int after;
};

// Chains of destinations being merged. Every destination starts alone in its
// chain; a merge glues two chains by their end points.
class ChainSet {
 public:
  explicit ChainSet(int num_destinations)
      : chain_of_(num_destinations), chains_(num_destinations) {
    for (int i = 0; i < num_destinations; ++i) {
      chain_of_[i] = i;
      chains_[i].push_back(i);
    }
  }

  // Links `before` to `after` if they are end points of two different chains.
  // Chains are reversed as needed so that the result stays a simple path.
  bool Merge(int before, int after) {
    const int first = chain_of_[before];
    const int second = chain_of_[after];
    if (first == second) return false;
    std::deque<int>& head = chains_[first];
    std::deque<int>& tail = chains_[second];
    if (head.back() != before) {
      if (head.front() != before) return false;
      std::reverse(head.begin(), head.end());
    }
    if (tail.front() != after) {
      if (tail.back() != after) return false;
      std::reverse(tail.begin(), tail.end());
    }
    for (const int node : tail) {
      head.push_back(node);
      chain_of_[node] = first;
    }
    tail.clear();
    return true;
  }

  // Concatenation of the remaining chains, in order of their first index.
  std::vector<int> Order() const {
    std::vector<int> order;
    for (const std::deque<int>& chain : chains_) {
      order.insert(order.end(), chain.begin(), chain.end());
    }
    return order;
  }

 private:
  std::vector<int> chain_of_;
  std::vector<std::deque<int>> chains_;
};

}  // namespace

absl::StatusOr<CandidateRoute> SolveSavings(const RouteEvaluator& evaluator,
                                            const SolverParameters& params,
                                            absl::Time deadline) {
  const int num_destinations = evaluator.num_destinations();
  const double coefficient = params.savings_arc_coefficient();
  std::vector<Saving> savings;
  savings.reserve(num_destinations * (num_destinations - 1) / 2 + 1);
  for (int before = 0; before < num_destinations; ++before) {
    for (int after = before + 1; after < num_destinations; ++after) {
      const double value =
          evaluator.NodeDistance(before + 1, 0) +
          evaluator.NodeDistance(0, after + 1) -
          coefficient * evaluator.NodeDistance(before + 1, after + 1);
      savings.push_back({value, before, after});
    }
  }
  // Ties are broken on the arc so that the result is deterministic.
  std::sort(savings.begin(), savings.end(),
            [](const Saving& a, const Saving& b) {
              return std::tie(b.value, a.before, a.after) <
                     std::tie(a.value, b.before, b.after);
            });

  ChainSet chains(num_destinations);
  int merges = 0;
  for (const Saving& saving : savings) {
    if (merges == num_destinations - 1) break;
    if (absl::Now() > deadline) {
      return absl::DeadlineExceededError(
          "Savings construction exceeded its time budget");
    }
    if (chains.Merge(saving.before, saving.after)) ++merges;
  }

  // The merged path may be driven in either direction from the origin.
  std::vector<int> order = chains.Order();
  std::vector<int> reversed(order.rbegin(), order.rend());
  if (evaluator.Objective(reversed) < evaluator.Objective(order)) {
    order.swap(reversed);
  }
  VLOG(2) << "Savings objective after " << merges
          << " merges: " << evaluator.Objective(order);
  return evaluator.BuildCandidate(SolverAlgorithm::kSavings, order);
}

}  // namespace route_optimization
