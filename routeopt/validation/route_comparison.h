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


#ifndef ROUTEOPT_VALIDATION_ROUTE_COMPARISON_H_
#define ROUTEOPT_VALIDATION_ROUTE_COMPARISON_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "routeopt/model/types.h"

namespace route_optimization {

enum class ComparisonCriterion {
  kCost,
  kDuration,
  kDistance,
  kEfficiency,
  kEmissions,
  kFeasibility,
};

inline constexpr ComparisonCriterion kAllComparisonCriteria[] = {
    ComparisonCriterion::kCost,       ComparisonCriterion::kDuration,
    ComparisonCriterion::kDistance,   ComparisonCriterion::kEfficiency,
    ComparisonCriterion::kEmissions,  ComparisonCriterion::kFeasibility};

absl::string_view ComparisonCriterionName(ComparisonCriterion criterion);
absl::StatusOr<ComparisonCriterion> ParseComparisonCriterion(
    absl::string_view name);

struct CriterionComparison {
  ComparisonCriterion criterion = ComparisonCriterion::kCost;
  // Score of every route in [0, 1], in input order. The best route on the
  // criterion scores 1 and the worst 0. All routes score 1 when they tie.
  std::vector<double> scores;
  // Index of the best route, the first one on ties.
  int winner = 0;
};

struct ComparisonResult {
  std::vector<CriterionComparison> detailed_comparison;
  // Index and id of the route with the highest mean score over the criteria.
  int best_route = 0;
  std::string best_route_id;
  double best_score = 0.0;
  std::vector<std::string> reasons;
};

// Compares `routes` on each of `criteria`, every criterion once, in the given
// order. An empty criteria list compares on all of them. Returns
// InvalidArgument when `routes` is empty or a criterion is repeated.
absl::StatusOr<ComparisonResult> CompareRoutes(
    absl::Span<const RouteOutcome> routes,
    absl::Span<const ComparisonCriterion> criteria);

}  // namespace route_optimization

#endif  // ROUTEOPT_VALIDATION_ROUTE_COMPARISON_H_
