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


#include "routeopt/validation/route_comparison.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

bool HigherIsBetter(ComparisonCriterion criterion) {
  return criterion == ComparisonCriterion::kEfficiency ||
         criterion == ComparisonCriterion::kFeasibility;
}

double CriterionValue(const RouteOutcome& outcome,
                      ComparisonCriterion criterion) {
  switch (criterion) {
    case ComparisonCriterion::kCost:
      return outcome.cost.total_cost;
    case ComparisonCriterion::kDuration:
      return absl::ToDoubleMinutes(outcome.route.total_duration);
    case ComparisonCriterion::kDistance:
      return outcome.route.total_distance_km;
    case ComparisonCriterion::kEfficiency:
      return outcome.route.efficiency;
    case ComparisonCriterion::kEmissions:
      return outcome.sustainability.co2_emissions_kg;
    case ComparisonCriterion::kFeasibility:
      return outcome.route.feasibility;
  }
  return 0.0;
}

CriterionComparison Compare(absl::Span<const RouteOutcome> routes,
                            ComparisonCriterion criterion) {
  std::vector<double> values;
  values.reserve(routes.size());
  for (const RouteOutcome& outcome : routes) {
    values.push_back(CriterionValue(outcome, criterion));
  }
  const auto [min_it, max_it] =
      std::minmax_element(values.begin(), values.end());
  const double min_value = *min_it;
  const double range = *max_it - min_value;

  CriterionComparison comparison;
  comparison.criterion = criterion;
  comparison.scores.reserve(values.size());
  for (const double value : values) {
    double score = range > 0 ? (value - min_value) / range : 1.0;
    if (!HigherIsBetter(criterion) && range > 0) score = 1.0 - score;
    comparison.scores.push_back(score);
  }
  comparison.winner =
      std::max_element(comparison.scores.begin(), comparison.scores.end()) -
      comparison.scores.begin();
  return comparison;
}

}  // namespace

absl::string_view ComparisonCriterionName(ComparisonCriterion criterion) {
  switch (criterion) {
    case ComparisonCriterion::kCost:
      return "cost";
    case ComparisonCriterion::kDuration:
      return "duration";
    case ComparisonCriterion::kDistance:
      return "distance";
    case ComparisonCriterion::kEfficiency:
      return "efficiency";
    case ComparisonCriterion::kEmissions:
      return "emissions";
    case ComparisonCriterion::kFeasibility:
      return "feasibility";
  }
  return "unknown";
}

absl::StatusOr<ComparisonCriterion> ParseComparisonCriterion(
    absl::string_view name) {
  for (const ComparisonCriterion criterion : kAllComparisonCriteria) {
    if (ComparisonCriterionName(criterion) == name) return criterion;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown comparison criterion: ", name));
}

absl::StatusOr<ComparisonResult> CompareRoutes(
    absl::Span<const RouteOutcome> routes,
    absl::Span<const ComparisonCriterion> criteria) {
  if (routes.empty()) {
    return absl::InvalidArgumentError("No route to compare");
  }
  if (criteria.empty()) criteria = kAllComparisonCriteria;
  absl::flat_hash_set<ComparisonCriterion> seen;
  for (const ComparisonCriterion criterion : criteria) {
    if (!seen.insert(criterion).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Criterion ", ComparisonCriterionName(criterion),
                       " is listed more than once"));
    }
  }

  ComparisonResult result;
  std::vector<double> total(routes.size(), 0.0);
  for (const ComparisonCriterion criterion : criteria) {
    CriterionComparison comparison = Compare(routes, criterion);
    for (int i = 0; i < routes.size(); ++i) total[i] += comparison.scores[i];
    result.detailed_comparison.push_back(std::move(comparison));
  }
  result.best_route =
      std::max_element(total.begin(), total.end()) - total.begin();
  result.best_route_id = routes[result.best_route].route_id;
  result.best_score = total[result.best_route] / criteria.size();
  for (const CriterionComparison& comparison : result.detailed_comparison) {
    if (comparison.winner == result.best_route) {
      result.reasons.push_back(absl::StrCat(
          "Best ", ComparisonCriterionName(comparison.criterion)));
    }
  }
  if (result.reasons.empty()) {
    result.reasons.push_back("Best balance across the compared criteria");
  }
  return result;
}

}  // namespace route_optimization
