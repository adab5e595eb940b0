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


#ifndef ROUTEOPT_SCORING_RANKING_H_
#define ROUTEOPT_SCORING_RANKING_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// Relative importance of the ranking criteria. Weights must be non-negative
// and need not sum to 1.
struct RankingWeights {
  double cost = 1.0;
  double speed = 1.0;
  double sustainability = 1.0;
};

// The quantities a route is ranked on.
struct RouteMetrics {
  double cost = 0.0;
  absl::Duration duration = absl::ZeroDuration();
  double co2_kg = 0.0;
};

struct RankedRoute {
  // Position of the route in the ranked input.
  int index = 0;
  double cost_score = 0.0;
  double speed_score = 0.0;
  double sustainability_score = 0.0;
  double score = 0.0;
};

absl::Status ValidateRankingWeights(const RankingWeights& weights);

// Sub-score of `value` against a fixed reference `ceiling`: 1 at 0, decreasing
// linearly down to 0 at and beyond the ceiling.
double CeilingScore(double value, double ceiling);

// Scores every route and returns them by decreasing score, ties broken by
// lower cost and then by input position. Sub-scores are normalized against
// the ceilings of `params`, never against the other routes, so the score of a
// route does not depend on the rest of the set.
absl::StatusOr<std::vector<RankedRoute>> RankRoutes(
    absl::Span<const RouteMetrics> routes, const RankingWeights& weights,
    const ScoringParameters& params);

// Ranks multimodal routes on their totals and returns them best first, with
// their score filled.
absl::StatusOr<std::vector<MultimodalRoute>> RankMultimodalRoutes(
    std::vector<MultimodalRoute> routes, const RankingWeights& weights,
    const ScoringParameters& params);

}  // namespace route_optimization

#endif  // ROUTEOPT_SCORING_RANKING_H_
