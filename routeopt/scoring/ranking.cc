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


#include "routeopt/scoring/ranking.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/base/protoutil.h"
#include "routeopt/base/status_macros.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

absl::Status ValidateRankingWeights(const RankingWeights& weights) {
  if (!(weights.cost >= 0) || !(weights.speed >= 0) ||
      !(weights.sustainability >= 0)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Ranking weights must be non-negative, got cost=", weights.cost,
        " speed=", weights.speed, " sustainability=", weights.sustainability));
  }
  return absl::OkStatus();
}

double CeilingScore(double value, double ceiling) {
  return 1.0 - std::clamp(value / ceiling, 0.0, 1.0);
}

absl::StatusOr<std::vector<RankedRoute>> RankRoutes(
    absl::Span<const RouteMetrics> routes, const RankingWeights& weights,
    const ScoringParameters& params) {
  RETURN_IF_ERROR(ValidateRankingWeights(weights));
  ASSIGN_OR_RETURN(const absl::Duration duration_ceiling,
                   util_time::DecodeGoogleApiProto(params.duration_ceiling()));
  std::vector<RankedRoute> ranked;
  ranked.reserve(routes.size());
  for (int i = 0; i < routes.size(); ++i) {
    const RouteMetrics& metrics = routes[i];
    RankedRoute entry;
    entry.index = i;
    entry.cost_score = CeilingScore(metrics.cost, params.cost_ceiling());
    entry.speed_score =
        CeilingScore(absl::ToDoubleHours(metrics.duration),
                     absl::ToDoubleHours(duration_ceiling));
    entry.sustainability_score =
        CeilingScore(metrics.co2_kg, params.co2_ceiling_kg());
    entry.score = weights.cost * entry.cost_score +
                  weights.speed * entry.speed_score +
                  weights.sustainability * entry.sustainability_score;
    ranked.push_back(entry);
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [&routes](const RankedRoute& a, const RankedRoute& b) {
                     if (a.score != b.score) return a.score > b.score;
                     return routes[a.index].cost < routes[b.index].cost;
                   });
  return ranked;
}

absl::StatusOr<std::vector<MultimodalRoute>> RankMultimodalRoutes(
    std::vector<MultimodalRoute> routes, const RankingWeights& weights,
    const ScoringParameters& params) {
  std::vector<RouteMetrics> metrics;
  metrics.reserve(routes.size());
  for (const MultimodalRoute& route : routes) {
    metrics.push_back({route.total_cost, route.total_duration,
                       route.total_co2_kg});
  }
  ASSIGN_OR_RETURN(const std::vector<RankedRoute> ranked,
                   RankRoutes(metrics, weights, params));
  std::vector<MultimodalRoute> result;
  result.reserve(routes.size());
  for (const RankedRoute& entry : ranked) {
    result.push_back(std::move(routes[entry.index]));
    result.back().score = entry.score;
  }
  return result;
}

}  // namespace route_optimization
