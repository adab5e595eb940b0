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


#ifndef ROUTEOPT_SCORING_RECOMMENDATIONS_H_
#define ROUTEOPT_SCORING_RECOMMENDATIONS_H_

#include <string>
#include <vector>

#include "absl/types/span.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// What the recommendation rules look at besides the context snapshot.
struct RecommendationInputs {
  FuelType fuel_type = FuelType::kDiesel;
  std::vector<std::string> unassigned_destination_ids;
  bool below_feasibility_threshold = false;
};

// Evaluates every rule independently and returns the messages of the rules
// that fire, in a fixed rule order.
std::vector<std::string> GenerateRecommendations(
    const RealTimeContext& context, const RecommendationInputs& inputs,
    const RecommendationParameters& params);

}  // namespace route_optimization

#endif  // ROUTEOPT_SCORING_RECOMMENDATIONS_H_
