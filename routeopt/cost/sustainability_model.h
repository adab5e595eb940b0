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


#ifndef ROUTEOPT_COST_SUSTAINABILITY_MODEL_H_
#define ROUTEOPT_COST_SUSTAINABILITY_MODEL_H_

#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// Emissions and environmental score of a route whose fuel consumption was
// computed by ComputeCost(). The score is the mean of a CO2 sub-score and a
// fuel efficiency sub-score, each clamped to [0, 100].
SustainabilityMetrics ComputeSustainability(
    double distance_km, double fuel_consumption, FuelType fuel_type,
    const SustainabilityParameters& params);

}  // namespace route_optimization

#endif  // ROUTEOPT_COST_SUSTAINABILITY_MODEL_H_
