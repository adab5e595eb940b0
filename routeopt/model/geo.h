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

#ifndef ROUTEOPT_MODEL_GEO_H_
#define ROUTEOPT_MODEL_GEO_H_

#include <vector>

#include "absl/types/span.h"
#include "routeopt/model/types.h"

namespace route_optimization {

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance between two points, in kilometers.
double HaversineDistanceKm(const GeoPoint& from, const GeoPoint& to);

// Symmetric distance matrix over `points`, in kilometers.
std::vector<std::vector<double>> BuildDistanceMatrix(
    absl::Span<const GeoPoint> points);

}  // namespace route_optimization

#endif  // ROUTEOPT_MODEL_GEO_H_
