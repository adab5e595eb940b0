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

#include "routeopt/model/geo.h"

#include <cmath>
#include <cstddef>
#include <vector>

#include "absl/types/span.h"

namespace route_optimization {
namespace {

double ToRadians(double degrees) { return degrees * M_PI / 180.0; }

}  // namespace

double HaversineDistanceKm(const GeoPoint& from, const GeoPoint& to) {
  const double d_lat = ToRadians(to.latitude - from.latitude);
  const double d_lon = ToRadians(to.longitude - from.longitude);
  const double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                   std::cos(ToRadians(from.latitude)) *
                       std::cos(ToRadians(to.latitude)) *
                       std::sin(d_lon / 2) * std::sin(d_lon / 2);
  const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return kEarthRadiusKm * c;
}

std::vector<std::vector<double>> BuildDistanceMatrix(
    absl::Span<const GeoPoint> points) {
  const size_t size = points.size();
  std::vector<std::vector<double>> matrix(size, std::vector<double>(size, 0.0));
  for (size_t i = 0; i < size; ++i) {
    for (size_t j = i + 1; j < size; ++j) {
      const double distance = HaversineDistanceKm(points[i], points[j]);
      matrix[i][j] = distance;
      matrix[j][i] = distance;
    }
  }
  return matrix;
}

}  // namespace route_optimization
