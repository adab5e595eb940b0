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

#ifndef ROUTEOPT_CONTEXT_REAL_TIME_DATA_SOURCE_H_
#define ROUTEOPT_CONTEXT_REAL_TIME_DATA_SOURCE_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// Provider of traffic, weather and fuel price observations. Implementations
// wrap external services; they may block, fail or be slow, and must be safe
// to call concurrently from several threads.
class RealTimeDataSource {
 public:
  virtual ~RealTimeDataSource() = default;

  virtual absl::StatusOr<TrafficConditions> GetTraffic(
      const GeoPoint& origin, absl::Span<const GeoPoint> destinations) = 0;
  virtual absl::StatusOr<WeatherConditions> GetWeather(
      const GeoPoint& origin, absl::Span<const GeoPoint> destinations) = 0;
  virtual absl::StatusOr<FuelPrices> GetFuelPrices(
      absl::string_view region) = 0;
};

// Data source returning fixed observations, or a fixed error for every
// signal when constructed with a non-OK status. Used by the example binary
// and as a stand-in when no provider is wired.
class StaticRealTimeDataSource : public RealTimeDataSource {
 public:
  StaticRealTimeDataSource(TrafficConditions traffic,
                           WeatherConditions weather, FuelPrices fuel_prices);
  explicit StaticRealTimeDataSource(absl::Status error);

  absl::StatusOr<TrafficConditions> GetTraffic(
      const GeoPoint& origin, absl::Span<const GeoPoint> destinations) override;
  absl::StatusOr<WeatherConditions> GetWeather(
      const GeoPoint& origin, absl::Span<const GeoPoint> destinations) override;
  absl::StatusOr<FuelPrices> GetFuelPrices(absl::string_view region) override;

 private:
  const absl::Status error_;
  const TrafficConditions traffic_;
  const WeatherConditions weather_;
  const FuelPrices fuel_prices_;
};

}  // namespace route_optimization

#endif  // ROUTEOPT_CONTEXT_REAL_TIME_DATA_SOURCE_H_
