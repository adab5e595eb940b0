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

#include "routeopt/context/real_time_data_source.h"

#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "routeopt/model/types.h"

namespace route_optimization {

StaticRealTimeDataSource::StaticRealTimeDataSource(TrafficConditions traffic,
                                                   WeatherConditions weather,
                                                   FuelPrices fuel_prices)
    : error_(absl::OkStatus()),
      traffic_(std::move(traffic)),
      weather_(std::move(weather)),
      fuel_prices_(fuel_prices) {}

StaticRealTimeDataSource::StaticRealTimeDataSource(absl::Status error)
    : error_(std::move(error)) {
  CHECK(!error_.ok()) << "Use the observation constructor for OK sources";
}

absl::StatusOr<TrafficConditions> StaticRealTimeDataSource::GetTraffic(
    const GeoPoint&, absl::Span<const GeoPoint>) {
  if (!error_.ok()) return error_;
  return traffic_;
}

absl::StatusOr<WeatherConditions> StaticRealTimeDataSource::GetWeather(
    const GeoPoint&, absl::Span<const GeoPoint>) {
  if (!error_.ok()) return error_;
  return weather_;
}

absl::StatusOr<FuelPrices> StaticRealTimeDataSource::GetFuelPrices(
    absl::string_view) {
  if (!error_.ok()) return error_;
  return fuel_prices_;
}

}  // namespace route_optimization
