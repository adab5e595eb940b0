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

#ifndef ROUTEOPT_CONTEXT_CONTEXT_PROVIDER_H_
#define ROUTEOPT_CONTEXT_CONTEXT_PROVIDER_H_

#include <optional>

#include "absl/base/thread_annotations.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/base/threadpool.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/context/real_time_data_source.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// Neutral observations used when a signal is disabled or when it could not be
// fetched and no earlier observation is available.
TrafficConditions DefaultTrafficConditions(const ContextParameters& params);
WeatherConditions DefaultWeatherConditions(const ContextParameters& params);
FuelPrices DefaultFuelPrices(const ContextParameters& params);

// Rush hour, weekend and time-of-day traffic multiplier at `time`, observed in
// the configured time zone. A weekend multiplier takes precedence over rush
// hours. Holidays are not detected.
TimeFactors ComputeTimeFactors(absl::Time time, const ContextParameters& params);

// Assembles RealTimeContext snapshots from a RealTimeDataSource.
//
// The traffic, weather and fuel price fetches of one snapshot run
// concurrently on an internal pool and are each bounded by the configured
// fetch timeout. A failed or late fetch never fails the snapshot: the last
// observation successfully fetched for that signal is used if there is one,
// the static default otherwise, and the snapshot is marked stale with the
// name of the degraded signal.
//
// Thread-safe. `source` must outlive the provider.
class RealTimeContextProvider {
 public:
  RealTimeContextProvider(RealTimeDataSource* source,
                          const ContextParameters& params);

  RealTimeContextProvider(const RealTimeContextProvider&) = delete;
  RealTimeContextProvider& operator=(const RealTimeContextProvider&) = delete;

  RealTimeContext GetContext(const GeoPoint& origin,
                             absl::Span<const GeoPoint> destinations,
                             absl::string_view region,
                             const RealTimeFactorFlags& flags, absl::Time now);

 private:
  RealTimeDataSource* const source_;
  const ContextParameters params_;
  const absl::Duration fetch_timeout_;

  absl::Mutex mutex_;
  std::optional<TrafficConditions> last_traffic_ ABSL_GUARDED_BY(mutex_);
  std::optional<WeatherConditions> last_weather_ ABSL_GUARDED_BY(mutex_);
  std::optional<FuelPrices> last_fuel_prices_ ABSL_GUARDED_BY(mutex_);

  // Declared last so that pending fetches are drained before the members
  // above are destroyed.
  ThreadPool pool_;
};

}  // namespace route_optimization

#endif  // ROUTEOPT_CONTEXT_CONTEXT_PROVIDER_H_
