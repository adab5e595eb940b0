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

#include "routeopt/context/context_provider.h"

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/base/logging.h"
#include "routeopt/base/protoutil.h"
#include "routeopt/base/threadpool.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/context/real_time_data_source.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

constexpr int kNumFetchThreads = 3;

// Result slot of one asynchronous fetch. Shared between the pool task and the
// waiting caller so that a fetch finishing after its timeout writes into
// memory that is still alive.
template <typename T>
struct PendingFetch {
  absl::Notification done;
  absl::StatusOr<T> result = absl::UnknownError("Fetch did not run");
};

template <typename T>
std::shared_ptr<PendingFetch<T>> ScheduleFetch(
    ThreadPool* pool, std::function<absl::StatusOr<T>()> fetch) {
  auto pending = std::make_shared<PendingFetch<T>>();
  pool->Schedule([pending, fetch = std::move(fetch)]() {
    pending->result = fetch();
    pending->done.Notify();
  });
  return pending;
}

template <typename T>
absl::StatusOr<T> AwaitFetch(absl::string_view signal,
                             PendingFetch<T>* pending, absl::Time deadline) {
  if (!pending->done.WaitForNotificationWithDeadline(deadline)) {
    return absl::DeadlineExceededError(
        absl::StrCat(signal, " fetch timed out"));
  }
  return pending->result;
}

// Returns the fetched value, or the last known good value, or `fallback`, in
// this order. Records the degradation on `context` in the last two cases.
template <typename T>
T ResolveSignal(absl::string_view signal, absl::StatusOr<T> fetched,
                std::optional<T>* last_known_good, const T& fallback,
                RealTimeContext* context) {
  if (fetched.ok()) {
    *last_known_good = *fetched;
    return *std::move(fetched);
  }
  context->stale = true;
  context->degraded_signals.push_back(std::string(signal));
  if (last_known_good->has_value()) {
    LOG(WARNING) << "Using last known " << signal
                 << " observation: " << fetched.status();
    return **last_known_good;
  }
  LOG(WARNING) << "Using default " << signal
               << " observation: " << fetched.status();
  return fallback;
}

bool InHourRange(int hour, int start, int end) {
  return hour >= start && hour <= end;
}

}  // namespace

TrafficConditions DefaultTrafficConditions(const ContextParameters& params) {
  TrafficConditions traffic;
  traffic.congestion_level = params.default_congestion_level();
  traffic.average_speed_kmh = params.default_average_speed_kmh();
  return traffic;
}

WeatherConditions DefaultWeatherConditions(const ContextParameters& params) {
  WeatherConditions weather;
  weather.temperature_c = params.default_temperature_c();
  weather.humidity_percent = params.default_humidity_percent();
  weather.wind_speed_kmh = params.default_wind_speed_kmh();
  weather.precipitation_mm_per_h = params.default_precipitation_mm_per_h();
  weather.visibility_km = params.default_visibility_km();
  weather.road_condition = RoadCondition::kDry;
  return weather;
}

FuelPrices DefaultFuelPrices(const ContextParameters& params) {
  FuelPrices prices;
  prices.diesel = params.default_diesel_price();
  prices.gasoline = params.default_gasoline_price();
  prices.electric = params.default_electric_price();
  return prices;
}

TimeFactors ComputeTimeFactors(absl::Time time,
                               const ContextParameters& params) {
  absl::TimeZone time_zone;
  if (!absl::LoadTimeZone(params.time_zone(), &time_zone)) {
    time_zone = absl::UTCTimeZone();
  }
  const absl::CivilSecond civil = absl::ToCivilSecond(time, time_zone);
  const absl::Weekday weekday = absl::GetWeekday(civil);
  const int hour = civil.hour();

  TimeFactors factors;
  factors.is_weekend = weekday == absl::Weekday::saturday ||
                       weekday == absl::Weekday::sunday;
  const bool morning_rush = InHourRange(hour, params.morning_rush_start_hour(),
                                        params.morning_rush_end_hour());
  const bool evening_rush = InHourRange(hour, params.evening_rush_start_hour(),
                                        params.evening_rush_end_hour());
  factors.is_rush_hour = morning_rush || evening_rush;
  if (factors.is_weekend) {
    factors.traffic_multiplier = params.weekend_multiplier();
  } else if (morning_rush) {
    factors.traffic_multiplier = params.morning_rush_multiplier();
  } else if (evening_rush) {
    factors.traffic_multiplier = params.evening_rush_multiplier();
  }
  return factors;
}

RealTimeContextProvider::RealTimeContextProvider(
    RealTimeDataSource* source, const ContextParameters& params)
    : source_(source),
      params_(params),
      fetch_timeout_(util_time::DecodeGoogleApiProto(params.fetch_timeout())
                         .value_or(absl::ZeroDuration())),
      pool_("context-fetch", kNumFetchThreads) {
  CHECK(source_ != nullptr);
  pool_.StartWorkers();
}

RealTimeContext RealTimeContextProvider::GetContext(
    const GeoPoint& origin, absl::Span<const GeoPoint> destinations,
    absl::string_view region, const RealTimeFactorFlags& flags,
    absl::Time now) {
  // The tasks may outlive this call when they time out: they own copies of
  // their arguments.
  auto points = std::make_shared<const std::vector<GeoPoint>>(
      destinations.begin(), destinations.end());
  const std::string region_copy(region);
  RealTimeDataSource* const source = source_;

  std::shared_ptr<PendingFetch<TrafficConditions>> traffic_fetch;
  std::shared_ptr<PendingFetch<WeatherConditions>> weather_fetch;
  std::shared_ptr<PendingFetch<FuelPrices>> fuel_fetch;
  if (flags.include_traffic) {
    traffic_fetch = ScheduleFetch<TrafficConditions>(
        &pool_, [source, origin, points]() {
          return source->GetTraffic(origin, *points);
        });
  }
  if (flags.include_weather) {
    weather_fetch = ScheduleFetch<WeatherConditions>(
        &pool_, [source, origin, points]() {
          return source->GetWeather(origin, *points);
        });
  }
  if (flags.include_fuel_prices) {
    fuel_fetch = ScheduleFetch<FuelPrices>(
        &pool_, [source, region_copy]() {
          return source->GetFuelPrices(region_copy);
        });
  }
  const absl::Time deadline = absl::Now() + fetch_timeout_;

  absl::StatusOr<TrafficConditions> traffic =
      absl::CancelledError("traffic not requested");
  absl::StatusOr<WeatherConditions> weather =
      absl::CancelledError("weather not requested");
  absl::StatusOr<FuelPrices> fuel_prices =
      absl::CancelledError("fuel prices not requested");
  if (traffic_fetch != nullptr) {
    traffic = AwaitFetch("traffic", traffic_fetch.get(), deadline);
  }
  if (weather_fetch != nullptr) {
    weather = AwaitFetch("weather", weather_fetch.get(), deadline);
  }
  if (fuel_fetch != nullptr) {
    fuel_prices = AwaitFetch("fuel_prices", fuel_fetch.get(), deadline);
  }

  RealTimeContext context;
  context.snapshot_time = now;
  context.traffic = DefaultTrafficConditions(params_);
  context.weather = DefaultWeatherConditions(params_);
  context.fuel_prices = DefaultFuelPrices(params_);
  {
    absl::MutexLock lock(&mutex_);
    if (traffic_fetch != nullptr) {
      context.traffic = ResolveSignal("traffic", std::move(traffic),
                                      &last_traffic_, context.traffic,
                                      &context);
      context.traffic.congestion_level =
          std::clamp(context.traffic.congestion_level, 0.0, 1.0);
    }
    if (weather_fetch != nullptr) {
      context.weather = ResolveSignal("weather", std::move(weather),
                                      &last_weather_, context.weather,
                                      &context);
    }
    if (fuel_fetch != nullptr) {
      context.fuel_prices =
          ResolveSignal("fuel_prices", std::move(fuel_prices),
                        &last_fuel_prices_, context.fuel_prices, &context);
    }
  }
  if (flags.include_time_of_day) {
    context.time_factors = ComputeTimeFactors(now, params_);
  }
  VLOG(1) << "Context snapshot at " << now
          << ": congestion=" << context.traffic.congestion_level
          << " road=" << RoadConditionName(context.weather.road_condition)
          << " multiplier=" << context.time_factors.traffic_multiplier
          << (context.stale ? " (stale)" : "");
  return context;
}

}  // namespace route_optimization
