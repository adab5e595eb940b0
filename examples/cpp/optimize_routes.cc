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

// Optimizes a small delivery round in Manhattan with fixed real-time
// conditions, persists the selected route in memory, then plans a container
// shipment from Istanbul to Rotterdam across transport modes.
//
// Solver and model settings can be overridden with a text proto, e.g.
//   --optimizer_parameters='solver { num_threads: 2 random_seed: 7 }'

#include <memory>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "routeopt/base/logging.h"
#include "routeopt/base/status_macros.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/context/real_time_data_source.h"
#include "routeopt/engine/route_optimizer.h"
#include "routeopt/events/event_sink.h"
#include "routeopt/model/types.h"
#include "routeopt/persistence/route_store.h"
#include "routeopt/scoring/ranking.h"

ABSL_FLAG(std::string, optimizer_parameters, "",
          "Text proto OptimizerParameters (possibly partial) that will "
          "override the DefaultOptimizerParameters()");
ABSL_FLAG(bool, persist, true, "Save the selected route in the route store.");
ABSL_FLAG(bool, plan_shipment, true,
          "Also plan the Istanbul to Rotterdam container shipment.");

namespace route_optimization {
namespace {

Destination MakeDestination(const std::string& id, double latitude,
                            double longitude, double weight_kg,
                            const absl::Time window_end) {
  Destination destination;
  destination.id = id;
  destination.location = {latitude, longitude};
  destination.service_time = absl::Minutes(10);
  destination.weight_kg = weight_kg;
  destination.volume_m3 = weight_kg / 200;
  destination.time_window.end = window_end;
  return destination;
}

OptimizationRequest ManhattanRound() {
  const absl::Time departure = absl::FromCivil(
      absl::CivilMinute(2024, 3, 12, 10, 0), absl::UTCTimeZone());
  OptimizationRequest request;
  Origin origin;
  origin.location = {40.7128, -74.0060};
  origin.address = "Lower Manhattan depot";
  origin.time_window.start = departure;
  request.origin = origin;
  request.destinations = {
      MakeDestination("times-square", 40.7589, -73.9851, 120,
                      departure + absl::Hours(2)),
      MakeDestination("empire-state", 40.7484, -73.9857, 80,
                      departure + absl::Hours(3)),
      MakeDestination("union-square", 40.7359, -73.9911, 200,
                      departure + absl::Hours(3)),
      MakeDestination("chelsea-market", 40.7424, -74.0061, 150,
                      absl::InfiniteFuture()),
      MakeDestination("grand-central", 40.7527, -73.9772, 60,
                      departure + absl::Hours(4)),
  };
  VehicleProfile vehicle;
  vehicle.id = "van-12";
  vehicle.driver_id = "driver-4";
  vehicle.capacity_kg = 1000;
  vehicle.volume_capacity_m3 = 10;
  vehicle.fuel_type = FuelType::kDiesel;
  request.vehicle = vehicle;
  request.constraints.max_route_duration = absl::Hours(8);
  request.region = "us-east";
  if (absl::GetFlag(FLAGS_persist)) {
    request.persist_result =
        PersistDirective{"Manhattan morning round", "", "dispatch"};
  }
  return request;
}

void PrintResult(const OptimizationResult& result) {
  absl::PrintF("Request %s\n", result.request_id);
  for (const RouteOutcome& outcome : result.routes) {
    const CandidateRoute& route = outcome.route;
    absl::PrintF("Route %s (%s), vehicle %s\n", outcome.route_id,
                 SolverAlgorithmName(route.algorithm), outcome.vehicle_id);
    for (const Stop& stop : route.stops) {
      absl::PrintF("  %-16s arrive %s  +%.2f km\n", stop.destination_id,
                   absl::FormatTime("%H:%M", stop.arrival_time,
                                    absl::UTCTimeZone()),
                   stop.distance_from_previous_km);
    }
    absl::PrintF("  %.2f km in %s, efficiency %.2f, feasibility %.2f\n",
                 route.total_distance_km,
                 absl::FormatDuration(route.total_duration), route.efficiency,
                 route.feasibility);
    absl::PrintF("  cost %.2f (fuel %.2f, driver %.2f, vehicle %.2f)\n",
                 outcome.cost.total_cost, outcome.cost.fuel_cost,
                 outcome.cost.driver_cost, outcome.cost.vehicle_cost);
    absl::PrintF("  CO2 %.2f kg, environmental score %.0f\n",
                 outcome.sustainability.co2_emissions_kg,
                 outcome.sustainability.environmental_score);
  }
  for (const SolverRunReport& report : result.solver_reports) {
    absl::PrintF("  %-24s %s in %s\n", SolverAlgorithmName(report.algorithm),
                 report.status.ok() ? "ok" : report.status.ToString(),
                 absl::FormatDuration(report.wall_time));
  }
  for (const std::string& warning : result.warnings) {
    absl::PrintF("Warning: %s\n", warning);
  }
  for (const std::string& recommendation : result.summary.recommendations) {
    absl::PrintF("Recommendation: %s\n", recommendation);
  }
  if (!result.saved_route_id.empty()) {
    absl::PrintF("Saved as %s\n", result.saved_route_id);
  }
}

void PrintShipmentPlan(const std::vector<MultimodalRoute>& routes) {
  absl::PrintF("Istanbul -> Rotterdam, 12 t / 40 m3\n");
  for (const MultimodalRoute& route : routes) {
    std::vector<std::string> legs;
    for (const TransportLeg& leg : route.legs) {
      legs.push_back(absl::StrFormat("%s/%s", TransportModeName(leg.mode),
                                     ServiceTypeName(leg.service_type)));
    }
    absl::PrintF("  %-9s score %.3f  cost %10.2f  %s  CO2 %8.1f kg  [%s]\n",
                 LegTemplateName(route.route_template), route.score,
                 route.total_cost, absl::FormatDuration(route.total_duration),
                 route.total_co2_kg, absl::StrJoin(legs, ", "));
  }
}

absl::Status Run() {
  ASSIGN_OR_RETURN(const OptimizerParameters params,
                   ParseOptimizerParametersOverride(
                       absl::GetFlag(FLAGS_optimizer_parameters)));

  TrafficConditions traffic;
  traffic.congestion_level = 0.45;
  traffic.average_speed_kmh = 28;
  WeatherConditions weather;
  weather.temperature_c = 9;
  weather.humidity_percent = 70;
  weather.precipitation_mm_per_h = 1.2;
  weather.visibility_km = 8;
  weather.road_condition = RoadCondition::kWet;
  FuelPrices fuel_prices;
  fuel_prices.diesel = 1.05;
  fuel_prices.gasoline = 0.95;
  fuel_prices.electric = 0.18;
  StaticRealTimeDataSource data_source(traffic, weather, fuel_prices);
  InMemoryRouteStore store;
  LoggingEventSink events;

  ASSIGN_OR_RETURN(
      std::unique_ptr<RouteOptimizer> optimizer,
      RouteOptimizer::Create(params, &data_source, &store, &events));
  ASSIGN_OR_RETURN(const OptimizationResult result,
                   optimizer->OptimizeRoutes(ManhattanRound()));
  PrintResult(result);

  if (absl::GetFlag(FLAGS_plan_shipment)) {
    Shipment shipment;
    shipment.origin = {"Istanbul", {41.0082, 28.9784}};
    shipment.destination = {"Rotterdam", {51.9244, 4.4777}};
    shipment.cargo = {12000, 40, "machine parts"};
    ASSIGN_OR_RETURN(const std::vector<MultimodalRoute> routes,
                     optimizer->PlanMultimodalRoutes(shipment,
                                                     RankingWeights()));
    PrintShipmentPlan(routes);
  }
  return absl::OkStatus();
}

}  // namespace
}  // namespace route_optimization

int main(int argc, char** argv) {
  absl::InitializeLog();
  absl::ParseCommandLine(argc, argv);
  const absl::Status status = route_optimization::Run();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
