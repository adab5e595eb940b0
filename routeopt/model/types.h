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

#ifndef ROUTEOPT_MODEL_TYPES_H_
#define ROUTEOPT_MODEL_TYPES_H_

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace route_optimization {

/// Value types shared by every component of the engine. They are created
/// fresh for each invocation, never mutated after construction by the
/// engine, and carry no cross-request state. Keeping them outside the
/// orchestrator lets small libraries (cost model, validation, multimodal
/// planning) depend on them without depending on the whole optimizer.

struct GeoPoint {
  double latitude = 0.0;
  double longitude = 0.0;
};

bool operator==(const GeoPoint& a, const GeoPoint& b);
inline bool operator!=(const GeoPoint& a, const GeoPoint& b) {
  return !(a == b);
}

// An unbounded window is represented by infinite endpoints.
struct TimeWindow {
  absl::Time start = absl::InfinitePast();
  absl::Time end = absl::InfiniteFuture();

  bool HasStart() const { return start != absl::InfinitePast(); }
  bool HasEnd() const { return end != absl::InfiniteFuture(); }
};

enum class Priority { kHigh, kMedium, kLow };
enum class FuelType { kDiesel, kGasoline, kElectric, kHybrid };
enum class RoadCondition { kDry, kWet, kIcy, kSnowy };
enum class IncidentType { kAccident, kConstruction, kWeather, kOther };
enum class Severity { kLow, kMedium, kHigh };

// Identifiers of the route construction strategies. The order is the
// registration order of the default solver registry.
enum class SolverAlgorithm {
  kNearestNeighbor,
  kSavings,
  kSimulatedAnnealing,
  kGenetic,
  kAntColony,
};

inline constexpr SolverAlgorithm kAllSolverAlgorithms[] = {
    SolverAlgorithm::kNearestNeighbor, SolverAlgorithm::kSavings,
    SolverAlgorithm::kSimulatedAnnealing, SolverAlgorithm::kGenetic,
    SolverAlgorithm::kAntColony};

absl::string_view PriorityName(Priority priority);
absl::string_view FuelTypeName(FuelType fuel_type);
absl::string_view RoadConditionName(RoadCondition condition);
absl::string_view SolverAlgorithmName(SolverAlgorithm algorithm);

// ----- Request -----

struct Origin {
  GeoPoint location;
  std::string address;
  TimeWindow time_window;
};

struct Destination {
  std::string id;
  GeoPoint location;
  std::string address;
  Priority priority = Priority::kMedium;
  TimeWindow time_window;
  absl::Duration service_time = absl::ZeroDuration();
  double weight_kg = 0.0;
  double volume_m3 = 0.0;
  std::vector<std::string> special_requirements;
};

struct VehicleProfile {
  std::string id;
  double capacity_kg = 0.0;
  double volume_capacity_m3 = 0.0;
  FuelType fuel_type = FuelType::kDiesel;
  GeoPoint current_location;
  std::string driver_id;
  std::vector<std::string> driver_skills;
};

struct Constraints {
  absl::Duration max_route_duration = absl::InfiniteDuration();
  double max_distance_km = std::numeric_limits<double>::infinity();
  bool avoid_tolls = false;
  bool avoid_highways = false;
  bool prefer_electric_charging = false;
  // Load ceilings checked by route validation. The optimizer fills them from
  // the vehicle profile.
  double max_load_weight_kg = std::numeric_limits<double>::infinity();
  double max_load_volume_m3 = std::numeric_limits<double>::infinity();
};

struct RealTimeFactorFlags {
  bool include_traffic = true;
  bool include_weather = true;
  bool include_fuel_prices = true;
  bool include_time_of_day = true;
};

// When present on a request, the selected route must be persisted before the
// optimization is reported as completed.
struct PersistDirective {
  std::string name;
  std::string description;
  std::string owner;
};

struct OptimizationRequest {
  // Generated when empty.
  std::string request_id;
  std::optional<Origin> origin;
  std::vector<Destination> destinations;
  std::optional<VehicleProfile> vehicle;
  Constraints constraints;
  RealTimeFactorFlags real_time_factors;
  // Geography hint forwarded to the fuel price provider.
  std::string region;
  std::optional<PersistDirective> persist_result;
  // Caller-visible deadline of the whole invocation. Zero means the
  // configured default.
  absl::Duration deadline = absl::ZeroDuration();
};

// ----- Real-time context -----

struct TrafficIncident {
  IncidentType type = IncidentType::kOther;
  Severity severity = Severity::kLow;
  GeoPoint location;
  std::string description;
  absl::Duration estimated_duration = absl::ZeroDuration();
};

struct TrafficConditions {
  double congestion_level = 0.0;  // In [0, 1].
  double average_speed_kmh = 0.0;
  std::vector<TrafficIncident> incidents;
};

struct WeatherConditions {
  double temperature_c = 0.0;
  double humidity_percent = 0.0;
  double wind_speed_kmh = 0.0;
  double precipitation_mm_per_h = 0.0;
  double visibility_km = 0.0;
  RoadCondition road_condition = RoadCondition::kDry;
  std::vector<std::string> warnings;
};

// Diesel and gasoline are priced per liter, electricity per kWh. Hybrid
// vehicles are billed at the gasoline price.
struct FuelPrices {
  double diesel = 0.0;
  double gasoline = 0.0;
  double electric = 0.0;

  double PriceFor(FuelType fuel_type) const;
};

struct TimeFactors {
  bool is_rush_hour = false;
  bool is_weekend = false;
  bool is_holiday = false;
  double traffic_multiplier = 1.0;
};

// Immutable snapshot shared by all solvers and models of one run.
struct RealTimeContext {
  TrafficConditions traffic;
  WeatherConditions weather;
  FuelPrices fuel_prices;
  TimeFactors time_factors;
  absl::Time snapshot_time = absl::UnixEpoch();
  // Set when at least one requested signal could not be fetched and a
  // last-known-good or default value was used instead.
  bool stale = false;
  std::vector<std::string> degraded_signals;
};

// ----- Candidate routes and their enrichment -----

struct Stop {
  std::string destination_id;
  absl::Time arrival_time = absl::UnixEpoch();
  absl::Time departure_time = absl::UnixEpoch();
  absl::Duration service_time = absl::ZeroDuration();
  absl::Duration waiting_time = absl::ZeroDuration();
  // Arrival past the end of the time window.
  absl::Duration lateness = absl::ZeroDuration();
  double distance_from_previous_km = 0.0;
  // Cost of the driving and waiting attributed to this stop.
  double estimated_cost = 0.0;
  TimeWindow time_window;
};

struct CandidateRoute {
  SolverAlgorithm algorithm = SolverAlgorithm::kNearestNeighbor;
  absl::Time departure_time = absl::UnixEpoch();
  std::vector<Stop> stops;
  double total_distance_km = 0.0;
  absl::Duration total_duration = absl::ZeroDuration();
  double efficiency = 0.0;   // In [0, 1].
  double feasibility = 0.0;  // In [0, 1].
  absl::Duration time_savings = absl::ZeroDuration();
  double load_weight_kg = 0.0;
  double load_volume_m3 = 0.0;
};

struct CostBreakdown {
  double fuel_cost = 0.0;
  double driver_cost = 0.0;
  double vehicle_cost = 0.0;
  double toll_cost = 0.0;
  double penalty_cost = 0.0;
  // Always fuel + driver + vehicle + toll + penalty.
  double total_cost = 0.0;
  // Liters (kWh for electric vehicles).
  double fuel_consumption = 0.0;
  double cost_savings = 0.0;
};

struct SustainabilityMetrics {
  double co2_emissions_kg = 0.0;
  // Distance per unit of fuel.
  double fuel_efficiency = 0.0;
  double environmental_score = 0.0;  // In [0, 100].
  std::vector<std::string> recommendations;
};

struct RouteOutcome {
  std::string route_id;
  std::string vehicle_id;
  std::string driver_id;
  CandidateRoute route;
  CostBreakdown cost;
  SustainabilityMetrics sustainability;
};

struct OptimizationSummary {
  int total_routes = 0;
  double total_distance_km = 0.0;
  absl::Duration total_duration = absl::ZeroDuration();
  double total_cost = 0.0;
  double average_efficiency = 0.0;
  std::vector<std::string> unassigned_destinations;
  std::vector<std::string> recommendations;
};

enum class OptimizationState {
  kCollectingContext,
  kRunningSolvers,
  kSelectingBest,
  kEnriching,
  kRecommending,
  kCompleted,
  kFailed,
};

absl::string_view OptimizationStateName(OptimizationState state);

struct SolverRunReport {
  SolverAlgorithm algorithm = SolverAlgorithm::kNearestNeighbor;
  absl::Status status;
  absl::Duration wall_time = absl::ZeroDuration();
};

struct OptimizationResult {
  std::string request_id;
  std::vector<RouteOutcome> routes;
  OptimizationSummary summary;
  // Degradations that did not fail the run.
  std::vector<std::string> warnings;
  bool stale_context = false;
  bool below_feasibility_threshold = false;
  std::vector<SolverRunReport> solver_reports;
  std::vector<OptimizationState> state_trace;
  // Set when the request asked for the result to be persisted.
  std::string saved_route_id;
};

// ----- Multimodal shipments -----

enum class TransportMode { kRoad, kSea, kAir, kRail };
enum class ServiceType { kFtl, kLtl, kFcl, kLcl, kExpress, kEconomy };

// Leg-sequence templates evaluated by the multimodal planner.
enum class LegTemplate { kRoad, kSea, kAir, kSeaAir, kRoadSea, kRail };

absl::string_view TransportModeName(TransportMode mode);
absl::string_view ServiceTypeName(ServiceType service_type);
absl::string_view LegTemplateName(LegTemplate leg_template);

struct Place {
  std::string name;
  GeoPoint location;
};

bool operator==(const Place& a, const Place& b);
inline bool operator!=(const Place& a, const Place& b) { return !(a == b); }

struct CargoProfile {
  double weight_kg = 0.0;
  double volume_m3 = 0.0;
  std::string description;
};

// A point-to-point shipment planned by the multimodal leg planner.
struct Shipment {
  Place origin;
  Place destination;
  CargoProfile cargo;
};

struct TransportLeg {
  // 1-based, contiguous and strictly increasing within a route.
  int sequence = 0;
  TransportMode mode = TransportMode::kRoad;
  ServiceType service_type = ServiceType::kFtl;
  Place origin;
  Place destination;
  std::string carrier;
  double distance_km = 0.0;
  absl::Duration duration = absl::ZeroDuration();
  double cost = 0.0;
  double co2_kg = 0.0;
};

struct MultimodalRoute {
  LegTemplate route_template = LegTemplate::kRoad;
  std::vector<TransportLeg> legs;
  double total_cost = 0.0;
  absl::Duration total_duration = absl::ZeroDuration();
  double total_co2_kg = 0.0;
  // Filled by the ranking engine.
  double score = 0.0;
};

}  // namespace route_optimization

#endif  // ROUTEOPT_MODEL_TYPES_H_
