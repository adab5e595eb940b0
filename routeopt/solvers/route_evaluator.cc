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

#include "routeopt/solvers/route_evaluator.h"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/base/logging.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/geo.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

// Added to the objective for every hard violation, so that local search moves
// away from infeasible orders before trading off distance.
constexpr double kHardViolationPenalty = 1e6;

double RoadConditionSpeedFactor(RoadCondition condition,
                                const TravelParameters& params) {
  switch (condition) {
    case RoadCondition::kDry:
      return 1.0;
    case RoadCondition::kWet:
      return params.wet_speed_factor();
    case RoadCondition::kIcy:
      return params.icy_speed_factor();
    case RoadCondition::kSnowy:
      return params.snowy_speed_factor();
  }
  return 1.0;
}

std::vector<int> IdentityOrder(int size) {
  std::vector<int> order(size);
  std::iota(order.begin(), order.end(), 0);
  return order;
}

}  // namespace

CapacityAdmission AdmitDestinations(absl::Span<const Destination> destinations,
                                    const VehicleProfile* vehicle) {
  CapacityAdmission admission;
  if (vehicle == nullptr) {
    admission.admitted.assign(destinations.begin(), destinations.end());
    return admission;
  }
  std::vector<int> ranking = IdentityOrder(destinations.size());
  std::stable_sort(ranking.begin(), ranking.end(), [&](int a, int b) {
    const Destination& da = destinations[a];
    const Destination& db = destinations[b];
    if (da.priority != db.priority) return da.priority < db.priority;
    return da.time_window.end < db.time_window.end;
  });
  std::vector<bool> admitted(destinations.size(), false);
  double weight = 0.0;
  double volume = 0.0;
  for (const int index : ranking) {
    const Destination& destination = destinations[index];
    if (weight + destination.weight_kg <= vehicle->capacity_kg &&
        volume + destination.volume_m3 <= vehicle->volume_capacity_m3) {
      weight += destination.weight_kg;
      volume += destination.volume_m3;
      admitted[index] = true;
    }
  }
  // Both lists keep the input order.
  for (int i = 0; i < destinations.size(); ++i) {
    if (admitted[i]) {
      admission.admitted.push_back(destinations[i]);
    } else {
      admission.unassigned_ids.push_back(destinations[i].id);
    }
  }
  return admission;
}

double EffectiveSpeedKmh(const RealTimeContext& context,
                         const TravelParameters& params) {
  double speed = context.traffic.average_speed_kmh > 0
                     ? context.traffic.average_speed_kmh
                     : params.default_speed_kmh();
  if (context.time_factors.traffic_multiplier > 0) {
    speed /= context.time_factors.traffic_multiplier;
  }
  speed *= RoadConditionSpeedFactor(context.weather.road_condition, params);
  return std::max(speed, params.min_speed_kmh());
}

Stop ScheduleStop(absl::Time current, double distance_km, double speed_kmh,
                  const TimeWindow& window, absl::Duration service_time) {
  DCHECK_GT(speed_kmh, 0);
  Stop stop;
  stop.distance_from_previous_km = distance_km;
  stop.arrival_time = current + absl::Hours(distance_km / speed_kmh);
  stop.time_window = window;
  stop.service_time = service_time;
  absl::Time service_start = stop.arrival_time;
  if (window.HasStart() && stop.arrival_time < window.start) {
    stop.waiting_time = window.start - stop.arrival_time;
    service_start = window.start;
  }
  if (window.HasEnd() && stop.arrival_time > window.end) {
    stop.lateness = stop.arrival_time - window.end;
  }
  stop.departure_time = service_start + service_time;
  return stop;
}

double MinimumSpanningTreeWeight(absl::Span<const GeoPoint> points) {
  // Prim's algorithm on the complete graph.
  const int size = points.size();
  if (size < 2) return 0.0;
  std::vector<bool> in_tree(size, false);
  std::vector<double> best(size, std::numeric_limits<double>::infinity());
  best[0] = 0.0;
  double weight = 0.0;
  for (int step = 0; step < size; ++step) {
    int next = -1;
    for (int i = 0; i < size; ++i) {
      if (!in_tree[i] && (next == -1 || best[i] < best[next])) next = i;
    }
    in_tree[next] = true;
    weight += best[next];
    for (int i = 0; i < size; ++i) {
      if (in_tree[i]) continue;
      best[i] = std::min(best[i], HaversineDistanceKm(points[next], points[i]));
    }
  }
  return weight;
}

RouteEvaluator::RouteEvaluator(SolverInput input,
                               const RealTimeContext& context,
                               const OptimizerParameters& params)
    : input_(std::move(input)),
      params_(params),
      speed_kmh_(EffectiveSpeedKmh(context, params.travel())),
      tolerance_(TimeWindowTolerance(params)) {
  std::vector<GeoPoint> points;
  points.reserve(input_.destinations.size() + 1);
  points.push_back(input_.origin.location);
  for (const Destination& destination : input_.destinations) {
    points.push_back(destination.location);
  }
  distances_ = BuildDistanceMatrix(points);
  const int num_nodes = points.size();
  if (num_nodes > 1) {
    double sum = 0.0;
    for (int i = 0; i < num_nodes; ++i) {
      for (int j = 0; j < num_nodes; ++j) sum += distances_[i][j];
    }
    mean_arc_distance_ = sum / (num_nodes * (num_nodes - 1));
  }
  spanning_tree_weight_ = MinimumSpanningTreeWeight(points);
  baseline_duration_ =
      Evaluate(IdentityOrder(input_.destinations.size())).duration;
}

std::vector<Stop> RouteEvaluator::Schedule(absl::Span<const int> order) const {
  DCHECK_EQ(order.size(), input_.destinations.size());
  std::vector<Stop> stops;
  stops.reserve(order.size());
  absl::Time current = input_.departure_time;
  int previous_node = 0;
  for (const int index : order) {
    const Destination& destination = input_.destinations[index];
    Stop stop = ScheduleStop(current, distances_[previous_node][index + 1],
                             speed_kmh_, destination.time_window,
                             destination.service_time);
    stop.destination_id = destination.id;
    current = stop.departure_time;
    previous_node = index + 1;
    stops.push_back(std::move(stop));
  }
  return stops;
}

RouteEvaluator::Evaluation RouteEvaluator::Evaluate(
    absl::Span<const int> order) const {
  Evaluation evaluation;
  const std::vector<Stop> stops = Schedule(order);
  for (const Stop& stop : stops) {
    evaluation.distance_km += stop.distance_from_previous_km;
    evaluation.total_lateness += stop.lateness;
    if (stop.lateness > tolerance_) ++evaluation.num_missed_windows;
  }
  if (!stops.empty()) {
    evaluation.duration = stops.back().departure_time - input_.departure_time;
  }
  evaluation.exceeds_max_duration =
      evaluation.duration > input_.constraints.max_route_duration;
  evaluation.exceeds_max_distance =
      evaluation.distance_km > input_.constraints.max_distance_km;
  const int num_hard_violations = evaluation.num_missed_windows +
                                  (evaluation.exceeds_max_duration ? 1 : 0) +
                                  (evaluation.exceeds_max_distance ? 1 : 0);
  evaluation.objective =
      evaluation.distance_km +
      params_.solver().lateness_weight_per_minute() *
          absl::ToDoubleMinutes(evaluation.total_lateness) +
      kHardViolationPenalty * num_hard_violations;
  return evaluation;
}

absl::StatusOr<CandidateRoute> RouteEvaluator::BuildCandidate(
    SolverAlgorithm algorithm, absl::Span<const int> order) const {
  if (order.size() != input_.destinations.size()) {
    return absl::InternalError(
        absl::StrCat(SolverAlgorithmName(algorithm), " visited ", order.size(),
                     " of ", input_.destinations.size(), " destinations"));
  }
  CandidateRoute route;
  route.algorithm = algorithm;
  route.departure_time = input_.departure_time;
  route.stops = Schedule(order);

  const CostParameters& cost = params_.cost();
  absl::Time previous_departure = input_.departure_time;
  absl::Duration driving_time = absl::ZeroDuration();
  double lateness_ratio_sum = 0.0;
  for (Stop& stop : route.stops) {
    if (stop.lateness > tolerance_) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Destination ", stop.destination_id, " is reached ",
          absl::FormatDuration(stop.lateness),
          " after the end of its time window"));
    }
    const absl::Duration drive = stop.arrival_time - previous_departure;
    driving_time += drive;
    stop.estimated_cost =
        stop.distance_from_previous_km * cost.vehicle_cost_per_km() +
        absl::ToDoubleHours(drive + stop.waiting_time) *
            cost.driver_hourly_rate();
    lateness_ratio_sum += std::min(1.0, absl::FDivDuration(stop.lateness,
                                                           tolerance_));
    route.total_distance_km += stop.distance_from_previous_km;
    previous_departure = stop.departure_time;
  }
  if (!route.stops.empty()) {
    route.total_duration =
        route.stops.back().departure_time - input_.departure_time;
  }
  if (route.total_duration > input_.constraints.max_route_duration) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Route duration ", absl::FormatDuration(route.total_duration),
        " exceeds the maximum of ",
        absl::FormatDuration(input_.constraints.max_route_duration)));
  }
  if (route.total_distance_km > input_.constraints.max_distance_km) {
    return absl::FailedPreconditionError(
        absl::StrCat("Route distance ", route.total_distance_km,
                     " km exceeds the maximum of ",
                     input_.constraints.max_distance_km, " km"));
  }

  route.feasibility =
      route.stops.empty() ? 1.0
                          : 1.0 - lateness_ratio_sum / route.stops.size();
  const double distance_ratio =
      route.total_distance_km > 0
          ? std::min(1.0, spanning_tree_weight_ / route.total_distance_km)
          : 1.0;
  const double driving_ratio =
      route.total_duration > absl::ZeroDuration()
          ? std::min(1.0, absl::FDivDuration(driving_time,
                                             route.total_duration))
          : 1.0;
  const double distance_weight = params_.solver().efficiency_distance_weight();
  route.efficiency = std::clamp(
      distance_weight * distance_ratio + (1 - distance_weight) * driving_ratio,
      0.0, 1.0);
  route.time_savings =
      std::max(absl::ZeroDuration(), baseline_duration_ - route.total_duration);
  for (const int index : order) {
    route.load_weight_kg += input_.destinations[index].weight_kg;
    route.load_volume_m3 += input_.destinations[index].volume_m3;
  }
  return route;
}

}  // namespace route_optimization
