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


#include "routeopt/persistence/route_serializer.h"

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "routeopt/base/protoutil.h"
#include "routeopt/base/status_macros.h"
#include "routeopt/model/types.h"
#include "routeopt/persistence/saved_route.pb.h"

namespace route_optimization {
namespace {

absl::StatusOr<SolverAlgorithm> ParseSolverAlgorithm(absl::string_view name) {
  for (const SolverAlgorithm algorithm : kAllSolverAlgorithms) {
    if (SolverAlgorithmName(algorithm) == name) return algorithm;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown solver algorithm: ", name));
}

absl::Status EncodeStop(const Stop& stop, SavedStop* proto) {
  proto->set_destination_id(stop.destination_id);
  ASSIGN_OR_RETURN(*proto->mutable_arrival_time(),
                   util_time::EncodeGoogleApiProto(stop.arrival_time));
  ASSIGN_OR_RETURN(*proto->mutable_departure_time(),
                   util_time::EncodeGoogleApiProto(stop.departure_time));
  ASSIGN_OR_RETURN(*proto->mutable_service_time(),
                   util_time::EncodeGoogleApiProto(stop.service_time));
  ASSIGN_OR_RETURN(*proto->mutable_waiting_time(),
                   util_time::EncodeGoogleApiProto(stop.waiting_time));
  ASSIGN_OR_RETURN(*proto->mutable_lateness(),
                   util_time::EncodeGoogleApiProto(stop.lateness));
  proto->set_distance_from_previous_km(stop.distance_from_previous_km);
  proto->set_estimated_cost(stop.estimated_cost);
  if (stop.time_window.HasStart()) {
    ASSIGN_OR_RETURN(*proto->mutable_window_start(),
                     util_time::EncodeGoogleApiProto(stop.time_window.start));
  }
  if (stop.time_window.HasEnd()) {
    ASSIGN_OR_RETURN(*proto->mutable_window_end(),
                     util_time::EncodeGoogleApiProto(stop.time_window.end));
  }
  return absl::OkStatus();
}

absl::StatusOr<Stop> DecodeStop(const SavedStop& proto) {
  Stop stop;
  stop.destination_id = proto.destination_id();
  stop.arrival_time = util_time::DecodeGoogleApiProto(proto.arrival_time());
  stop.departure_time =
      util_time::DecodeGoogleApiProto(proto.departure_time());
  ASSIGN_OR_RETURN(stop.service_time,
                   util_time::DecodeGoogleApiProto(proto.service_time()));
  ASSIGN_OR_RETURN(stop.waiting_time,
                   util_time::DecodeGoogleApiProto(proto.waiting_time()));
  ASSIGN_OR_RETURN(stop.lateness,
                   util_time::DecodeGoogleApiProto(proto.lateness()));
  stop.distance_from_previous_km = proto.distance_from_previous_km();
  stop.estimated_cost = proto.estimated_cost();
  if (proto.has_window_start()) {
    stop.time_window.start =
        util_time::DecodeGoogleApiProto(proto.window_start());
  }
  if (proto.has_window_end()) {
    stop.time_window.end = util_time::DecodeGoogleApiProto(proto.window_end());
  }
  return stop;
}

}  // namespace

absl::StatusOr<SavedRoutePayload> ToSavedRoutePayload(
    absl::string_view request_id, const RouteOutcome& outcome) {
  const CandidateRoute& route = outcome.route;
  SavedRoutePayload payload;
  payload.set_request_id(std::string(request_id));
  payload.set_algorithm(std::string(SolverAlgorithmName(route.algorithm)));
  payload.set_vehicle_id(outcome.vehicle_id);
  payload.set_driver_id(outcome.driver_id);
  ASSIGN_OR_RETURN(*payload.mutable_departure_time(),
                   util_time::EncodeGoogleApiProto(route.departure_time));
  for (const Stop& stop : route.stops) {
    RETURN_IF_ERROR(EncodeStop(stop, payload.add_stops()));
  }
  payload.set_total_distance_km(route.total_distance_km);
  ASSIGN_OR_RETURN(*payload.mutable_total_duration(),
                   util_time::EncodeGoogleApiProto(route.total_duration));
  payload.set_efficiency(route.efficiency);
  payload.set_feasibility(route.feasibility);
  payload.set_total_cost(outcome.cost.total_cost);
  payload.set_fuel_consumption(outcome.cost.fuel_consumption);
  payload.set_co2_emissions_kg(outcome.sustainability.co2_emissions_kg);
  return payload;
}

absl::StatusOr<RouteOutcome> FromSavedRoutePayload(
    const SavedRoutePayload& payload) {
  RouteOutcome outcome;
  outcome.vehicle_id = payload.vehicle_id();
  outcome.driver_id = payload.driver_id();
  CandidateRoute& route = outcome.route;
  ASSIGN_OR_RETURN(route.algorithm, ParseSolverAlgorithm(payload.algorithm()));
  route.departure_time =
      util_time::DecodeGoogleApiProto(payload.departure_time());
  for (const SavedStop& stop : payload.stops()) {
    ASSIGN_OR_RETURN(Stop decoded, DecodeStop(stop));
    route.stops.push_back(std::move(decoded));
  }
  route.total_distance_km = payload.total_distance_km();
  ASSIGN_OR_RETURN(route.total_duration,
                   util_time::DecodeGoogleApiProto(payload.total_duration()));
  route.efficiency = payload.efficiency();
  route.feasibility = payload.feasibility();
  outcome.cost.total_cost = payload.total_cost();
  outcome.cost.fuel_consumption = payload.fuel_consumption();
  outcome.sustainability.co2_emissions_kg = payload.co2_emissions_kg();
  return outcome;
}

}  // namespace route_optimization
