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


#include "routeopt/multimodal/leg_planner.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "routeopt/base/logging.h"
#include "routeopt/base/status_macros.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/geo.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

const TransportModeParameters& ModeParameters(
    TransportMode mode, const MultimodalParameters& params) {
  switch (mode) {
    case TransportMode::kRoad:
      return params.road();
    case TransportMode::kSea:
      return params.sea();
    case TransportMode::kAir:
      return params.air();
    case TransportMode::kRail:
      return params.rail();
  }
  return params.road();
}

double Tonnes(const CargoProfile& cargo) { return cargo.weight_kg / 1000.0; }

// Number of units of `unit_size` needed for `amount`, at least one.
double UnitsFor(double amount, double unit_size) {
  return std::max(1.0, std::ceil(amount / unit_size));
}

double LegCost(TransportMode mode, ServiceType service_type,
               const CargoProfile& cargo, double distance_km,
               const MultimodalParameters& params) {
  double cost = 0.0;
  switch (service_type) {
    case ServiceType::kFtl: {
      const double trucks =
          std::max(UnitsFor(cargo.weight_kg, params.truck_capacity_kg()),
                   UnitsFor(cargo.volume_m3, params.truck_volume_m3()));
      cost = trucks * params.ftl_cost_per_truck_km() * distance_km;
      break;
    }
    case ServiceType::kLtl:
      cost = Tonnes(cargo) * params.ltl_cost_per_tonne_km() * distance_km;
      break;
    case ServiceType::kFcl:
      cost = UnitsFor(cargo.volume_m3, params.container_volume_m3()) *
             params.fcl_cost_per_container_km() * distance_km;
      break;
    case ServiceType::kLcl:
      cost = cargo.volume_m3 * params.lcl_cost_per_m3_km() * distance_km;
      break;
    case ServiceType::kExpress:
      cost = cargo.weight_kg * params.air_express_cost_per_kg_km() *
             distance_km;
      break;
    case ServiceType::kEconomy:
      cost = mode == TransportMode::kRail
                 ? Tonnes(cargo) * params.rail_cost_per_tonne_km() *
                       distance_km
                 : cargo.weight_kg * params.air_economy_cost_per_kg_km() *
                       distance_km;
      break;
  }
  return cost + ModeParameters(mode, params).handling_fee();
}

GeoPoint Interpolate(const GeoPoint& from, const GeoPoint& to,
                     double fraction) {
  return {from.latitude + (to.latitude - from.latitude) * fraction,
          from.longitude + (to.longitude - from.longitude) * fraction};
}

Place Terminal(const Place& place, absl::string_view kind) {
  return {absl::StrCat(place.name, " ", kind), place.location};
}

// Appends legs one after the other, each starting where the previous one
// ended.
class LegSequenceBuilder {
 public:
  LegSequenceBuilder(const Shipment& shipment,
                     const MultimodalParameters& params)
      : shipment_(shipment),
        params_(params),
        main_haul_km_(HaversineDistanceKm(shipment.origin.location,
                                          shipment.destination.location)),
        position_(shipment.origin) {}

  double main_haul_km() const { return main_haul_km_; }

  void AddFeeder(const Place& to) {
    AddLeg(TransportMode::kRoad, to, params_.feeder_distance_km());
  }

  // Adds a main-haul leg covering `great_circle_km`.
  void AddHaul(TransportMode mode, const Place& to, double great_circle_km) {
    AddLeg(mode, to,
           great_circle_km * ModeParameters(mode, params_).circuity_factor());
  }

  MultimodalRoute Build(LegTemplate route_template) && {
    MultimodalRoute route;
    route.route_template = route_template;
    route.legs = std::move(legs_);
    for (const TransportLeg& leg : route.legs) {
      route.total_cost += leg.cost;
      route.total_duration += leg.duration;
      route.total_co2_kg += leg.co2_kg;
    }
    return route;
  }

 private:
  void AddLeg(TransportMode mode, const Place& to, double distance_km) {
    const TransportModeParameters& mode_params = ModeParameters(mode, params_);
    TransportLeg leg;
    leg.sequence = legs_.size() + 1;
    leg.mode = mode;
    leg.service_type = SelectServiceType(mode, shipment_.cargo, params_);
    leg.origin = position_;
    leg.destination = to;
    leg.carrier = mode_params.carrier();
    leg.distance_km = distance_km;
    leg.duration = absl::Hours(distance_km / mode_params.speed_kmh()) +
                   HandlingTime(mode_params);
    leg.cost = LegCost(mode, leg.service_type, shipment_.cargo, distance_km,
                       params_);
    leg.co2_kg =
        Tonnes(shipment_.cargo) * distance_km * mode_params.co2_kg_per_tonne_km();
    legs_.push_back(std::move(leg));
    position_ = to;
  }

  const Shipment& shipment_;
  const MultimodalParameters& params_;
  const double main_haul_km_;
  Place position_;
  std::vector<TransportLeg> legs_;
};

}  // namespace

ServiceType SelectServiceType(TransportMode mode, const CargoProfile& cargo,
                              const MultimodalParameters& params) {
  switch (mode) {
    case TransportMode::kRoad:
      return cargo.weight_kg >= params.ftl_weight_threshold_kg() ||
                     cargo.volume_m3 >= params.ftl_volume_threshold_m3()
                 ? ServiceType::kFtl
                 : ServiceType::kLtl;
    case TransportMode::kSea:
      return cargo.volume_m3 >= params.fcl_volume_threshold_m3()
                 ? ServiceType::kFcl
                 : ServiceType::kLcl;
    case TransportMode::kAir:
      return cargo.weight_kg <= params.air_express_weight_threshold_kg()
                 ? ServiceType::kExpress
                 : ServiceType::kEconomy;
    case TransportMode::kRail:
      return ServiceType::kEconomy;
  }
  return ServiceType::kEconomy;
}

absl::StatusOr<MultimodalRoute> BuildMultimodalRoute(
    const Shipment& shipment, LegTemplate route_template,
    const MultimodalParameters& params) {
  const Place& origin = shipment.origin;
  const Place& destination = shipment.destination;
  LegSequenceBuilder builder(shipment, params);
  const double main_haul_km = builder.main_haul_km();
  switch (route_template) {
    case LegTemplate::kRoad:
      builder.AddHaul(TransportMode::kRoad, destination, main_haul_km);
      break;
    case LegTemplate::kSea:
      builder.AddFeeder(Terminal(origin, "seaport"));
      builder.AddHaul(TransportMode::kSea, Terminal(destination, "seaport"),
                      main_haul_km);
      builder.AddFeeder(destination);
      break;
    case LegTemplate::kAir:
      builder.AddFeeder(Terminal(origin, "airport"));
      builder.AddHaul(TransportMode::kAir, Terminal(destination, "airport"),
                      main_haul_km);
      builder.AddFeeder(destination);
      break;
    case LegTemplate::kSeaAir: {
      const double share = params.sea_air_sea_share();
      const Place hub = {
          "Sea-air transshipment hub",
          Interpolate(origin.location, destination.location, share)};
      builder.AddFeeder(Terminal(origin, "seaport"));
      builder.AddHaul(TransportMode::kSea, hub, share * main_haul_km);
      builder.AddHaul(TransportMode::kAir, Terminal(destination, "airport"),
                      (1 - share) * main_haul_km);
      builder.AddFeeder(destination);
      break;
    }
    case LegTemplate::kRoadSea: {
      const double share = params.road_sea_road_share();
      const Place port = {
          "Road-sea transshipment port",
          Interpolate(origin.location, destination.location, share)};
      builder.AddHaul(TransportMode::kRoad, port, share * main_haul_km);
      builder.AddHaul(TransportMode::kSea, Terminal(destination, "seaport"),
                      (1 - share) * main_haul_km);
      builder.AddFeeder(destination);
      break;
    }
    case LegTemplate::kRail:
      builder.AddFeeder(Terminal(origin, "rail terminal"));
      builder.AddHaul(TransportMode::kRail,
                      Terminal(destination, "rail terminal"), main_haul_km);
      builder.AddFeeder(destination);
      break;
  }
  MultimodalRoute route = std::move(builder).Build(route_template);
  RETURN_IF_ERROR(ValidateLegSequence(route));
  return route;
}

absl::StatusOr<std::vector<MultimodalRoute>> PlanMultimodalRoutes(
    const Shipment& shipment, const MultimodalParameters& params) {
  if (shipment.cargo.weight_kg < 0 || shipment.cargo.volume_m3 < 0) {
    return absl::InvalidArgumentError(
        "Cargo weight and volume must be non-negative");
  }
  if (shipment.origin.location == shipment.destination.location) {
    return absl::InvalidArgumentError(
        "Shipment origin and destination coincide");
  }
  std::vector<MultimodalRoute> routes;
  for (const LegTemplate route_template : kAllLegTemplates) {
    ASSIGN_OR_RETURN(MultimodalRoute route,
                     BuildMultimodalRoute(shipment, route_template, params));
    VLOG(1) << LegTemplateName(route_template) << ": " << route.legs.size()
            << " legs, cost " << route.total_cost << ", "
            << absl::FormatDuration(route.total_duration);
    routes.push_back(std::move(route));
  }
  return routes;
}

absl::Status ValidateLegSequence(const MultimodalRoute& route) {
  if (route.legs.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat(LegTemplateName(route.route_template), " has no legs"));
  }
  for (int i = 0; i < route.legs.size(); ++i) {
    const TransportLeg& leg = route.legs[i];
    if (leg.sequence != i + 1) {
      return absl::InvalidArgumentError(
          absl::StrCat("Leg ", i + 1, " of ",
                       LegTemplateName(route.route_template),
                       " has sequence number ", leg.sequence));
    }
    if (i > 0 && route.legs[i - 1].destination != leg.origin) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Leg ", leg.sequence, " of ", LegTemplateName(route.route_template),
          " starts at ", leg.origin.name, " but leg ", i, " ends at ",
          route.legs[i - 1].destination.name));
    }
  }
  return absl::OkStatus();
}

}  // namespace route_optimization
