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

#include "routeopt/config/parameters.h"

#include <string>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "google/protobuf/duration.pb.h"
#include "google/protobuf/text_format.h"
#include "routeopt/base/protoutil.h"
#include "routeopt/config/parameters.pb.h"

namespace route_optimization {
namespace {

// Calibration defaults. The fuel consumption, driver, vehicle and toll rates,
// the emission factors and the 1.2 baseline multiplier are illustrative
// values, not empirically calibrated ones; deployments are expected to
// override them.
constexpr absl::string_view kDefaultParametersFormat = R"pb(
  solver {
    solver_timeout { seconds: 5 }
    num_threads: 5
    random_seed: 42
    feasibility_threshold: %f
    time_window_tolerance { seconds: 1800 }
    lateness_weight_per_minute: 1.0
    savings_arc_coefficient: 1.0
    efficiency_distance_weight: 0.7
    simulated_annealing {
      iterations: 20000
      initial_temperature_ratio: 0.1
      final_temperature_ratio: 0.001
    }
    genetic {
      population_size: 60
      generations: 150
      mutation_rate: 0.2
      tournament_size: 5
      elite_count: 2
    }
    ant_colony {
      num_ants: 20
      iterations: 100
      alpha: 1.0
      beta: 3.0
      evaporation_rate: 0.1
      deposit: 100.0
    }
  }
  travel {
    default_speed_kmh: 45
    min_speed_kmh: 5
    wet_speed_factor: 0.9
    icy_speed_factor: 0.6
    snowy_speed_factor: 0.7
  }
  cost {
    consumption_per_km { diesel: 0.08 gasoline: 0.09 electric: 0.25 hybrid: 0.05 }
    wet_fuel_multiplier: 1.1
    icy_fuel_multiplier: 1.25
    snowy_fuel_multiplier: 1.2
    driver_hourly_rate: 50
    vehicle_cost_per_km: 2
    toll_cost_per_km: 0.1
    lateness_penalty_per_minute: 5
    baseline_multiplier: 1.2
  }
  sustainability {
    emission_factor { diesel: 2.68 gasoline: 2.31 electric: 0.45 hybrid: 2.31 }
    co2_penalty_per_kg: 10.0
    efficiency_points_per_unit: 5.0
    high_co2_threshold_kg: 50
    diesel_co2_threshold_kg: 40
    low_efficiency_threshold: 10
  }
  context {
    fetch_timeout { seconds: 2 }
    default_congestion_level: 0.3
    default_average_speed_kmh: 45
    default_temperature_c: 20
    default_humidity_percent: 60
    default_wind_speed_kmh: 15
    default_precipitation_mm_per_h: 0
    default_visibility_km: 10
    default_diesel_price: 22.50
    default_gasoline_price: 24.30
    default_electric_price: 1.80
    morning_rush_start_hour: 7
    morning_rush_end_hour: 9
    evening_rush_start_hour: 17
    evening_rush_end_hour: 19
    morning_rush_multiplier: 1.5
    evening_rush_multiplier: 1.3
    weekend_multiplier: 0.8
    time_zone: "UTC"
  }
  recommendations { congestion_threshold: 0.7 fuel_price_ceiling: 25 }
  scoring {
    cost_ceiling: 100000
    duration_ceiling { seconds: 864000 }
    co2_ceiling_kg: 20000
  }
  multimodal {
    road {
      speed_kmh: 70
      circuity_factor: 1.25
      co2_kg_per_tonne_km: 0.062
      handling_time { seconds: 3600 }
      handling_fee: 50
      carrier: "Default Road Carrier"
    }
    sea {
      speed_kmh: 30
      circuity_factor: 1.4
      co2_kg_per_tonne_km: 0.008
      handling_time { seconds: 86400 }
      handling_fee: 250
      carrier: "Default Ocean Carrier"
    }
    air {
      speed_kmh: 750
      circuity_factor: 1.05
      co2_kg_per_tonne_km: 0.602
      handling_time { seconds: 21600 }
      handling_fee: 150
      carrier: "Default Air Carrier"
    }
    rail {
      speed_kmh: 60
      circuity_factor: 1.2
      co2_kg_per_tonne_km: 0.022
      handling_time { seconds: 28800 }
      handling_fee: 120
      carrier: "Default Rail Operator"
    }
    feeder_distance_km: 40
    fcl_volume_threshold_m3: 15
    container_volume_m3: 33
    ftl_weight_threshold_kg: 10000
    ftl_volume_threshold_m3: 40
    truck_capacity_kg: 24000
    truck_volume_m3: 90
    air_express_weight_threshold_kg: 500
    ftl_cost_per_truck_km: 1.6
    ltl_cost_per_tonne_km: 0.25
    fcl_cost_per_container_km: 0.9
    lcl_cost_per_m3_km: 0.06
    air_express_cost_per_kg_km: 0.004
    air_economy_cost_per_kg_km: 0.0025
    rail_cost_per_tonne_km: 0.05
    road_sea_road_share: 0.5
    sea_air_sea_share: 0.6
  }
  validation {
    near_capacity_ratio: 0.9
    tight_window_slack { seconds: 900 }
    high_risk_threshold: 0.5
  }
  optimization_deadline { seconds: 30 }
)pb";

absl::Duration DecodeOrZero(const google::protobuf::Duration& proto) {
  const absl::StatusOr<absl::Duration> duration =
      util_time::DecodeGoogleApiProto(proto);
  return duration.ok() ? *duration : absl::ZeroDuration();
}

void CheckPositiveDuration(absl::string_view name,
                           const google::protobuf::Duration& proto,
                           std::vector<std::string>* errors) {
  const absl::StatusOr<absl::Duration> duration =
      util_time::DecodeGoogleApiProto(proto);
  if (!duration.ok()) {
    errors->push_back(absl::StrCat("Invalid ", name, ": ",
                                   duration.status().message()));
  } else if (*duration <= absl::ZeroDuration()) {
    errors->push_back(absl::StrCat(name, " must be positive"));
  }
}

void CheckPositive(absl::string_view name, double value,
                   std::vector<std::string>* errors) {
  if (!(value > 0)) {
    errors->push_back(absl::StrCat(name, " must be positive, got ", value));
  }
}

void CheckNonNegative(absl::string_view name, double value,
                      std::vector<std::string>* errors) {
  if (!(value >= 0)) {
    errors->push_back(absl::StrCat(name, " must be non-negative, got ", value));
  }
}

void CheckUnitInterval(absl::string_view name, double value,
                       std::vector<std::string>* errors) {
  if (!(value >= 0 && value <= 1)) {
    errors->push_back(absl::StrCat(name, " must be in [0, 1], got ", value));
  }
}

void CheckFuelTypeRates(absl::string_view name, const FuelTypeRates& rates,
                        std::vector<std::string>* errors) {
  CheckNonNegative(absl::StrCat(name, ".diesel"), rates.diesel(), errors);
  CheckNonNegative(absl::StrCat(name, ".gasoline"), rates.gasoline(), errors);
  CheckNonNegative(absl::StrCat(name, ".electric"), rates.electric(), errors);
  CheckNonNegative(absl::StrCat(name, ".hybrid"), rates.hybrid(), errors);
}

void CheckHour(absl::string_view name, int hour,
               std::vector<std::string>* errors) {
  if (hour < 0 || hour > 23) {
    errors->push_back(absl::StrCat(name, " must be in [0, 23], got ", hour));
  }
}

void CheckMode(absl::string_view name, const TransportModeParameters& mode,
               std::vector<std::string>* errors) {
  CheckPositive(absl::StrCat(name, ".speed_kmh"), mode.speed_kmh(), errors);
  if (mode.circuity_factor() < 1) {
    errors->push_back(absl::StrCat(name, ".circuity_factor must be >= 1"));
  }
  CheckNonNegative(absl::StrCat(name, ".co2_kg_per_tonne_km"),
                   mode.co2_kg_per_tonne_km(), errors);
  CheckNonNegative(absl::StrCat(name, ".handling_fee"), mode.handling_fee(),
                   errors);
  if (!util_time::DecodeGoogleApiProto(mode.handling_time()).ok()) {
    errors->push_back(absl::StrCat(name, ".handling_time is invalid"));
  }
}

}  // namespace

OptimizerParameters DefaultOptimizerParameters() {
  OptimizerParameters parameters;
  const std::string text = absl::StrFormat(kDefaultParametersFormat,
                                           kDefaultFeasibilityThreshold);
  CHECK(google::protobuf::TextFormat::ParseFromString(text, &parameters))
      << "Malformed default optimizer parameters";
  DCHECK_EQ(FindErrorInOptimizerParameters(parameters), "");
  return parameters;
}

absl::StatusOr<OptimizerParameters> ParseOptimizerParametersOverride(
    absl::string_view text_proto) {
  OptimizerParameters parameters = DefaultOptimizerParameters();
  if (!text_proto.empty()) {
    OptimizerParameters overrides;
    if (!google::protobuf::TextFormat::ParseFromString(std::string(text_proto),
                                                       &overrides)) {
      return absl::InvalidArgumentError(
          "Could not parse the optimizer parameters text proto");
    }
    parameters.MergeFrom(overrides);
  }
  const std::string error = FindErrorInOptimizerParameters(parameters);
  if (!error.empty()) {
    return absl::InvalidArgumentError(error);
  }
  return parameters;
}

std::string FindErrorInOptimizerParameters(
    const OptimizerParameters& parameters) {
  const std::vector<std::string> errors =
      FindErrorsInOptimizerParameters(parameters);
  return errors.empty() ? "" : errors.front();
}

std::vector<std::string> FindErrorsInOptimizerParameters(
    const OptimizerParameters& parameters) {
  std::vector<std::string> errors;

  const SolverParameters& solver = parameters.solver();
  CheckPositiveDuration("solver.solver_timeout", solver.solver_timeout(),
                        &errors);
  if (solver.num_threads() < 1) {
    errors.push_back(absl::StrCat("solver.num_threads must be >= 1, got ",
                                  solver.num_threads()));
  }
  CheckUnitInterval("solver.feasibility_threshold",
                    solver.feasibility_threshold(), &errors);
  CheckPositiveDuration("solver.time_window_tolerance",
                        solver.time_window_tolerance(), &errors);
  CheckNonNegative("solver.lateness_weight_per_minute",
                   solver.lateness_weight_per_minute(), &errors);
  CheckPositive("solver.savings_arc_coefficient",
                solver.savings_arc_coefficient(), &errors);
  CheckUnitInterval("solver.efficiency_distance_weight",
                    solver.efficiency_distance_weight(), &errors);
  const SimulatedAnnealingParameters& sa = solver.simulated_annealing();
  if (sa.iterations() < 1) {
    errors.push_back("solver.simulated_annealing.iterations must be >= 1");
  }
  CheckPositive("solver.simulated_annealing.final_temperature_ratio",
                sa.final_temperature_ratio(), &errors);
  if (sa.initial_temperature_ratio() < sa.final_temperature_ratio()) {
    errors.push_back(
        "solver.simulated_annealing.initial_temperature_ratio must be >= "
        "final_temperature_ratio");
  }
  const GeneticAlgorithmParameters& genetic = solver.genetic();
  if (genetic.population_size() < 2) {
    errors.push_back("solver.genetic.population_size must be >= 2");
  }
  if (genetic.generations() < 1) {
    errors.push_back("solver.genetic.generations must be >= 1");
  }
  CheckUnitInterval("solver.genetic.mutation_rate", genetic.mutation_rate(),
                    &errors);
  if (genetic.tournament_size() < 1) {
    errors.push_back("solver.genetic.tournament_size must be >= 1");
  }
  if (genetic.elite_count() < 0 ||
      genetic.elite_count() >= genetic.population_size()) {
    errors.push_back(
        "solver.genetic.elite_count must be in [0, population_size)");
  }
  const AntColonyParameters& aco = solver.ant_colony();
  if (aco.num_ants() < 1 || aco.iterations() < 1) {
    errors.push_back(
        "solver.ant_colony.num_ants and iterations must be >= 1");
  }
  CheckNonNegative("solver.ant_colony.alpha", aco.alpha(), &errors);
  CheckNonNegative("solver.ant_colony.beta", aco.beta(), &errors);
  if (!(aco.evaporation_rate() > 0 && aco.evaporation_rate() < 1)) {
    errors.push_back("solver.ant_colony.evaporation_rate must be in (0, 1)");
  }
  CheckPositive("solver.ant_colony.deposit", aco.deposit(), &errors);

  const TravelParameters& travel = parameters.travel();
  CheckPositive("travel.default_speed_kmh", travel.default_speed_kmh(),
                &errors);
  CheckPositive("travel.min_speed_kmh", travel.min_speed_kmh(), &errors);
  CheckPositive("travel.wet_speed_factor", travel.wet_speed_factor(), &errors);
  CheckPositive("travel.icy_speed_factor", travel.icy_speed_factor(), &errors);
  CheckPositive("travel.snowy_speed_factor", travel.snowy_speed_factor(),
                &errors);

  const CostParameters& cost = parameters.cost();
  CheckFuelTypeRates("cost.consumption_per_km", cost.consumption_per_km(),
                     &errors);
  CheckPositive("cost.wet_fuel_multiplier", cost.wet_fuel_multiplier(),
                &errors);
  CheckPositive("cost.icy_fuel_multiplier", cost.icy_fuel_multiplier(),
                &errors);
  CheckPositive("cost.snowy_fuel_multiplier", cost.snowy_fuel_multiplier(),
                &errors);
  CheckNonNegative("cost.driver_hourly_rate", cost.driver_hourly_rate(),
                   &errors);
  CheckNonNegative("cost.vehicle_cost_per_km", cost.vehicle_cost_per_km(),
                   &errors);
  CheckNonNegative("cost.toll_cost_per_km", cost.toll_cost_per_km(), &errors);
  CheckNonNegative("cost.lateness_penalty_per_minute",
                   cost.lateness_penalty_per_minute(), &errors);
  if (!(cost.baseline_multiplier() >= 1)) {
    errors.push_back(absl::StrCat("cost.baseline_multiplier must be >= 1, got ",
                                  cost.baseline_multiplier()));
  }

  const SustainabilityParameters& sustainability = parameters.sustainability();
  CheckFuelTypeRates("sustainability.emission_factor",
                     sustainability.emission_factor(), &errors);
  CheckNonNegative("sustainability.co2_penalty_per_kg",
                   sustainability.co2_penalty_per_kg(), &errors);
  CheckNonNegative("sustainability.efficiency_points_per_unit",
                   sustainability.efficiency_points_per_unit(), &errors);

  const ContextParameters& context = parameters.context();
  CheckPositiveDuration("context.fetch_timeout", context.fetch_timeout(),
                        &errors);
  CheckUnitInterval("context.default_congestion_level",
                    context.default_congestion_level(), &errors);
  CheckPositive("context.default_average_speed_kmh",
                context.default_average_speed_kmh(), &errors);
  CheckNonNegative("context.default_diesel_price",
                   context.default_diesel_price(), &errors);
  CheckNonNegative("context.default_gasoline_price",
                   context.default_gasoline_price(), &errors);
  CheckNonNegative("context.default_electric_price",
                   context.default_electric_price(), &errors);
  CheckHour("context.morning_rush_start_hour",
            context.morning_rush_start_hour(), &errors);
  CheckHour("context.morning_rush_end_hour", context.morning_rush_end_hour(),
            &errors);
  CheckHour("context.evening_rush_start_hour",
            context.evening_rush_start_hour(), &errors);
  CheckHour("context.evening_rush_end_hour", context.evening_rush_end_hour(),
            &errors);
  CheckPositive("context.morning_rush_multiplier",
                context.morning_rush_multiplier(), &errors);
  CheckPositive("context.evening_rush_multiplier",
                context.evening_rush_multiplier(), &errors);
  CheckPositive("context.weekend_multiplier", context.weekend_multiplier(),
                &errors);
  absl::TimeZone time_zone;
  if (!absl::LoadTimeZone(context.time_zone(), &time_zone)) {
    errors.push_back(
        absl::StrCat("Unknown context.time_zone '", context.time_zone(), "'"));
  }

  CheckUnitInterval("recommendations.congestion_threshold",
                    parameters.recommendations().congestion_threshold(),
                    &errors);

  const ScoringParameters& scoring = parameters.scoring();
  CheckPositive("scoring.cost_ceiling", scoring.cost_ceiling(), &errors);
  CheckPositiveDuration("scoring.duration_ceiling", scoring.duration_ceiling(),
                        &errors);
  CheckPositive("scoring.co2_ceiling_kg", scoring.co2_ceiling_kg(), &errors);

  const MultimodalParameters& multimodal = parameters.multimodal();
  CheckMode("multimodal.road", multimodal.road(), &errors);
  CheckMode("multimodal.sea", multimodal.sea(), &errors);
  CheckMode("multimodal.air", multimodal.air(), &errors);
  CheckMode("multimodal.rail", multimodal.rail(), &errors);
  CheckNonNegative("multimodal.feeder_distance_km",
                   multimodal.feeder_distance_km(), &errors);
  CheckPositive("multimodal.container_volume_m3",
                multimodal.container_volume_m3(), &errors);
  CheckPositive("multimodal.truck_capacity_kg", multimodal.truck_capacity_kg(),
                &errors);
  CheckPositive("multimodal.truck_volume_m3", multimodal.truck_volume_m3(),
                &errors);
  CheckUnitInterval("multimodal.road_sea_road_share",
                    multimodal.road_sea_road_share(), &errors);
  CheckUnitInterval("multimodal.sea_air_sea_share",
                    multimodal.sea_air_sea_share(), &errors);

  const ValidationParameters& validation = parameters.validation();
  CheckUnitInterval("validation.near_capacity_ratio",
                    validation.near_capacity_ratio(), &errors);
  if (!util_time::DecodeGoogleApiProto(validation.tight_window_slack()).ok()) {
    errors.push_back("validation.tight_window_slack is invalid");
  }
  CheckUnitInterval("validation.high_risk_threshold",
                    validation.high_risk_threshold(), &errors);

  CheckPositiveDuration("optimization_deadline",
                        parameters.optimization_deadline(), &errors);
  return errors;
}

double FuelTypeRate(const FuelTypeRates& rates, FuelType fuel_type) {
  switch (fuel_type) {
    case FuelType::kDiesel:
      return rates.diesel();
    case FuelType::kGasoline:
      return rates.gasoline();
    case FuelType::kElectric:
      return rates.electric();
    case FuelType::kHybrid:
      return rates.hybrid();
  }
  return rates.diesel();
}

absl::Duration SolverTimeout(const OptimizerParameters& parameters) {
  return DecodeOrZero(parameters.solver().solver_timeout());
}

absl::Duration TimeWindowTolerance(const OptimizerParameters& parameters) {
  return DecodeOrZero(parameters.solver().time_window_tolerance());
}

absl::Duration FetchTimeout(const OptimizerParameters& parameters) {
  return DecodeOrZero(parameters.context().fetch_timeout());
}

absl::Duration OptimizationDeadline(const OptimizerParameters& parameters) {
  return DecodeOrZero(parameters.optimization_deadline());
}

absl::Duration TightWindowSlack(const OptimizerParameters& parameters) {
  return DecodeOrZero(parameters.validation().tight_window_slack());
}

absl::Duration HandlingTime(const TransportModeParameters& mode_parameters) {
  return DecodeOrZero(mode_parameters.handling_time());
}

}  // namespace route_optimization
