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

#ifndef ROUTEOPT_CONFIG_PARAMETERS_H_
#define ROUTEOPT_CONFIG_PARAMETERS_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

/// Minimum feasibility a candidate must reach to be selected on efficiency.
inline constexpr double kDefaultFeasibilityThreshold = 0.8;

OptimizerParameters DefaultOptimizerParameters();

/// Returns DefaultOptimizerParameters() with the fields set in the given
/// (possibly partial) text proto merged on top, or an error if the text does
/// not parse or the merged parameters are invalid.
absl::StatusOr<OptimizerParameters> ParseOptimizerParametersOverride(
    absl::string_view text_proto);

/// Returns an empty std::string if the parameters are valid, and a non-empty,
/// human readable error description if they're not.
std::string FindErrorInOptimizerParameters(
    const OptimizerParameters& parameters);

/// Returns a list of std::string describing the errors in the parameters.
/// Returns an empty vector if the parameters are valid.
std::vector<std::string> FindErrorsInOptimizerParameters(
    const OptimizerParameters& parameters);

// Accessors converting proto fields to native types. They must only be called
// on parameters for which FindErrorInOptimizerParameters() returned "".
double FuelTypeRate(const FuelTypeRates& rates, FuelType fuel_type);
absl::Duration SolverTimeout(const OptimizerParameters& parameters);
absl::Duration TimeWindowTolerance(const OptimizerParameters& parameters);
absl::Duration FetchTimeout(const OptimizerParameters& parameters);
absl::Duration OptimizationDeadline(const OptimizerParameters& parameters);
absl::Duration TightWindowSlack(const OptimizerParameters& parameters);
absl::Duration HandlingTime(const TransportModeParameters& mode_parameters);

}  // namespace route_optimization

#endif  // ROUTEOPT_CONFIG_PARAMETERS_H_
