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


#include "routeopt/validation/route_validator.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

class ValidationResultBuilder {
 public:
  void AddError(absl::string_view constraint, std::string message) {
    result_.is_valid = false;
    result_.errors.push_back(message);
    result_.violations.push_back(
        {std::string(constraint), ViolationSeverity::kError,
         std::move(message)});
  }

  void AddWarning(absl::string_view constraint, std::string message) {
    result_.warnings.push_back(message);
    result_.violations.push_back(
        {std::string(constraint), ViolationSeverity::kWarning,
         std::move(message)});
  }

  ValidationResult Build(double feasibility_score) && {
    result_.feasibility_score = feasibility_score;
    return std::move(result_);
  }

 private:
  ValidationResult result_;
};

// Checks a load against a ceiling. Infinite ceilings are unconstrained.
void CheckLoad(absl::string_view constraint, absl::string_view quantity,
               absl::string_view unit, double load, double ceiling,
               double near_capacity_ratio, ValidationResultBuilder* builder) {
  if (!std::isfinite(ceiling)) return;
  if (load > ceiling) {
    builder->AddError(constraint,
                      absl::StrFormat("Load %s %.1f %s exceeds the maximum of "
                                      "%.1f %s",
                                      quantity, load, unit, ceiling, unit));
  } else if (load > near_capacity_ratio * ceiling) {
    builder->AddWarning(
        constraint,
        absl::StrFormat("Load %s %.1f %s is close to the maximum of %.1f %s",
                        quantity, load, unit, ceiling, unit));
  }
}

}  // namespace

absl::string_view ViolationSeverityName(ViolationSeverity severity) {
  switch (severity) {
    case ViolationSeverity::kWarning:
      return "warning";
    case ViolationSeverity::kError:
      return "error";
  }
  return "unknown";
}

ValidationResult ValidateRoute(const CandidateRoute& route,
                               const Constraints& constraints,
                               const OptimizerParameters& params) {
  const ValidationParameters& validation = params.validation();
  const absl::Duration tolerance = TimeWindowTolerance(params);
  const absl::Duration slack = TightWindowSlack(params);
  ValidationResultBuilder builder;

  if (route.total_distance_km > constraints.max_distance_km) {
    builder.AddError(
        "max_distance",
        absl::StrFormat("Route distance %.1f km exceeds the maximum of %.1f km",
                        route.total_distance_km, constraints.max_distance_km));
  }
  if (route.total_duration > constraints.max_route_duration) {
    builder.AddError(
        "max_route_duration",
        absl::StrCat("Route duration ",
                     absl::FormatDuration(route.total_duration),
                     " exceeds the maximum of ",
                     absl::FormatDuration(constraints.max_route_duration)));
  }

  double lateness_ratio_sum = 0.0;
  for (const Stop& stop : route.stops) {
    if (stop.lateness > tolerance) {
      builder.AddError(
          "time_window",
          absl::StrCat("Destination ", stop.destination_id, " is reached ",
                       absl::FormatDuration(stop.lateness),
                       " after the end of its time window"));
    } else if (stop.lateness > absl::ZeroDuration()) {
      builder.AddWarning(
          "time_window",
          absl::StrCat("Destination ", stop.destination_id, " is reached ",
                       absl::FormatDuration(stop.lateness),
                       " late, within the tolerance"));
    } else if (stop.time_window.HasEnd() &&
               stop.time_window.end - stop.arrival_time < slack) {
      builder.AddWarning(
          "time_window",
          absl::StrCat("Destination ", stop.destination_id,
                       " is reached only ",
                       absl::FormatDuration(stop.time_window.end -
                                            stop.arrival_time),
                       " before the end of its time window"));
    }
    if (tolerance > absl::ZeroDuration()) {
      lateness_ratio_sum +=
          std::min(1.0, absl::FDivDuration(stop.lateness, tolerance));
    } else if (stop.lateness > absl::ZeroDuration()) {
      lateness_ratio_sum += 1.0;
    }
  }

  CheckLoad("max_load_weight", "weight", "kg", route.load_weight_kg,
            constraints.max_load_weight_kg, validation.near_capacity_ratio(),
            &builder);
  CheckLoad("max_load_volume", "volume", "m3", route.load_volume_m3,
            constraints.max_load_volume_m3, validation.near_capacity_ratio(),
            &builder);

  const double feasibility_score =
      route.stops.empty() ? 1.0
                          : 1.0 - lateness_ratio_sum / route.stops.size();
  return std::move(builder).Build(feasibility_score);
}

}  // namespace route_optimization
