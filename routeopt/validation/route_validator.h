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


#ifndef ROUTEOPT_VALIDATION_ROUTE_VALIDATOR_H_
#define ROUTEOPT_VALIDATION_ROUTE_VALIDATOR_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

enum class ViolationSeverity { kWarning, kError };

absl::string_view ViolationSeverityName(ViolationSeverity severity);

struct ConstraintViolation {
  // One of "max_distance", "max_route_duration", "time_window",
  // "max_load_weight" or "max_load_volume".
  std::string constraint;
  ViolationSeverity severity = ViolationSeverity::kError;
  std::string message;
};

struct ValidationResult {
  // True when no hard constraint is breached.
  bool is_valid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  // One entry per error and per warning, in the same order.
  std::vector<ConstraintViolation> violations;
  // One minus the mean lateness of the stops relative to the time window
  // tolerance, in [0, 1].
  double feasibility_score = 1.0;
};

// Checks `route` against the hard ceilings of `constraints` and the time
// windows of its stops. Lateness beyond the time window tolerance, and any
// ceiling exceeded, are errors. Lateness within the tolerance, arrivals close
// to the end of their window and loads close to a ceiling are warnings.
//
// The function has no side effect: validating the same route twice yields the
// same result.
ValidationResult ValidateRoute(const CandidateRoute& route,
                               const Constraints& constraints,
                               const OptimizerParameters& params);

}  // namespace route_optimization

#endif  // ROUTEOPT_VALIDATION_ROUTE_VALIDATOR_H_
