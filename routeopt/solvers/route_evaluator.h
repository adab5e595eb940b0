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

#ifndef ROUTEOPT_SOLVERS_ROUTE_EVALUATOR_H_
#define ROUTEOPT_SOLVERS_ROUTE_EVALUATOR_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {

// The routing problem handed to every solver. Routes are open: they start at
// the origin and end at the last served destination.
struct SolverInput {
  Origin origin;
  // Only the destinations admitted within the vehicle capacity.
  std::vector<Destination> destinations;
  VehicleProfile vehicle;
  Constraints constraints;
  absl::Time departure_time = absl::UnixEpoch();
};

// Splits `destinations` into the ones admitted on `vehicle` and the ids of the
// ones left unassigned. Destinations are admitted by decreasing priority, then
// by earliest time window end, then in input order, as long as both the
// weight and the volume capacity allow it. Without a vehicle every
// destination is admitted.
struct CapacityAdmission {
  std::vector<Destination> admitted;
  std::vector<std::string> unassigned_ids;
};
CapacityAdmission AdmitDestinations(absl::Span<const Destination> destinations,
                                    const VehicleProfile* vehicle);

// Speed of the vehicle under `context`: the observed average speed, slowed by
// the time-of-day multiplier and the road condition, and never below the
// configured minimum.
double EffectiveSpeedKmh(const RealTimeContext& context,
                         const TravelParameters& params);

// Drives `distance_km` at `speed_kmh` from `current`, then serves a stop with
// the given window and service time. Early arrivals wait for the window to
// open. The destination id and cost of the returned stop are left empty.
Stop ScheduleStop(absl::Time current, double distance_km, double speed_kmh,
                  const TimeWindow& window, absl::Duration service_time);

// Weight of a minimum spanning tree over `points`, a lower bound of the length
// of any open route visiting all of them.
double MinimumSpanningTreeWeight(absl::Span<const GeoPoint> points);

// Evaluates visiting orders of a SolverInput under a fixed context. Orders are
// permutations of the destination indices of the input. Internally node 0 is
// the origin and node i + 1 is destination i.
//
// The evaluator is immutable after construction and may be shared by
// concurrently running solvers.
class RouteEvaluator {
 public:
  struct Evaluation {
    double distance_km = 0.0;
    absl::Duration duration = absl::ZeroDuration();
    absl::Duration total_lateness = absl::ZeroDuration();
    // Number of arrivals later than the tolerance past their window end, and
    // whether the route length or duration ceilings are exceeded.
    int num_missed_windows = 0;
    bool exceeds_max_duration = false;
    bool exceeds_max_distance = false;
    // Distance plus weighted lateness, plus a large penalty per hard
    // violation. Solvers minimize it.
    double objective = 0.0;

    bool IsFeasible() const {
      return num_missed_windows == 0 && !exceeds_max_duration &&
             !exceeds_max_distance;
    }
  };

  RouteEvaluator(SolverInput input, const RealTimeContext& context,
                 const OptimizerParameters& params);

  RouteEvaluator(const RouteEvaluator&) = delete;
  RouteEvaluator& operator=(const RouteEvaluator&) = delete;

  const SolverInput& input() const { return input_; }
  int num_destinations() const { return input_.destinations.size(); }
  double speed_kmh() const { return speed_kmh_; }

  double NodeDistance(int from_node, int to_node) const {
    return distances_[from_node][to_node];
  }
  // Mean length of the arcs between distinct nodes, 0 for a single node.
  double MeanArcDistance() const { return mean_arc_distance_; }

  Evaluation Evaluate(absl::Span<const int> order) const;
  double Objective(absl::Span<const int> order) const {
    return Evaluate(order).objective;
  }

  // Builds the candidate route for `order`, or returns a FailedPrecondition
  // error describing the first hard violation.
  absl::StatusOr<CandidateRoute> BuildCandidate(
      SolverAlgorithm algorithm, absl::Span<const int> order) const;

 private:
  std::vector<Stop> Schedule(absl::Span<const int> order) const;

  const SolverInput input_;
  const OptimizerParameters params_;
  const double speed_kmh_;
  const absl::Duration tolerance_;
  std::vector<std::vector<double>> distances_;
  double mean_arc_distance_ = 0.0;
  double spanning_tree_weight_ = 0.0;
  absl::Duration baseline_duration_ = absl::ZeroDuration();
};

}  // namespace route_optimization

#endif  // ROUTEOPT_SOLVERS_ROUTE_EVALUATOR_H_
