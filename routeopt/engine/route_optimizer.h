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


#ifndef ROUTEOPT_ENGINE_ROUTE_OPTIMIZER_H_
#define ROUTEOPT_ENGINE_ROUTE_OPTIMIZER_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "routeopt/base/threadpool.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/context/context_provider.h"
#include "routeopt/context/real_time_data_source.h"
#include "routeopt/engine/catalog.h"
#include "routeopt/events/event_sink.h"
#include "routeopt/model/types.h"
#include "routeopt/persistence/route_store.h"
#include "routeopt/persistence/saved_route.pb.h"
#include "routeopt/scoring/ranking.h"
#include "routeopt/solvers/solver.h"
#include "routeopt/validation/route_comparison.h"
#include "routeopt/validation/route_validator.h"
#include "routeopt/validation/simulation.h"

namespace route_optimization {

// Fraction of the solver timeout given to the solvers as search budget. The
// rest leaves them time to build and return their candidate before the
// orchestrator stops waiting.
inline constexpr double kSearchBudgetFraction = 0.8;

// Returns InvalidArgument when the request is malformed: missing origin or
// vehicle, negative capacities or loads, invalid coordinates, duplicate or
// empty destination ids, inverted time windows or negative ceilings.
absl::Status ValidateOptimizationRequest(const OptimizationRequest& request);

// Entry point of the engine.
//
// OptimizeRoutes() runs the following states, recorded in the state trace of
// the result:
//   CollectingContext: snapshot of the real-time conditions.
//   RunningSolvers: every registered solver runs concurrently on the same
//     input, each bounded by the solver timeout. Failed or late solvers are
//     excluded.
//   SelectingBest: the most efficient candidate among those reaching the
//     feasibility threshold, or the most feasible one with a warning.
//   Enriching: cost and sustainability of the selected route.
//   Recommending: operational recommendations.
//   Completed.
// The run fails with InvalidArgument on a malformed request, Aborted when
// every solver fails, DeadlineExceeded when the request deadline expires, and
// with the status of the store when a requested persistence fails.
//
// Thread-safe. The collaborators are not owned and must outlive the
// optimizer. `store` and `events` may be null: saved-route operations then
// fail with FailedPrecondition and no event is published.
class RouteOptimizer {
 public:
  // Returns InvalidArgument when `params` are invalid. Solvers of `registry`
  // replace the default ones.
  static absl::StatusOr<std::unique_ptr<RouteOptimizer>> Create(
      const OptimizerParameters& params, RealTimeDataSource* data_source,
      RouteStore* store, EventSink* events,
      SolverRegistry registry = DefaultSolverRegistry());

  RouteOptimizer(const RouteOptimizer&) = delete;
  RouteOptimizer& operator=(const RouteOptimizer&) = delete;

  absl::StatusOr<OptimizationResult> OptimizeRoutes(
      const OptimizationRequest& request);

  RealTimeContext GetRealTimeContext(const GeoPoint& origin,
                                     absl::Span<const GeoPoint> destinations,
                                     absl::string_view region,
                                     const RealTimeFactorFlags& flags);

  // Candidate leg sequences of a shipment, best first.
  absl::StatusOr<std::vector<MultimodalRoute>> PlanMultimodalRoutes(
      const Shipment& shipment, const RankingWeights& weights) const;

  ValidationResult ValidateRoute(const CandidateRoute& route,
                                 const Constraints& constraints) const;

  absl::StatusOr<SimulationResult> SimulateRoute(
      const CandidateRoute& route, const VehicleProfile& vehicle,
      const Constraints& constraints, const RealTimeContext& base_context,
      absl::Span<const Scenario> scenarios) const;

  absl::StatusOr<ComparisonResult> CompareRoutes(
      absl::Span<const RouteOutcome> routes,
      absl::Span<const ComparisonCriterion> criteria) const;

  absl::StatusOr<std::string> SaveRoute(absl::string_view request_id,
                                        const RouteOutcome& outcome,
                                        absl::string_view name,
                                        absl::string_view description,
                                        absl::string_view owner);
  absl::StatusOr<std::vector<SavedRoute>> GetSavedRoutes(
      absl::string_view search, absl::string_view owner);
  absl::Status DeleteSavedRoute(absl::string_view id);
  absl::Status ReassignSavedRoute(absl::string_view id,
                                  absl::string_view new_owner);
  absl::Status MarkRouteUsed(absl::string_view id);

  std::vector<AlgorithmInfo> GetAlgorithmCatalog() const;
  std::vector<ConstraintInfo> GetConstraintCatalog() const;

  const OptimizerParameters& parameters() const { return params_; }

 private:
  RouteOptimizer(const OptimizerParameters& params,
                 RealTimeDataSource* data_source, RouteStore* store,
                 EventSink* events, SolverRegistry registry);

  absl::StatusOr<RouteStore*> store() const;
  std::string NextRequestId();

  const OptimizerParameters params_;
  const SolverRegistry registry_;
  RouteStore* const store_;
  EventSink* const events_;
  std::atomic<int64_t> num_requests_{0};
  RealTimeContextProvider context_provider_;

  // Shared by concurrent requests. A solver's timeout runs from the moment a
  // worker starts it, so a request queued behind another one only waits,
  // bounded by its own deadline. Declared last so that solvers still running
  // after their timeout are drained before the members above are destroyed.
  ThreadPool solver_pool_;
};

}  // namespace route_optimization

#endif  // ROUTEOPT_ENGINE_ROUTE_OPTIMIZER_H_
