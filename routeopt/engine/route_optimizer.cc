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


#include "routeopt/engine/route_optimizer.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "routeopt/base/logging.h"
#include "routeopt/base/status_macros.h"
#include "routeopt/base/threadpool.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/cost/cost_model.h"
#include "routeopt/cost/sustainability_model.h"
#include "routeopt/engine/catalog.h"
#include "routeopt/events/event_sink.h"
#include "routeopt/events/events.pb.h"
#include "routeopt/model/types.h"
#include "routeopt/multimodal/leg_planner.h"
#include "routeopt/persistence/route_serializer.h"
#include "routeopt/persistence/route_store.h"
#include "routeopt/scoring/ranking.h"
#include "routeopt/scoring/recommendations.h"
#include "routeopt/solvers/route_evaluator.h"
#include "routeopt/solvers/solver.h"
#include "routeopt/validation/route_comparison.h"
#include "routeopt/validation/route_validator.h"
#include "routeopt/validation/simulation.h"

namespace route_optimization {
namespace {

// Result slot of one solver run, shared with the pool task so that a solver
// finishing after its timeout writes into memory that is still alive.
struct PendingSolve {
  // Notified when a worker picks the task up. The solver timeout runs from
  // `start_time`, so time spent queued behind other requests is not charged.
  absl::Notification started;
  absl::Time start_time = absl::InfinitePast();
  absl::Notification done;
  absl::StatusOr<CandidateRoute> result =
      absl::UnknownError("Solver did not run");
  absl::Duration wall_time = absl::ZeroDuration();
};

// Records the states an optimization run goes through.
class RunStateTracker {
 public:
  RunStateTracker(absl::string_view request_id,
                  std::vector<OptimizationState>* trace)
      : request_id_(request_id), trace_(trace) {}

  void Enter(OptimizationState state) {
    if (trace_->empty()) {
      VLOG(1) << "Request " << request_id_ << ": "
              << OptimizationStateName(state);
    } else {
      VLOG(1) << "Request " << request_id_ << ": "
              << OptimizationStateName(trace_->back()) << " -> "
              << OptimizationStateName(state);
    }
    trace_->push_back(state);
  }

  // Moves to the Failed state and returns `status`.
  absl::Status Fail(absl::Status status) {
    LOG(WARNING) << "Request " << request_id_ << " failed in state "
                 << OptimizationStateName(trace_->back()) << ": " << status;
    trace_->push_back(OptimizationState::kFailed);
    return status;
  }

 private:
  const std::string request_id_;
  std::vector<OptimizationState>* const trace_;
};

absl::Status CheckDeadline(absl::Time deadline, absl::string_view stage) {
  if (absl::Now() >= deadline) {
    return absl::DeadlineExceededError(
        absl::StrCat("Optimization deadline exceeded ", stage));
  }
  return absl::OkStatus();
}

absl::Status CheckLocation(absl::string_view what, const GeoPoint& point) {
  if (!std::isfinite(point.latitude) || !std::isfinite(point.longitude) ||
      std::abs(point.latitude) > 90 || std::abs(point.longitude) > 180) {
    return absl::InvalidArgumentError(
        absl::StrFormat("%s has invalid coordinates (%f, %f)", what,
                        point.latitude, point.longitude));
  }
  return absl::OkStatus();
}

absl::Status CheckTimeWindow(absl::string_view what, const TimeWindow& window) {
  if (window.start > window.end) {
    return absl::InvalidArgumentError(
        absl::StrCat(what, " has a time window ending before it starts"));
  }
  return absl::OkStatus();
}

// Runs every solver of `registry` on `evaluator` and returns the candidates of
// the ones that succeeded in time, in registry order. Each solver gets
// `solver_timeout` from the moment a worker starts it. Returns Aborted when
// none succeeded, and DeadlineExceeded when `deadline` expires first.
absl::StatusOr<std::vector<CandidateRoute>> RunSolvers(
    ThreadPool* pool, const SolverRegistry& registry,
    std::shared_ptr<const RouteEvaluator> evaluator,
    const SolverParameters& params, absl::Duration solver_timeout,
    absl::Time deadline, std::vector<SolverRunReport>* reports) {
  const absl::Duration search_budget = kSearchBudgetFraction * solver_timeout;
  std::vector<std::pair<SolverAlgorithm, std::shared_ptr<PendingSolve>>>
      pending;
  for (const SolverAlgorithm algorithm : kAllSolverAlgorithms) {
    const auto it = registry.find(algorithm);
    if (it == registry.end()) continue;
    auto solve = std::make_shared<PendingSolve>();
    pool->Schedule([solve, evaluator, params, search_budget, deadline,
                    function = it->second]() {
      solve->start_time = absl::Now();
      solve->started.Notify();
      solve->result =
          function(*evaluator, params,
                   std::min(solve->start_time + search_budget, deadline));
      solve->wall_time = absl::Now() - solve->start_time;
      solve->done.Notify();
    });
    pending.emplace_back(algorithm, std::move(solve));
  }

  const absl::Status deadline_exceeded = absl::DeadlineExceededError(
      "Optimization deadline exceeded while running the solvers");
  std::vector<CandidateRoute> candidates;
  std::vector<std::string> failures;
  for (const auto& [algorithm, solve] : pending) {
    if (!solve->started.WaitForNotificationWithDeadline(deadline)) {
      return deadline_exceeded;
    }
    const absl::Time solver_deadline = solve->start_time + solver_timeout;
    SolverRunReport report;
    report.algorithm = algorithm;
    if (solve->done.WaitForNotificationWithDeadline(
            std::min(solver_deadline, deadline))) {
      report.status = solve->result.status();
      report.wall_time = solve->wall_time;
      if (solve->result.ok()) candidates.push_back(*solve->result);
    } else if (deadline <= solver_deadline) {
      return deadline_exceeded;
    } else {
      report.status = absl::DeadlineExceededError(
          absl::StrCat(SolverAlgorithmName(algorithm),
                       " did not finish within ",
                       absl::FormatDuration(solver_timeout)));
      report.wall_time = absl::Now() - solve->start_time;
    }
    if (report.status.ok()) {
      const CandidateRoute& candidate = candidates.back();
      VLOG(1) << SolverAlgorithmName(algorithm) << " finished in "
              << report.wall_time << ": " << candidate.total_distance_km
              << " km, efficiency " << candidate.efficiency
              << ", feasibility " << candidate.feasibility;
    } else {
      LOG(WARNING) << SolverAlgorithmName(algorithm)
                   << " excluded: " << report.status;
      failures.push_back(absl::StrCat(SolverAlgorithmName(algorithm), ": ",
                                      report.status.ToString()));
    }
    reports->push_back(std::move(report));
  }
  if (candidates.empty()) {
    return absl::AbortedError(absl::StrCat(
        "All solvers failed: ",
        failures.empty() ? "no solver registered"
                         : absl::StrJoin(failures, "; ")));
  }
  return candidates;
}

// The most efficient candidate reaching `threshold`. When none does, the most
// feasible candidate, with `*below_threshold` set.
const CandidateRoute& SelectBest(const std::vector<CandidateRoute>& candidates,
                                 double threshold, bool* below_threshold) {
  DCHECK(!candidates.empty());
  const CandidateRoute* best = nullptr;
  for (const CandidateRoute& candidate : candidates) {
    if (candidate.feasibility < threshold) continue;
    if (best == nullptr || candidate.efficiency > best->efficiency) {
      best = &candidate;
    }
  }
  *below_threshold = best == nullptr;
  if (best != nullptr) return *best;
  best = &candidates.front();
  for (const CandidateRoute& candidate : candidates) {
    if (candidate.feasibility > best->feasibility ||
        (candidate.feasibility == best->feasibility &&
         candidate.efficiency > best->efficiency)) {
      best = &candidate;
    }
  }
  return *best;
}

void PublishCompletion(EventSink* events, const OptimizationRequest& request,
                       const OptimizationResult& result) {
  if (events == nullptr) return;
  OptimizationCompletedEvent event;
  event.set_request_id(result.request_id);
  event.set_destination_count(request.destinations.size());
  event.set_route_count(result.routes.size());
  event.set_total_cost(result.summary.total_cost);
  event.set_average_efficiency(result.summary.average_efficiency);
  event.set_saved_route_id(result.saved_route_id);
  const absl::Status status =
      events->Publish(kOptimizationCompletedEvent, event);
  if (!status.ok()) {
    LOG(WARNING) << "Could not publish " << kOptimizationCompletedEvent
                 << " for request " << result.request_id << ": " << status;
  }
}

}  // namespace

absl::Status ValidateOptimizationRequest(const OptimizationRequest& request) {
  if (!request.origin.has_value()) {
    return absl::InvalidArgumentError("Request has no origin");
  }
  if (!request.vehicle.has_value()) {
    return absl::InvalidArgumentError("Request has no vehicle");
  }
  RETURN_IF_ERROR(CheckLocation("Origin", request.origin->location));
  RETURN_IF_ERROR(CheckTimeWindow("Origin", request.origin->time_window));
  const VehicleProfile& vehicle = *request.vehicle;
  if (!(vehicle.capacity_kg >= 0) || !(vehicle.volume_capacity_m3 >= 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Vehicle ", vehicle.id, " has a negative capacity"));
  }
  absl::flat_hash_set<absl::string_view> ids;
  for (const Destination& destination : request.destinations) {
    if (destination.id.empty()) {
      return absl::InvalidArgumentError("Destination without an id");
    }
    if (!ids.insert(destination.id).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate destination id ", destination.id));
    }
    const std::string what = absl::StrCat("Destination ", destination.id);
    RETURN_IF_ERROR(CheckLocation(what, destination.location));
    RETURN_IF_ERROR(CheckTimeWindow(what, destination.time_window));
    if (!(destination.weight_kg >= 0) || !(destination.volume_m3 >= 0)) {
      return absl::InvalidArgumentError(
          absl::StrCat(what, " has a negative load"));
    }
    if (destination.service_time < absl::ZeroDuration()) {
      return absl::InvalidArgumentError(
          absl::StrCat(what, " has a negative service time"));
    }
  }
  const Constraints& constraints = request.constraints;
  if (constraints.max_route_duration <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError("Maximum route duration must be positive");
  }
  if (!(constraints.max_distance_km > 0) ||
      !(constraints.max_load_weight_kg >= 0) ||
      !(constraints.max_load_volume_m3 >= 0)) {
    return absl::InvalidArgumentError(
        "Distance and load ceilings must be positive");
  }
  if (request.deadline < absl::ZeroDuration()) {
    return absl::InvalidArgumentError("Deadline must not be negative");
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<RouteOptimizer>> RouteOptimizer::Create(
    const OptimizerParameters& params, RealTimeDataSource* data_source,
    RouteStore* store, EventSink* events, SolverRegistry registry) {
  const std::string error = FindErrorInOptimizerParameters(params);
  if (!error.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid optimizer parameters: ", error));
  }
  if (data_source == nullptr) {
    return absl::InvalidArgumentError("A real-time data source is required");
  }
  return absl::WrapUnique(new RouteOptimizer(params, data_source, store,
                                             events, std::move(registry)));
}

RouteOptimizer::RouteOptimizer(const OptimizerParameters& params,
                               RealTimeDataSource* data_source,
                               RouteStore* store, EventSink* events,
                               SolverRegistry registry)
    : params_(params),
      registry_(std::move(registry)),
      store_(store),
      events_(events),
      context_provider_(data_source, params.context()),
      solver_pool_("solver", params.solver().num_threads()) {
  solver_pool_.StartWorkers();
}

std::string RouteOptimizer::NextRequestId() {
  return absl::StrCat("opt-", absl::ToUnixMillis(absl::Now()), "-",
                      num_requests_.fetch_add(1));
}

absl::StatusOr<OptimizationResult> RouteOptimizer::OptimizeRoutes(
    const OptimizationRequest& request) {
  const absl::Time start = absl::Now();
  RETURN_IF_ERROR(ValidateOptimizationRequest(request));
  OptimizationResult result;
  result.request_id =
      request.request_id.empty() ? NextRequestId() : request.request_id;
  const absl::Time deadline =
      start + (request.deadline > absl::ZeroDuration()
                   ? request.deadline
                   : OptimizationDeadline(params_));
  const Origin& origin = *request.origin;
  const VehicleProfile& vehicle = *request.vehicle;
  RunStateTracker tracker(result.request_id, &result.state_trace);

  tracker.Enter(OptimizationState::kCollectingContext);
  std::vector<GeoPoint> points;
  points.reserve(request.destinations.size());
  for (const Destination& destination : request.destinations) {
    points.push_back(destination.location);
  }
  const RealTimeContext context =
      context_provider_.GetContext(origin.location, points, request.region,
                                   request.real_time_factors, start);
  if (context.stale) {
    result.stale_context = true;
    result.warnings.push_back(
        absl::StrCat("Stale real-time context: fallback values used for ",
                     absl::StrJoin(context.degraded_signals, ", ")));
  }
  if (absl::Status status =
          CheckDeadline(deadline, "while collecting the context");
      !status.ok()) {
    return tracker.Fail(std::move(status));
  }

  CapacityAdmission admission =
      AdmitDestinations(request.destinations, &vehicle);
  result.summary.unassigned_destinations = admission.unassigned_ids;
  SolverInput input;
  input.origin = origin;
  input.destinations = std::move(admission.admitted);
  input.vehicle = vehicle;
  input.constraints = request.constraints;
  input.constraints.max_load_weight_kg =
      std::min(input.constraints.max_load_weight_kg, vehicle.capacity_kg);
  input.constraints.max_load_volume_m3 = std::min(
      input.constraints.max_load_volume_m3, vehicle.volume_capacity_m3);
  input.departure_time = origin.time_window.HasStart()
                             ? origin.time_window.start
                             : context.snapshot_time;

  if (!input.destinations.empty()) {
    tracker.Enter(OptimizationState::kRunningSolvers);
    const Constraints constraints = input.constraints;
    auto evaluator = std::make_shared<const RouteEvaluator>(std::move(input),
                                                            context, params_);
    absl::StatusOr<std::vector<CandidateRoute>> candidates =
        RunSolvers(&solver_pool_, registry_, std::move(evaluator),
                   params_.solver(), SolverTimeout(params_), deadline,
                   &result.solver_reports);
    if (!candidates.ok()) return tracker.Fail(candidates.status());

    tracker.Enter(OptimizationState::kSelectingBest);
    const double threshold = params_.solver().feasibility_threshold();
    const CandidateRoute& best = SelectBest(
        *candidates, threshold, &result.below_feasibility_threshold);
    if (result.below_feasibility_threshold) {
      result.warnings.push_back(absl::StrFormat(
          "No route reaches the feasibility threshold of %.2f: selected the "
          "%s route with feasibility %.2f",
          threshold, SolverAlgorithmName(best.algorithm), best.feasibility));
    }

    tracker.Enter(OptimizationState::kEnriching);
    RouteOutcome outcome;
    outcome.route_id = absl::StrCat(result.request_id, "-1");
    outcome.vehicle_id = vehicle.id;
    outcome.driver_id = vehicle.driver_id;
    outcome.route = best;
    outcome.cost = ComputeCost(outcome.route, vehicle.fuel_type, context,
                               constraints, params_.cost());
    outcome.sustainability = ComputeSustainability(
        outcome.route.total_distance_km, outcome.cost.fuel_consumption,
        vehicle.fuel_type, params_.sustainability());
    OptimizationSummary& summary = result.summary;
    summary.total_routes = 1;
    summary.total_distance_km = outcome.route.total_distance_km;
    summary.total_duration = outcome.route.total_duration;
    summary.total_cost = outcome.cost.total_cost;
    summary.average_efficiency = outcome.route.efficiency;
    result.routes.push_back(std::move(outcome));
  }

  tracker.Enter(OptimizationState::kRecommending);
  RecommendationInputs inputs;
  inputs.fuel_type = vehicle.fuel_type;
  inputs.unassigned_destination_ids = result.summary.unassigned_destinations;
  inputs.below_feasibility_threshold = result.below_feasibility_threshold;
  result.summary.recommendations =
      GenerateRecommendations(context, inputs, params_.recommendations());
  for (const RouteOutcome& outcome : result.routes) {
    for (const std::string& recommendation :
         outcome.sustainability.recommendations) {
      result.summary.recommendations.push_back(recommendation);
    }
  }
  if (absl::Status status = CheckDeadline(deadline, "before completion");
      !status.ok()) {
    return tracker.Fail(std::move(status));
  }

  if (request.persist_result.has_value()) {
    if (result.routes.empty()) {
      result.warnings.push_back("No route to persist");
    } else {
      const PersistDirective& persist = *request.persist_result;
      absl::StatusOr<std::string> id =
          SaveRoute(result.request_id, result.routes.front(), persist.name,
                    persist.description, persist.owner);
      if (!id.ok()) return tracker.Fail(id.status());
      result.saved_route_id = *std::move(id);
    }
  }

  tracker.Enter(OptimizationState::kCompleted);
  PublishCompletion(events_, request, result);
  LOG(INFO) << "Request " << result.request_id << ": "
            << result.routes.size() << " route(s) for "
            << request.destinations.size() << " destination(s), cost "
            << result.summary.total_cost << ", in " << absl::Now() - start;
  return result;
}

RealTimeContext RouteOptimizer::GetRealTimeContext(
    const GeoPoint& origin, absl::Span<const GeoPoint> destinations,
    absl::string_view region, const RealTimeFactorFlags& flags) {
  return context_provider_.GetContext(origin, destinations, region, flags,
                                      absl::Now());
}

absl::StatusOr<std::vector<MultimodalRoute>>
RouteOptimizer::PlanMultimodalRoutes(const Shipment& shipment,
                                     const RankingWeights& weights) const {
  RETURN_IF_ERROR(ValidateRankingWeights(weights));
  ASSIGN_OR_RETURN(
      std::vector<MultimodalRoute> routes,
      route_optimization::PlanMultimodalRoutes(shipment, params_.multimodal()));
  return RankMultimodalRoutes(std::move(routes), weights, params_.scoring());
}

ValidationResult RouteOptimizer::ValidateRoute(
    const CandidateRoute& route, const Constraints& constraints) const {
  return route_optimization::ValidateRoute(route, constraints, params_);
}

absl::StatusOr<SimulationResult> RouteOptimizer::SimulateRoute(
    const CandidateRoute& route, const VehicleProfile& vehicle,
    const Constraints& constraints, const RealTimeContext& base_context,
    absl::Span<const Scenario> scenarios) const {
  return route_optimization::SimulateRoute(route, vehicle.fuel_type,
                                           constraints, base_context,
                                           scenarios, params_);
}

absl::StatusOr<ComparisonResult> RouteOptimizer::CompareRoutes(
    absl::Span<const RouteOutcome> routes,
    absl::Span<const ComparisonCriterion> criteria) const {
  return route_optimization::CompareRoutes(routes, criteria);
}

absl::StatusOr<RouteStore*> RouteOptimizer::store() const {
  if (store_ == nullptr) {
    return absl::FailedPreconditionError("No route store configured");
  }
  return store_;
}

absl::StatusOr<std::string> RouteOptimizer::SaveRoute(
    absl::string_view request_id, const RouteOutcome& outcome,
    absl::string_view name, absl::string_view description,
    absl::string_view owner) {
  ASSIGN_OR_RETURN(RouteStore* const route_store, store());
  ASSIGN_OR_RETURN(const SavedRoutePayload payload,
                   ToSavedRoutePayload(request_id, outcome));
  return route_store->SaveRoute(payload, name, description, owner);
}

absl::StatusOr<std::vector<SavedRoute>> RouteOptimizer::GetSavedRoutes(
    absl::string_view search, absl::string_view owner) {
  ASSIGN_OR_RETURN(RouteStore* const route_store, store());
  return route_store->GetSavedRoutes(search, owner);
}

absl::Status RouteOptimizer::DeleteSavedRoute(absl::string_view id) {
  ASSIGN_OR_RETURN(RouteStore* const route_store, store());
  return route_store->DeleteSavedRoute(id);
}

absl::Status RouteOptimizer::ReassignSavedRoute(absl::string_view id,
                                                absl::string_view new_owner) {
  ASSIGN_OR_RETURN(RouteStore* const route_store, store());
  return route_store->ReassignSavedRoute(id, new_owner);
}

absl::Status RouteOptimizer::MarkRouteUsed(absl::string_view id) {
  ASSIGN_OR_RETURN(RouteStore* const route_store, store());
  return route_store->MarkRouteUsed(id);
}

std::vector<AlgorithmInfo> RouteOptimizer::GetAlgorithmCatalog() const {
  return route_optimization::GetAlgorithmCatalog(params_);
}

std::vector<ConstraintInfo> RouteOptimizer::GetConstraintCatalog() const {
  return route_optimization::GetConstraintCatalog(params_);
}

}  // namespace route_optimization
