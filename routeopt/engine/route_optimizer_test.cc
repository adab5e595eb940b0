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

#include <memory>
#include <string>
#include <thread>  // NOLINT
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "google/protobuf/message.h"
#include "gtest/gtest.h"
#include "routeopt/base/status_matchers.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/context/real_time_data_source.h"
#include "routeopt/events/event_sink.h"
#include "routeopt/events/events.pb.h"
#include "routeopt/model/types.h"
#include "routeopt/persistence/route_store.h"
#include "routeopt/persistence/saved_route.pb.h"
#include "routeopt/scoring/ranking.h"
#include "routeopt/solvers/route_evaluator.h"
#include "routeopt/solvers/solver.h"

namespace route_optimization {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::status::IsOk;
using ::testing::status::IsOkAndHolds;
using ::testing::status::StatusIs;

class MockRouteStore : public RouteStore {
 public:
  MOCK_METHOD(absl::StatusOr<std::string>, SaveRoute,
              (const SavedRoutePayload& payload, absl::string_view name,
               absl::string_view description, absl::string_view owner),
              (override));
  MOCK_METHOD(absl::StatusOr<std::vector<SavedRoute>>, GetSavedRoutes,
              (absl::string_view search, absl::string_view owner),
              (override));
  MOCK_METHOD(absl::Status, DeleteSavedRoute, (absl::string_view id),
              (override));
  MOCK_METHOD(absl::Status, ReassignSavedRoute,
              (absl::string_view id, absl::string_view new_owner),
              (override));
  MOCK_METHOD(absl::Status, MarkRouteUsed, (absl::string_view id),
              (override));
};

class MockEventSink : public EventSink {
 public:
  MOCK_METHOD(absl::Status, Publish,
              (absl::string_view event_name,
               const google::protobuf::Message& event),
              (override));
};

const absl::Time kDeparture = absl::FromCivil(
    absl::CivilSecond(2024, 1, 8, 10, 0, 0), absl::UTCTimeZone());

TrafficConditions FreeFlowTraffic() {
  TrafficConditions traffic;
  traffic.congestion_level = 0.2;
  traffic.average_speed_kmh = 40;
  return traffic;
}

WeatherConditions DryWeather() {
  WeatherConditions weather;
  weather.temperature_c = 18;
  weather.humidity_percent = 50;
  weather.visibility_km = 10;
  weather.road_condition = RoadCondition::kDry;
  return weather;
}

FuelPrices TypicalFuelPrices() {
  FuelPrices prices;
  prices.diesel = 1.5;
  prices.gasoline = 1.7;
  prices.electric = 0.3;
  return prices;
}

Destination MakeDestination(absl::string_view id, double latitude,
                            double longitude) {
  Destination destination;
  destination.id = std::string(id);
  destination.location = {latitude, longitude};
  destination.service_time = absl::Minutes(10);
  destination.weight_kg = 100;
  destination.volume_m3 = 1;
  return destination;
}

// Delivery from lower to midtown Manhattan with a light van.
OptimizationRequest ManhattanRequest() {
  OptimizationRequest request;
  request.request_id = "manhattan";
  Origin origin;
  origin.location = {40.7128, -74.0060};
  origin.address = "New York, NY";
  origin.time_window.start = kDeparture;
  request.origin = origin;
  request.destinations.push_back(
      MakeDestination("times-square", 40.7589, -73.9851));
  VehicleProfile vehicle;
  vehicle.id = "van-1";
  vehicle.driver_id = "driver-1";
  vehicle.capacity_kg = 1000;
  vehicle.volume_capacity_m3 = 10;
  vehicle.fuel_type = FuelType::kDiesel;
  request.vehicle = vehicle;
  return request;
}

SolverFunction SleepingSolver(absl::Duration delay) {
  return [delay](const RouteEvaluator&, const SolverParameters&,
                 absl::Time) -> absl::StatusOr<CandidateRoute> {
    absl::SleepFor(delay);
    return absl::InternalError("woke up too late");
  };
}

SolverFunction FailingSolver() {
  return [](const RouteEvaluator&, const SolverParameters&,
            absl::Time) -> absl::StatusOr<CandidateRoute> {
    return absl::FailedPreconditionError("no feasible order");
  };
}

// Visits the destinations in input order and reports `feasibility`.
SolverFunction InputOrderSolver(SolverAlgorithm algorithm,
                                double feasibility) {
  return [algorithm, feasibility](
             const RouteEvaluator& evaluator, const SolverParameters&,
             absl::Time) -> absl::StatusOr<CandidateRoute> {
    std::vector<int> order;
    for (int i = 0; i < evaluator.num_destinations(); ++i) order.push_back(i);
    absl::StatusOr<CandidateRoute> route =
        evaluator.BuildCandidate(algorithm, order);
    if (route.ok()) route->feasibility = feasibility;
    return route;
  };
}

// The built-in solvers, each starting after `delay`.
SolverRegistry DelayedDefaultRegistry(absl::Duration delay) {
  SolverRegistry registry;
  for (const auto& [algorithm, solver] : DefaultSolverRegistry()) {
    registry[algorithm] = [delay, function = solver](
                              const RouteEvaluator& evaluator,
                              const SolverParameters& params,
                              absl::Time deadline) {
      absl::SleepFor(delay);
      return function(evaluator, params, deadline);
    };
  }
  return registry;
}

class RouteOptimizerTest : public ::testing::Test {
 protected:
  RouteOptimizerTest()
      : params_(DefaultOptimizerParameters()),
        data_source_(FreeFlowTraffic(), DryWeather(), TypicalFuelPrices()) {
    params_.mutable_solver()->set_num_threads(5);
  }

  std::unique_ptr<RouteOptimizer> MakeOptimizer(
      SolverRegistry registry = DefaultSolverRegistry()) {
    absl::StatusOr<std::unique_ptr<RouteOptimizer>> optimizer =
        RouteOptimizer::Create(params_, &data_source_, &store_, &events_,
                               std::move(registry));
    EXPECT_OK(optimizer.status());
    return *std::move(optimizer);
  }

  void SetSolverTimeout(absl::Duration timeout) {
    google::protobuf::Duration* proto =
        params_.mutable_solver()->mutable_solver_timeout();
    proto->set_seconds(absl::ToInt64Seconds(timeout));
    proto->set_nanos(absl::ToInt64Nanoseconds(
        timeout - absl::Seconds(absl::ToInt64Seconds(timeout))));
  }

  OptimizerParameters params_;
  StaticRealTimeDataSource data_source_;
  ::testing::NiceMock<MockRouteStore> store_;
  ::testing::NiceMock<MockEventSink> events_;
};

TEST_F(RouteOptimizerTest, SingleDestination) {
  std::string published_request_id;
  EXPECT_CALL(events_, Publish(kOptimizationCompletedEvent, _))
      .WillOnce([&](absl::string_view, const google::protobuf::Message& event) {
        const auto& completed =
            dynamic_cast<const OptimizationCompletedEvent&>(event);
        published_request_id = completed.request_id();
        EXPECT_EQ(completed.route_count(), 1);
        EXPECT_EQ(completed.destination_count(), 1);
        return absl::OkStatus();
      });
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(ManhattanRequest()));

  EXPECT_EQ(result.request_id, "manhattan");
  EXPECT_EQ(published_request_id, "manhattan");
  ASSERT_THAT(result.routes, SizeIs(1));
  const RouteOutcome& outcome = result.routes[0];
  EXPECT_EQ(outcome.route_id, "manhattan-1");
  EXPECT_EQ(outcome.vehicle_id, "van-1");
  EXPECT_EQ(outcome.driver_id, "driver-1");
  ASSERT_THAT(outcome.route.stops, SizeIs(1));
  EXPECT_EQ(outcome.route.stops[0].destination_id, "times-square");
  EXPECT_EQ(outcome.route.departure_time, kDeparture);
  EXPECT_GT(outcome.route.total_distance_km, 4.0);
  EXPECT_LT(outcome.route.total_distance_km, 7.0);
  EXPECT_GT(outcome.sustainability.co2_emissions_kg, 0.0);
  EXPECT_DOUBLE_EQ(outcome.cost.total_cost,
                   outcome.cost.fuel_cost + outcome.cost.driver_cost +
                       outcome.cost.vehicle_cost + outcome.cost.toll_cost +
                       outcome.cost.penalty_cost);

  EXPECT_EQ(result.summary.total_routes, 1);
  EXPECT_DOUBLE_EQ(result.summary.total_distance_km,
                   outcome.route.total_distance_km);
  EXPECT_DOUBLE_EQ(result.summary.total_cost, outcome.cost.total_cost);
  EXPECT_DOUBLE_EQ(result.summary.average_efficiency,
                   outcome.route.efficiency);
  EXPECT_THAT(result.summary.unassigned_destinations, IsEmpty());
  EXPECT_FALSE(result.stale_context);
  EXPECT_FALSE(result.below_feasibility_threshold);
  EXPECT_THAT(result.warnings, IsEmpty());
  EXPECT_THAT(result.solver_reports, SizeIs(5));
  for (const SolverRunReport& report : result.solver_reports) {
    EXPECT_OK(report.status) << SolverAlgorithmName(report.algorithm);
  }
  EXPECT_THAT(result.state_trace,
              ElementsAre(OptimizationState::kCollectingContext,
                          OptimizationState::kRunningSolvers,
                          OptimizationState::kSelectingBest,
                          OptimizationState::kEnriching,
                          OptimizationState::kRecommending,
                          OptimizationState::kCompleted));
}

TEST_F(RouteOptimizerTest, GeneratesRequestIds) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  OptimizationRequest request = ManhattanRequest();
  request.request_id.clear();
  ASSERT_OK_AND_ASSIGN(const OptimizationResult first,
                       optimizer->OptimizeRoutes(request));
  ASSERT_OK_AND_ASSIGN(const OptimizationResult second,
                       optimizer->OptimizeRoutes(request));
  EXPECT_THAT(first.request_id, HasSubstr("opt-"));
  EXPECT_NE(first.request_id, second.request_id);
}

TEST_F(RouteOptimizerTest, NoDestinations) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  OptimizationRequest request = ManhattanRequest();
  request.destinations.clear();
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(request));
  EXPECT_THAT(result.routes, IsEmpty());
  EXPECT_EQ(result.summary.total_routes, 0);
  EXPECT_THAT(result.solver_reports, IsEmpty());
  EXPECT_THAT(result.state_trace,
              ElementsAre(OptimizationState::kCollectingContext,
                          OptimizationState::kRecommending,
                          OptimizationState::kCompleted));
}

TEST_F(RouteOptimizerTest, AllSolversTimingOutAbortsTheRun) {
  SetSolverTimeout(absl::Milliseconds(100));
  SolverRegistry registry;
  for (const SolverAlgorithm algorithm : kAllSolverAlgorithms) {
    registry[algorithm] = SleepingSolver(absl::Milliseconds(400));
  }
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer(registry);
  EXPECT_CALL(events_, Publish).Times(0);
  EXPECT_THAT(optimizer->OptimizeRoutes(ManhattanRequest()),
              StatusIs(absl::StatusCode::kAborted,
                       HasSubstr("All solvers failed: nearest_neighbor")));
}

TEST_F(RouteOptimizerTest, FailedSolversAreExcluded) {
  SetSolverTimeout(absl::Milliseconds(200));
  SolverRegistry registry;
  registry[SolverAlgorithm::kNearestNeighbor] = FailingSolver();
  registry[SolverAlgorithm::kSavings] =
      SleepingSolver(absl::Milliseconds(500));
  registry[SolverAlgorithm::kGenetic] =
      InputOrderSolver(SolverAlgorithm::kGenetic, 1.0);
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer(registry);
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(ManhattanRequest()));
  ASSERT_THAT(result.routes, SizeIs(1));
  EXPECT_EQ(result.routes[0].route.algorithm, SolverAlgorithm::kGenetic);
  ASSERT_THAT(result.solver_reports, SizeIs(3));
  EXPECT_EQ(result.solver_reports[0].algorithm,
            SolverAlgorithm::kNearestNeighbor);
  EXPECT_THAT(result.solver_reports[0].status,
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_EQ(result.solver_reports[1].algorithm, SolverAlgorithm::kSavings);
  EXPECT_THAT(result.solver_reports[1].status,
              StatusIs(absl::StatusCode::kDeadlineExceeded));
  EXPECT_OK(result.solver_reports[2].status);
}

TEST_F(RouteOptimizerTest, AllSolversFailingReportsEveryFailure) {
  SolverRegistry registry;
  registry[SolverAlgorithm::kSavings] = FailingSolver();
  registry[SolverAlgorithm::kAntColony] = FailingSolver();
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer(registry);
  EXPECT_THAT(
      optimizer->OptimizeRoutes(ManhattanRequest()),
      StatusIs(absl::StatusCode::kAborted,
               HasSubstr("savings_algorithm: FAILED_PRECONDITION: no feasible "
                         "order; ant_colony_optimization")));
}

TEST_F(RouteOptimizerTest, QueuedSolversAreNotChargedForTheWait) {
  // Five workers and five solvers of 600ms each: the second request waits for
  // the first one to release the workers, then runs within its timeout.
  SetSolverTimeout(absl::Seconds(1));
  std::unique_ptr<RouteOptimizer> optimizer =
      MakeOptimizer(DelayedDefaultRegistry(absl::Milliseconds(600)));
  OptimizationRequest first_request = ManhattanRequest();
  first_request.request_id = "first";
  OptimizationRequest second_request = ManhattanRequest();
  second_request.request_id = "second";

  absl::StatusOr<OptimizationResult> first;
  absl::StatusOr<OptimizationResult> second;
  std::thread first_thread(
      [&] { first = optimizer->OptimizeRoutes(first_request); });
  absl::SleepFor(absl::Milliseconds(100));
  std::thread second_thread(
      [&] { second = optimizer->OptimizeRoutes(second_request); });
  first_thread.join();
  second_thread.join();

  for (const absl::StatusOr<OptimizationResult>* result : {&first, &second}) {
    ASSERT_OK(result->status());
    EXPECT_THAT((*result)->routes, SizeIs(1));
    ASSERT_THAT((*result)->solver_reports, SizeIs(5));
    for (const SolverRunReport& report : (*result)->solver_reports) {
      EXPECT_OK(report.status) << (*result)->request_id << " "
                               << SolverAlgorithmName(report.algorithm);
    }
  }
  EXPECT_EQ(first->request_id, "first");
  EXPECT_EQ(second->request_id, "second");
}

TEST_F(RouteOptimizerTest, BelowThresholdSelectsTheMostFeasibleRoute) {
  SolverRegistry registry;
  registry[SolverAlgorithm::kNearestNeighbor] =
      InputOrderSolver(SolverAlgorithm::kNearestNeighbor, 0.3);
  registry[SolverAlgorithm::kSavings] =
      InputOrderSolver(SolverAlgorithm::kSavings, 0.6);
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer(registry);
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(ManhattanRequest()));
  EXPECT_TRUE(result.below_feasibility_threshold);
  ASSERT_THAT(result.routes, SizeIs(1));
  EXPECT_EQ(result.routes[0].route.algorithm, SolverAlgorithm::kSavings);
  EXPECT_THAT(result.warnings,
              ElementsAre(HasSubstr("No route reaches the feasibility")));
  EXPECT_THAT(result.summary.recommendations,
              ::testing::Contains(HasSubstr("relax time windows")));
}

TEST_F(RouteOptimizerTest, StaleContextIsAWarning) {
  StaticRealTimeDataSource unavailable(
      absl::UnavailableError("provider down"));
  ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<RouteOptimizer> optimizer,
      RouteOptimizer::Create(params_, &unavailable, nullptr, nullptr));
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(ManhattanRequest()));
  EXPECT_TRUE(result.stale_context);
  EXPECT_THAT(result.warnings,
              ElementsAre(HasSubstr("Stale real-time context")));
  EXPECT_THAT(result.routes, SizeIs(1));
}

TEST_F(RouteOptimizerTest, OverweightDestinationsAreUnassigned) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  OptimizationRequest request = ManhattanRequest();
  Destination piano = MakeDestination("piano", 40.7484, -73.9857);
  piano.weight_kg = 5000;
  request.destinations.push_back(piano);
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(request));
  EXPECT_THAT(result.summary.unassigned_destinations, ElementsAre("piano"));
  ASSERT_THAT(result.routes, SizeIs(1));
  ASSERT_THAT(result.routes[0].route.stops, SizeIs(1));
  EXPECT_EQ(result.routes[0].route.stops[0].destination_id, "times-square");
  EXPECT_THAT(result.summary.recommendations,
              ::testing::Contains(HasSubstr("(piano)")));
}

TEST_F(RouteOptimizerTest, InvalidRequests) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  std::vector<OptimizationRequest> requests;
  requests.push_back(ManhattanRequest());
  requests.back().origin.reset();
  requests.push_back(ManhattanRequest());
  requests.back().vehicle.reset();
  requests.push_back(ManhattanRequest());
  requests.back().vehicle->capacity_kg = -1;
  requests.push_back(ManhattanRequest());
  requests.back().origin->location.latitude = 91;
  requests.push_back(ManhattanRequest());
  const Destination duplicate = requests.back().destinations[0];
  requests.back().destinations.push_back(duplicate);
  requests.push_back(ManhattanRequest());
  requests.back().destinations[0].id.clear();
  requests.push_back(ManhattanRequest());
  requests.back().destinations[0].time_window.start = kDeparture;
  requests.back().destinations[0].time_window.end =
      kDeparture - absl::Hours(1);
  requests.push_back(ManhattanRequest());
  requests.back().destinations[0].weight_kg = -5;
  requests.push_back(ManhattanRequest());
  requests.back().constraints.max_route_duration = absl::ZeroDuration();
  requests.push_back(ManhattanRequest());
  requests.back().deadline = absl::Seconds(-1);
  for (int i = 0; i < requests.size(); ++i) {
    EXPECT_THAT(optimizer->OptimizeRoutes(requests[i]),
                StatusIs(absl::StatusCode::kInvalidArgument))
        << "request " << i;
  }
}

TEST_F(RouteOptimizerTest, DeadlineExpiresWhileSolving) {
  SolverRegistry registry;
  registry[SolverAlgorithm::kNearestNeighbor] =
      SleepingSolver(absl::Milliseconds(500));
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer(registry);
  OptimizationRequest request = ManhattanRequest();
  request.deadline = absl::Milliseconds(50);
  EXPECT_THAT(optimizer->OptimizeRoutes(request),
              StatusIs(absl::StatusCode::kDeadlineExceeded));
}

TEST_F(RouteOptimizerTest, PersistsTheSelectedRoute) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  OptimizationRequest request = ManhattanRequest();
  request.persist_result = PersistDirective{"Midtown run", "", "dispatch"};
  EXPECT_CALL(store_, SaveRoute(_, absl::string_view("Midtown run"),
                                absl::string_view(""),
                                absl::string_view("dispatch")))
      .WillOnce([](const SavedRoutePayload& payload, absl::string_view,
                   absl::string_view, absl::string_view)
                    -> absl::StatusOr<std::string> {
        EXPECT_EQ(payload.request_id(), "manhattan");
        EXPECT_EQ(payload.vehicle_id(), "van-1");
        EXPECT_EQ(payload.stops_size(), 1);
        return std::string("route-7");
      });
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(request));
  EXPECT_EQ(result.saved_route_id, "route-7");
}

TEST_F(RouteOptimizerTest, PersistenceFailureFailsTheRun) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  OptimizationRequest request = ManhattanRequest();
  request.persist_result = PersistDirective{"Midtown run", "", "dispatch"};
  EXPECT_CALL(store_, SaveRoute)
      .WillOnce(Return(absl::UnavailableError("database offline")));
  EXPECT_CALL(events_, Publish).Times(0);
  EXPECT_THAT(optimizer->OptimizeRoutes(request),
              StatusIs(absl::StatusCode::kUnavailable,
                       HasSubstr("database offline")));
}

TEST_F(RouteOptimizerTest, NothingToPersistIsAWarning) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  OptimizationRequest request = ManhattanRequest();
  request.destinations.clear();
  request.persist_result = PersistDirective{"Empty", "", "dispatch"};
  EXPECT_CALL(store_, SaveRoute).Times(0);
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(request));
  EXPECT_THAT(result.warnings, ElementsAre("No route to persist"));
  EXPECT_THAT(result.saved_route_id, IsEmpty());
}

TEST_F(RouteOptimizerTest, PublishFailureIsIgnored) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  EXPECT_CALL(events_, Publish)
      .WillOnce(Return(absl::UnavailableError("broker offline")));
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(ManhattanRequest()));
  EXPECT_THAT(result.routes, SizeIs(1));
  EXPECT_EQ(result.state_trace.back(), OptimizationState::kCompleted);
}

TEST_F(RouteOptimizerTest, SavedRouteOperationsDelegateToTheStore) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  EXPECT_CALL(store_, DeleteSavedRoute(absl::string_view("route-1")))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(store_, ReassignSavedRoute(absl::string_view("route-1"),
                                         absl::string_view("ops")))
      .WillOnce(Return(absl::NotFoundError("No saved route route-1")));
  EXPECT_CALL(store_, MarkRouteUsed(absl::string_view("route-2")))
      .WillOnce(Return(absl::OkStatus()));
  EXPECT_CALL(store_, GetSavedRoutes(absl::string_view("midtown"),
                                     absl::string_view("dispatch")))
      .WillOnce(Return(std::vector<SavedRoute>(2)));
  EXPECT_OK(optimizer->DeleteSavedRoute("route-1"));
  EXPECT_THAT(optimizer->ReassignSavedRoute("route-1", "ops"),
              StatusIs(absl::StatusCode::kNotFound));
  EXPECT_OK(optimizer->MarkRouteUsed("route-2"));
  EXPECT_THAT(optimizer->GetSavedRoutes("midtown", "dispatch"),
              IsOkAndHolds(SizeIs(2)));
}

TEST_F(RouteOptimizerTest, SavedRouteOperationsNeedAStore) {
  ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<RouteOptimizer> optimizer,
      RouteOptimizer::Create(params_, &data_source_, nullptr, nullptr));
  EXPECT_THAT(optimizer->GetSavedRoutes("", ""),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(optimizer->DeleteSavedRoute("route-1"),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(optimizer->MarkRouteUsed("route-1"),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(optimizer->SaveRoute("r", RouteOutcome(), "name", "", "me"),
              StatusIs(absl::StatusCode::kFailedPrecondition));

  OptimizationRequest request = ManhattanRequest();
  request.persist_result = PersistDirective{"Midtown run", "", "dispatch"};
  EXPECT_THAT(optimizer->OptimizeRoutes(request),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST_F(RouteOptimizerTest, PlansRankedMultimodalRoutes) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  Shipment shipment;
  shipment.origin = {"Istanbul", {41.0082, 28.9784}};
  shipment.destination = {"Rotterdam", {51.9244, 4.4777}};
  shipment.cargo.weight_kg = 12000;
  shipment.cargo.volume_m3 = 40;
  ASSERT_OK_AND_ASSIGN(
      const std::vector<MultimodalRoute> routes,
      optimizer->PlanMultimodalRoutes(shipment, RankingWeights{1, 0.1, 0.1}));
  ASSERT_THAT(routes, Not(IsEmpty()));
  for (int i = 1; i < routes.size(); ++i) {
    EXPECT_GE(routes[i - 1].score, routes[i].score);
  }
  EXPECT_THAT(
      optimizer->PlanMultimodalRoutes(shipment, RankingWeights{-1, 0, 0}),
      StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(RouteOptimizerTest, ValidatesAndSimulatesRoutes) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  ASSERT_OK_AND_ASSIGN(const OptimizationResult result,
                       optimizer->OptimizeRoutes(ManhattanRequest()));
  ASSERT_THAT(result.routes, SizeIs(1));
  const CandidateRoute& route = result.routes[0].route;
  EXPECT_TRUE(optimizer->ValidateRoute(route, Constraints()).is_valid);
  Constraints tight;
  tight.max_distance_km = 1;
  EXPECT_FALSE(optimizer->ValidateRoute(route, tight).is_valid);

  RealTimeContext context = optimizer->GetRealTimeContext(
      {40.7128, -74.0060}, {}, "", RealTimeFactorFlags());
  EXPECT_FALSE(context.stale);
  Scenario storm;
  storm.name = "storm";
  storm.road_condition = RoadCondition::kSnowy;
  const std::vector<Scenario> scenarios = {storm};
  ASSERT_OK_AND_ASSIGN(
      const SimulationResult simulation,
      optimizer->SimulateRoute(route, *ManhattanRequest().vehicle,
                               Constraints(), context, scenarios));
  EXPECT_THAT(simulation.results, SizeIs(1));

  const std::vector<RouteOutcome> outcomes = {result.routes[0],
                                              result.routes[0]};
  EXPECT_THAT(optimizer->CompareRoutes(outcomes, {}), IsOk());
}

TEST_F(RouteOptimizerTest, Catalogs) {
  std::unique_ptr<RouteOptimizer> optimizer = MakeOptimizer();
  const std::vector<AlgorithmInfo> algorithms =
      optimizer->GetAlgorithmCatalog();
  ASSERT_THAT(algorithms, SizeIs(5));
  EXPECT_EQ(algorithms[0].name, "nearest_neighbor");
  EXPECT_EQ(algorithms[4].name, "ant_colony_optimization");
  EXPECT_THAT(optimizer->GetConstraintCatalog(), SizeIs(8));
}

TEST_F(RouteOptimizerTest, CreateRejectsInvalidParameters) {
  params_.mutable_solver()->set_num_threads(0);
  EXPECT_THAT(RouteOptimizer::Create(params_, &data_source_, nullptr, nullptr),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("num_threads")));
  params_ = DefaultOptimizerParameters();
  EXPECT_THAT(RouteOptimizer::Create(params_, nullptr, nullptr, nullptr),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace route_optimization
