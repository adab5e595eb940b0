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

#include "routeopt/solvers/route_evaluator.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "routeopt/base/status_matchers.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::status::StatusIs;

const absl::Time kDeparture = absl::FromCivil(
    absl::CivilSecond(2024, 1, 8, 10, 0, 0), absl::UTCTimeZone());

RealTimeContext NeutralContext() {
  RealTimeContext context;
  context.traffic.average_speed_kmh = 45;
  context.traffic.congestion_level = 0.3;
  context.time_factors.traffic_multiplier = 1.0;
  return context;
}

Destination MakeDestination(const std::string& id, double longitude) {
  Destination destination;
  destination.id = id;
  destination.location = {0.0, longitude};
  return destination;
}

SolverInput MakeInput(std::vector<Destination> destinations) {
  SolverInput input;
  input.origin.location = {0.0, 0.0};
  input.destinations = std::move(destinations);
  input.departure_time = kDeparture;
  return input;
}

TEST(AdmitDestinationsTest, WithoutVehicleEverythingIsAdmitted) {
  const std::vector<Destination> destinations = {MakeDestination("a", 1),
                                                 MakeDestination("b", 2)};
  const CapacityAdmission admission = AdmitDestinations(destinations, nullptr);
  EXPECT_EQ(admission.admitted.size(), 2);
  EXPECT_THAT(admission.unassigned_ids, IsEmpty());
}

TEST(AdmitDestinationsTest, HighPriorityFirst) {
  std::vector<Destination> destinations = {MakeDestination("low", 1),
                                           MakeDestination("high", 2),
                                           MakeDestination("medium", 3)};
  destinations[0].priority = Priority::kLow;
  destinations[1].priority = Priority::kHigh;
  destinations[2].priority = Priority::kMedium;
  for (Destination& destination : destinations) destination.weight_kg = 400;
  VehicleProfile vehicle;
  vehicle.capacity_kg = 1000;
  vehicle.volume_capacity_m3 = 10;

  const CapacityAdmission admission = AdmitDestinations(destinations, &vehicle);
  ASSERT_EQ(admission.admitted.size(), 2);
  EXPECT_EQ(admission.admitted[0].id, "high");
  EXPECT_EQ(admission.admitted[1].id, "medium");
  EXPECT_THAT(admission.unassigned_ids, ElementsAre("low"));
}

TEST(AdmitDestinationsTest, VolumeIsAlsoACapacity) {
  std::vector<Destination> destinations = {MakeDestination("a", 1),
                                           MakeDestination("b", 2)};
  destinations[0].volume_m3 = 8;
  destinations[1].volume_m3 = 1;
  VehicleProfile vehicle;
  vehicle.capacity_kg = 1000;
  vehicle.volume_capacity_m3 = 5;

  const CapacityAdmission admission = AdmitDestinations(destinations, &vehicle);
  ASSERT_EQ(admission.admitted.size(), 1);
  EXPECT_EQ(admission.admitted[0].id, "b");
  EXPECT_THAT(admission.unassigned_ids, ElementsAre("a"));
}

TEST(EffectiveSpeedTest, SlowdownsAreApplied) {
  const TravelParameters params = DefaultOptimizerParameters().travel();
  RealTimeContext context = NeutralContext();
  EXPECT_DOUBLE_EQ(EffectiveSpeedKmh(context, params), 45);
  context.time_factors.traffic_multiplier = 1.5;
  EXPECT_DOUBLE_EQ(EffectiveSpeedKmh(context, params), 30);
  context.weather.road_condition = RoadCondition::kIcy;
  EXPECT_DOUBLE_EQ(EffectiveSpeedKmh(context, params), 18);
  context.traffic.average_speed_kmh = 1;
  EXPECT_DOUBLE_EQ(EffectiveSpeedKmh(context, params), params.min_speed_kmh());
}

TEST(ScheduleStopTest, WaitsForWindowToOpen) {
  TimeWindow window;
  window.start = kDeparture + absl::Hours(2);
  const Stop stop =
      ScheduleStop(kDeparture, 45, 45, window, absl::Minutes(10));
  EXPECT_EQ(stop.arrival_time, kDeparture + absl::Hours(1));
  EXPECT_EQ(stop.waiting_time, absl::Hours(1));
  EXPECT_EQ(stop.lateness, absl::ZeroDuration());
  EXPECT_EQ(stop.departure_time, kDeparture + absl::Minutes(130));
}

TEST(ScheduleStopTest, RecordsLateness) {
  TimeWindow window;
  window.end = kDeparture + absl::Minutes(40);
  const Stop stop =
      ScheduleStop(kDeparture, 45, 45, window, absl::ZeroDuration());
  EXPECT_EQ(stop.lateness, absl::Minutes(20));
  EXPECT_EQ(stop.waiting_time, absl::ZeroDuration());
}

TEST(MinimumSpanningTreeTest, PointsOnALine) {
  const std::vector<GeoPoint> points = {{0, 0}, {0, 2}, {0, 1}};
  const std::vector<GeoPoint> ends = {{0, 0}, {0, 2}};
  EXPECT_NEAR(MinimumSpanningTreeWeight(points),
              MinimumSpanningTreeWeight(ends), 1e-6);
  EXPECT_EQ(MinimumSpanningTreeWeight({}), 0.0);
}

class RouteEvaluatorTest : public ::testing::Test {
 protected:
  OptimizerParameters params_ = DefaultOptimizerParameters();
};

TEST_F(RouteEvaluatorTest, CandidateInvariants) {
  std::vector<Destination> destinations = {MakeDestination("a", 0.5),
                                           MakeDestination("b", 0.2),
                                           MakeDestination("c", 0.9)};
  destinations[0].service_time = absl::Minutes(15);
  destinations[0].weight_kg = 100;
  destinations[2].volume_m3 = 2;
  const RouteEvaluator evaluator(MakeInput(destinations), NeutralContext(),
                                 params_);

  ASSERT_OK_AND_ASSIGN(
      const CandidateRoute route,
      evaluator.BuildCandidate(SolverAlgorithm::kSavings, {1, 0, 2}));
  EXPECT_EQ(route.algorithm, SolverAlgorithm::kSavings);
  ASSERT_EQ(route.stops.size(), 3);
  EXPECT_EQ(route.stops[0].destination_id, "b");
  double distance = 0.0;
  for (int i = 0; i < route.stops.size(); ++i) {
    distance += route.stops[i].distance_from_previous_km;
    if (i > 0) {
      EXPECT_LE(route.stops[i - 1].arrival_time, route.stops[i].arrival_time);
    }
  }
  EXPECT_NEAR(route.total_distance_km, distance, 1e-9);
  EXPECT_GE(route.efficiency, 0.0);
  EXPECT_LE(route.efficiency, 1.0);
  EXPECT_DOUBLE_EQ(route.feasibility, 1.0);
  EXPECT_DOUBLE_EQ(route.load_weight_kg, 100);
  EXPECT_DOUBLE_EQ(route.load_volume_m3, 2);
  EXPECT_EQ(route.total_duration,
            route.stops.back().departure_time - kDeparture);
  // The sorted order beats the input order.
  EXPECT_GT(route.time_savings, absl::ZeroDuration());
}

TEST_F(RouteEvaluatorTest, StraightRouteIsFullyEfficient) {
  const RouteEvaluator evaluator(
      MakeInput({MakeDestination("a", 0.2), MakeDestination("b", 0.4)}),
      NeutralContext(), params_);
  ASSERT_OK_AND_ASSIGN(
      const CandidateRoute route,
      evaluator.BuildCandidate(SolverAlgorithm::kNearestNeighbor, {0, 1}));
  EXPECT_THAT(route.efficiency, DoubleNear(1.0, 1e-9));
  EXPECT_EQ(route.time_savings, absl::ZeroDuration());
}

TEST_F(RouteEvaluatorTest, EfficiencyBlendFollowsDistanceWeight) {
  std::vector<Destination> destinations = {MakeDestination("a", 0.2),
                                           MakeDestination("b", 0.4)};
  for (Destination& destination : destinations) {
    destination.service_time = absl::Minutes(30);
  }
  // A straight route has a distance ratio of 1. Its driving share is what is
  // left of the duration once the hour of service is removed.
  params_.mutable_solver()->set_efficiency_distance_weight(1.0);
  const RouteEvaluator distance_only(MakeInput(destinations), NeutralContext(),
                                     params_);
  ASSERT_OK_AND_ASSIGN(
      const CandidateRoute straight,
      distance_only.BuildCandidate(SolverAlgorithm::kNearestNeighbor, {0, 1}));
  EXPECT_THAT(straight.efficiency, DoubleNear(1.0, 1e-9));

  params_.mutable_solver()->set_efficiency_distance_weight(0.0);
  const RouteEvaluator driving_only(MakeInput(destinations), NeutralContext(),
                                    params_);
  ASSERT_OK_AND_ASSIGN(
      const CandidateRoute route,
      driving_only.BuildCandidate(SolverAlgorithm::kNearestNeighbor, {0, 1}));
  const double driving_share = absl::FDivDuration(
      route.total_duration - absl::Hours(1), route.total_duration);
  EXPECT_LT(driving_share, 1.0);
  EXPECT_THAT(route.efficiency, DoubleNear(driving_share, 1e-9));
}

TEST_F(RouteEvaluatorTest, LatenessWithinToleranceLowersFeasibility) {
  std::vector<Destination> destinations = {MakeDestination("a", 0.4047)};
  // About 45 km at 45 km/h: one hour of driving, 15 minutes late.
  destinations[0].time_window.end = kDeparture + absl::Minutes(45);
  const RouteEvaluator evaluator(MakeInput(destinations), NeutralContext(),
                                 params_);
  ASSERT_OK_AND_ASSIGN(
      const CandidateRoute route,
      evaluator.BuildCandidate(SolverAlgorithm::kNearestNeighbor, {0}));
  EXPECT_NEAR(absl::ToDoubleMinutes(route.stops[0].lateness), 15, 0.5);
  EXPECT_NEAR(route.feasibility, 0.5, 0.02);
}

TEST_F(RouteEvaluatorTest, LatenessBeyondToleranceIsRejected) {
  std::vector<Destination> destinations = {MakeDestination("a", 0.4047)};
  destinations[0].time_window.end = kDeparture + absl::Minutes(10);
  const RouteEvaluator evaluator(MakeInput(destinations), NeutralContext(),
                                 params_);
  EXPECT_FALSE(evaluator.Evaluate({0}).IsFeasible());
  EXPECT_THAT(evaluator.BuildCandidate(SolverAlgorithm::kNearestNeighbor, {0}),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("time window")));
}

TEST_F(RouteEvaluatorTest, DistanceAndDurationCeilings) {
  SolverInput input = MakeInput({MakeDestination("a", 1.0)});
  input.constraints.max_distance_km = 50;
  const RouteEvaluator too_far(input, NeutralContext(), params_);
  EXPECT_THAT(too_far.BuildCandidate(SolverAlgorithm::kGenetic, {0}),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("distance")));

  input.constraints.max_distance_km = 500;
  input.constraints.max_route_duration = absl::Hours(1);
  const RouteEvaluator too_long(input, NeutralContext(), params_);
  EXPECT_TRUE(too_long.Evaluate({0}).exceeds_max_duration);
  EXPECT_THAT(too_long.BuildCandidate(SolverAlgorithm::kGenetic, {0}),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("duration")));
}

TEST_F(RouteEvaluatorTest, IncompleteOrderIsAnInternalError) {
  const RouteEvaluator evaluator(
      MakeInput({MakeDestination("a", 0.2), MakeDestination("b", 0.4)}),
      NeutralContext(), params_);
  EXPECT_THAT(evaluator.BuildCandidate(SolverAlgorithm::kAntColony, {0}),
              StatusIs(absl::StatusCode::kInternal));
}

}  // namespace
}  // namespace route_optimization
