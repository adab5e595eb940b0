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


#include "routeopt/scoring/recommendations.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "routeopt/config/parameters.h"
#include "routeopt/config/parameters.pb.h"
#include "routeopt/model/types.h"

namespace route_optimization {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::StartsWith;

RealTimeContext CalmContext() {
  RealTimeContext context;
  context.traffic.congestion_level = 0.3;
  context.traffic.average_speed_kmh = 45;
  context.weather.road_condition = RoadCondition::kDry;
  context.fuel_prices = {22.5, 24.3, 1.8};
  return context;
}

class RecommendationsTest : public ::testing::Test {
 protected:
  std::vector<std::string> Generate(const RealTimeContext& context) const {
    return GenerateRecommendations(context, inputs_, params_);
  }

  const RecommendationParameters params_ =
      DefaultOptimizerParameters().recommendations();
  RecommendationInputs inputs_;
};

TEST_F(RecommendationsTest, NothingToReport) {
  EXPECT_THAT(Generate(CalmContext()), IsEmpty());
}

TEST_F(RecommendationsTest, HeavyCongestion) {
  RealTimeContext context = CalmContext();
  context.traffic.congestion_level = 0.7;
  EXPECT_THAT(Generate(context), IsEmpty());
  context.traffic.congestion_level = 0.85;
  EXPECT_THAT(Generate(context),
              ElementsAre(HasSubstr("alternative routes")));
}

TEST_F(RecommendationsTest, HazardousRoads) {
  RealTimeContext context = CalmContext();
  context.weather.road_condition = RoadCondition::kWet;
  EXPECT_THAT(Generate(context), IsEmpty());
  context.weather.road_condition = RoadCondition::kIcy;
  EXPECT_THAT(Generate(context), ElementsAre(HasSubstr("Hazardous icy")));
  context.weather.road_condition = RoadCondition::kSnowy;
  EXPECT_THAT(Generate(context), ElementsAre(HasSubstr("Hazardous snowy")));
}

TEST_F(RecommendationsTest, FuelPriceOfTheVehicleFuel) {
  RealTimeContext context = CalmContext();
  context.fuel_prices.gasoline = 26.0;
  EXPECT_THAT(Generate(context), IsEmpty());
  inputs_.fuel_type = FuelType::kHybrid;
  EXPECT_THAT(Generate(context),
              ElementsAre("High hybrid prices: consider electric vehicles"));
}

TEST_F(RecommendationsTest, RushHour) {
  RealTimeContext context = CalmContext();
  context.time_factors.is_rush_hour = true;
  EXPECT_THAT(Generate(context), ElementsAre(HasSubstr("Rush hour")));
}

TEST_F(RecommendationsTest, IncidentsAreCounted) {
  RealTimeContext context = CalmContext();
  TrafficIncident accident;
  accident.type = IncidentType::kAccident;
  accident.severity = Severity::kHigh;
  TrafficIncident works;
  works.type = IncidentType::kConstruction;
  works.severity = Severity::kMedium;
  context.traffic.incidents = {accident, works};
  EXPECT_THAT(Generate(context),
              ElementsAre(StartsWith("2 traffic incident(s) reported (1 high "
                                     "severity)")));
}

TEST_F(RecommendationsTest, OneEntryPerWeatherWarning) {
  RealTimeContext context = CalmContext();
  context.weather.warnings = {"Strong wind", "Fog"};
  EXPECT_THAT(Generate(context), ElementsAre("Weather warning: Strong wind",
                                             "Weather warning: Fog"));
}

TEST_F(RecommendationsTest, UnassignedDestinations) {
  inputs_.unassigned_destination_ids = {"d3", "d7"};
  EXPECT_THAT(Generate(CalmContext()),
              ElementsAre(HasSubstr("(d3, d7)")));
}

TEST_F(RecommendationsTest, BelowFeasibilityThreshold) {
  inputs_.below_feasibility_threshold = true;
  EXPECT_THAT(Generate(CalmContext()),
              ElementsAre(HasSubstr("feasibility threshold")));
}

TEST_F(RecommendationsTest, RulesFireTogetherInOrder) {
  RealTimeContext context = CalmContext();
  context.traffic.congestion_level = 0.95;
  context.weather.road_condition = RoadCondition::kSnowy;
  context.weather.warnings = {"Blizzard"};
  context.fuel_prices.diesel = 30;
  context.time_factors.is_rush_hour = true;
  context.traffic.incidents.resize(1);
  inputs_.unassigned_destination_ids = {"x"};
  inputs_.below_feasibility_threshold = true;
  const std::vector<std::string> recommendations = Generate(context);
  ASSERT_THAT(recommendations, SizeIs(8));
  EXPECT_THAT(recommendations[0], HasSubstr("congestion"));
  EXPECT_THAT(recommendations[1], HasSubstr("snowy"));
  EXPECT_THAT(recommendations[2], HasSubstr("diesel"));
  EXPECT_THAT(recommendations[3], HasSubstr("Rush hour"));
  EXPECT_THAT(recommendations[4], HasSubstr("0 high severity"));
  EXPECT_EQ(recommendations[5], "Weather warning: Blizzard");
  EXPECT_THAT(recommendations[6], HasSubstr("(x)"));
  EXPECT_THAT(recommendations[7], HasSubstr("feasibility"));
}

}  // namespace
}  // namespace route_optimization
