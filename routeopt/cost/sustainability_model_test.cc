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


#include "routeopt/cost/sustainability_model.h"

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

class SustainabilityModelTest : public ::testing::Test {
 protected:
  const SustainabilityParameters params_ =
      DefaultOptimizerParameters().sustainability();
};

TEST_F(SustainabilityModelTest, ShortDieselRoute) {
  const SustainabilityMetrics metrics =
      ComputeSustainability(100, 8, FuelType::kDiesel, params_);
  EXPECT_NEAR(metrics.co2_emissions_kg, 21.44, 1e-9);
  EXPECT_NEAR(metrics.fuel_efficiency, 12.5, 1e-9);
  // Ten points per kg of CO2 put the CO2 sub-score at 0.
  EXPECT_NEAR(metrics.environmental_score, 62.5 / 2, 1e-9);
  EXPECT_THAT(metrics.recommendations, IsEmpty());
}

TEST_F(SustainabilityModelTest, FrugalDieselRoute) {
  const SustainabilityMetrics metrics =
      ComputeSustainability(100, 2, FuelType::kDiesel, params_);
  EXPECT_NEAR(metrics.co2_emissions_kg, 5.36, 1e-9);
  EXPECT_NEAR(metrics.fuel_efficiency, 50, 1e-9);
  // max(0, 100 - 5.36 * 10) and min(100, 50 * 5).
  EXPECT_NEAR(metrics.environmental_score, (46.4 + 100) / 2, 1e-9);
  EXPECT_THAT(metrics.recommendations, IsEmpty());
}

TEST_F(SustainabilityModelTest, LongDieselRoute) {
  const SustainabilityMetrics metrics =
      ComputeSustainability(1000, 80, FuelType::kDiesel, params_);
  EXPECT_NEAR(metrics.co2_emissions_kg, 214.4, 1e-9);
  // The CO2 sub-score is clamped at 0.
  EXPECT_NEAR(metrics.environmental_score, 62.5 / 2, 1e-9);
  EXPECT_THAT(metrics.recommendations,
              ElementsAre(HasSubstr("CO2"), HasSubstr("diesel")));
}

TEST_F(SustainabilityModelTest, ElectricEmitsLess) {
  const SustainabilityMetrics diesel =
      ComputeSustainability(100, 8, FuelType::kDiesel, params_);
  const SustainabilityMetrics electric =
      ComputeSustainability(100, 25, FuelType::kElectric, params_);
  EXPECT_LT(electric.co2_emissions_kg, diesel.co2_emissions_kg);
  EXPECT_NEAR(electric.co2_emissions_kg, 11.25, 1e-9);
}

TEST_F(SustainabilityModelTest, LowEfficiency) {
  const SustainabilityMetrics metrics =
      ComputeSustainability(100, 15, FuelType::kGasoline, params_);
  EXPECT_THAT(metrics.recommendations,
              ElementsAre(HasSubstr("maintenance")));
}

TEST_F(SustainabilityModelTest, ScoreStaysInRange) {
  for (const double consumption : {0.0, 0.1, 5.0, 50.0, 5000.0}) {
    const SustainabilityMetrics metrics =
        ComputeSustainability(100, consumption, FuelType::kGasoline, params_);
    EXPECT_GE(metrics.environmental_score, 0);
    EXPECT_LE(metrics.environmental_score, 100);
  }
}

}  // namespace
}  // namespace route_optimization
