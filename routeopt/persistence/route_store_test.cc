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


#include "routeopt/persistence/route_store.h"

#include <string>
#include <thread>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "routeopt/base/status_matchers.h"
#include "routeopt/persistence/saved_route.pb.h"

namespace route_optimization {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Property;
using ::testing::SizeIs;
using ::testing::status::StatusIs;

SavedRoutePayload Payload(const std::string& request_id) {
  SavedRoutePayload payload;
  payload.set_request_id(request_id);
  payload.set_algorithm("nearest_neighbor");
  payload.set_total_distance_km(12.5);
  return payload;
}

class InMemoryRouteStoreTest : public ::testing::Test {
 protected:
  InMemoryRouteStore store_;
};

TEST_F(InMemoryRouteStoreTest, SaveAndSearch) {
  ASSERT_OK_AND_ASSIGN(const std::string morning,
                       store_.SaveRoute(Payload("r1"), "Morning Downtown",
                                        "Daily run", "alice"));
  ASSERT_OK_AND_ASSIGN(const std::string evening,
                       store_.SaveRoute(Payload("r2"), "Evening downtown", "",
                                        "bob"));
  ASSERT_OK_AND_ASSIGN(const std::string airport,
                       store_.SaveRoute(Payload("r3"), "Airport", "", "alice"));
  EXPECT_NE(morning, evening);

  ASSERT_OK_AND_ASSIGN(const std::vector<SavedRoute> all,
                       store_.GetSavedRoutes("", ""));
  EXPECT_THAT(all, ElementsAre(Property(&SavedRoute::id, morning),
                               Property(&SavedRoute::id, evening),
                               Property(&SavedRoute::id, airport)));
  EXPECT_EQ(all[0].payload().request_id(), "r1");
  EXPECT_EQ(all[0].description(), "Daily run");
  EXPECT_TRUE(all[0].has_created_at());
  EXPECT_EQ(all[0].usage_count(), 0);

  ASSERT_OK_AND_ASSIGN(const std::vector<SavedRoute> downtown,
                       store_.GetSavedRoutes("DOWNTOWN", ""));
  EXPECT_THAT(downtown, SizeIs(2));
  ASSERT_OK_AND_ASSIGN(const std::vector<SavedRoute> alice_downtown,
                       store_.GetSavedRoutes("downtown", "alice"));
  EXPECT_THAT(alice_downtown, ElementsAre(Property(&SavedRoute::id, morning)));
}

TEST_F(InMemoryRouteStoreTest, SaveRequiresNameAndOwner) {
  EXPECT_THAT(store_.SaveRoute(Payload("r"), "", "", "alice"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(store_.SaveRoute(Payload("r"), "name", "", ""),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(InMemoryRouteStoreTest, Delete) {
  ASSERT_OK_AND_ASSIGN(const std::string id,
                       store_.SaveRoute(Payload("r"), "name", "", "alice"));
  ASSERT_OK(store_.DeleteSavedRoute(id));
  ASSERT_OK_AND_ASSIGN(const std::vector<SavedRoute> routes,
                       store_.GetSavedRoutes("", ""));
  EXPECT_THAT(routes, IsEmpty());
  EXPECT_THAT(store_.DeleteSavedRoute(id),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(InMemoryRouteStoreTest, Reassign) {
  ASSERT_OK_AND_ASSIGN(const std::string id,
                       store_.SaveRoute(Payload("r"), "name", "", "alice"));
  ASSERT_OK(store_.ReassignSavedRoute(id, "carol"));
  ASSERT_OK_AND_ASSIGN(const std::vector<SavedRoute> carol,
                       store_.GetSavedRoutes("", "carol"));
  EXPECT_THAT(carol, SizeIs(1));
  EXPECT_THAT(store_.ReassignSavedRoute(id, ""),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(InMemoryRouteStoreTest, MarkUsedCountsUsages) {
  ASSERT_OK_AND_ASSIGN(const std::string id,
                       store_.SaveRoute(Payload("r"), "name", "", "alice"));
  ASSERT_OK(store_.MarkRouteUsed(id));
  ASSERT_OK(store_.MarkRouteUsed(id));
  ASSERT_OK_AND_ASSIGN(const std::vector<SavedRoute> routes,
                       store_.GetSavedRoutes("", ""));
  ASSERT_THAT(routes, SizeIs(1));
  EXPECT_EQ(routes[0].usage_count(), 2);
  EXPECT_TRUE(routes[0].has_last_used_at());
}

TEST_F(InMemoryRouteStoreTest, UnknownIds) {
  for (const std::string id : {"route-42", "42", "elsewhere-1", ""}) {
    EXPECT_THAT(store_.MarkRouteUsed(id),
                StatusIs(absl::StatusCode::kNotFound))
        << id;
    EXPECT_THAT(store_.ReassignSavedRoute(id, "bob"),
                StatusIs(absl::StatusCode::kNotFound))
        << id;
  }
}

TEST_F(InMemoryRouteStoreTest, ConcurrentSavesGetDistinctIds) {
  constexpr int kNumThreads = 8;
  constexpr int kSavesPerThread = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kNumThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kSavesPerThread; ++i) {
        ASSERT_OK(store_.SaveRoute(Payload("r"), "name", "", "alice").status());
      }
    });
  }
  for (std::thread& thread : threads) thread.join();
  ASSERT_OK_AND_ASSIGN(const std::vector<SavedRoute> routes,
                       store_.GetSavedRoutes("", ""));
  EXPECT_THAT(routes, SizeIs(kNumThreads * kSavesPerThread));
}

}  // namespace
}  // namespace route_optimization
