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


#include "routeopt/events/event_sink.h"

#include "gtest/gtest.h"
#include "routeopt/base/status_matchers.h"
#include "routeopt/events/events.pb.h"

namespace route_optimization {
namespace {

TEST(LoggingEventSinkTest, AcceptsEvents) {
  OptimizationCompletedEvent event;
  event.set_request_id("req-1");
  event.set_route_count(1);
  LoggingEventSink sink;
  EXPECT_OK(sink.Publish(kOptimizationCompletedEvent, event));
}

}  // namespace
}  // namespace route_optimization
