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


#ifndef ROUTEOPT_EVENTS_EVENT_SINK_H_
#define ROUTEOPT_EVENTS_EVENT_SINK_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace route_optimization {

inline constexpr absl::string_view kOptimizationCompletedEvent =
    "route.optimization.completed";

// Destination of the events published by the optimizer. Publishing is best
// effort: the optimizer logs and ignores failures.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual absl::Status Publish(absl::string_view event_name,
                               const google::protobuf::Message& event) = 0;
};

// Writes every event to the INFO log.
class LoggingEventSink : public EventSink {
 public:
  absl::Status Publish(absl::string_view event_name,
                       const google::protobuf::Message& event) override;
};

}  // namespace route_optimization

#endif  // ROUTEOPT_EVENTS_EVENT_SINK_H_
