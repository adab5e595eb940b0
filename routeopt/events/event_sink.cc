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

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "routeopt/base/logging.h"

namespace route_optimization {

absl::Status LoggingEventSink::Publish(absl::string_view event_name,
                                       const google::protobuf::Message& event) {
  LOG(INFO) << event_name << ": " << event.ShortDebugString();
  return absl::OkStatus();
}

}  // namespace route_optimization
