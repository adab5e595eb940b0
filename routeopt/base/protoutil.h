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

#ifndef ROUTEOPT_BASE_PROTOUTIL_H_
#define ROUTEOPT_BASE_PROTOUTIL_H_

#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace util_time {

inline ::absl::StatusOr<google::protobuf::Duration> EncodeGoogleApiProto(
    absl::Duration d) {
  if (d == absl::InfiniteDuration() || d == -absl::InfiniteDuration()) {
    return absl::InvalidArgumentError("Cannot encode an infinite duration");
  }
  google::protobuf::Duration proto;
  const int64_t d_in_nano = absl::ToInt64Nanoseconds(d);
  proto.set_seconds(static_cast<int64_t>(d_in_nano / 1000000000));
  proto.set_nanos(static_cast<int>(d_in_nano % 1000000000));
  return proto;
}

inline ::absl::StatusOr<absl::Duration> DecodeGoogleApiProto(
    const google::protobuf::Duration& proto) {
  if (proto.seconds() < 0 || proto.nanos() < 0) {
    return absl::InvalidArgumentError("Negative durations are not supported");
  }
  return absl::Seconds(proto.seconds()) + absl::Nanoseconds(proto.nanos());
}

inline ::absl::StatusOr<google::protobuf::Timestamp> EncodeGoogleApiProto(
    absl::Time t) {
  if (t == absl::InfiniteFuture() || t == absl::InfinitePast()) {
    return absl::InvalidArgumentError("Cannot encode an infinite time");
  }
  google::protobuf::Timestamp proto;
  const int64_t t_in_nano = absl::ToUnixNanos(t);
  int64_t seconds = t_in_nano / 1000000000;
  int64_t nanos = t_in_nano % 1000000000;
  if (nanos < 0) {
    --seconds;
    nanos += 1000000000;
  }
  proto.set_seconds(seconds);
  proto.set_nanos(static_cast<int>(nanos));
  return proto;
}

inline absl::Time DecodeGoogleApiProto(
    const google::protobuf::Timestamp& proto) {
  return absl::FromUnixSeconds(proto.seconds()) +
         absl::Nanoseconds(proto.nanos());
}

}  // namespace util_time

#endif  // ROUTEOPT_BASE_PROTOUTIL_H_
