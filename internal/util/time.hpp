#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace streamctl::util {

/*
  Time utilities. Wall clock for persisted/reported timestamps,
  steady clock for every bounded wait.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);
google::protobuf::Duration FromMillis(std::chrono::milliseconds ms);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace streamctl::util
