#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace infragraph::util {

/*
  Time utilities. Every clock read goes through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace infragraph::util
