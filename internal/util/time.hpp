#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace rnaflow::util {

// Wall clock for persisted timestamps, steady clock for runtimes.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

double SecondsSince(std::chrono::steady_clock::time_point start);

} // namespace rnaflow::util
