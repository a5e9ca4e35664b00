#pragma once

#include <chrono>
#include <cstdint>

namespace heartbeat::util {

/*
  Time utilities. All clock reads go through here.

  Everything in the engine reads time through a Clock so tests can
  advance it deterministically.
*/

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);

class Clock {
 public:
  virtual ~Clock() = default;

  // Unix epoch milliseconds.
  virtual int64_t NowMs() const = 0;
};

class SystemClock final : public Clock {
 public:
  int64_t NowMs() const override;
};

} // namespace heartbeat::util
