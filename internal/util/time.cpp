#include "time.hpp"

namespace heartbeat::util {

TimePoint Now() {
  return WallClock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t SystemClock::NowMs() const {
  return ToUnixMillis(Now());
}

} // namespace heartbeat::util
