#include "time.hpp"

namespace offsync::util {

TimePoint Now() {
  return SystemClock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t WallClock::NowMs() const {
  return ToUnixMillis(Now());
}

} // namespace offsync::util
