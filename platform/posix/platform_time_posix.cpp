#include "platform_time.h"

#include <time.h>

#include <cerrno>

namespace lipseal::platform {

std::uint64_t NowSteadyMs() {
  struct timespec ts {};
  if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec) * 1000u +
         static_cast<std::uint64_t>(ts.tv_nsec) / 1000000u;
}

std::uint64_t NowUnixSeconds() {
  struct timespec ts {};
  if (::clock_gettime(CLOCK_REALTIME, &ts) != 0 || ts.tv_sec <= 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec);
}

void SleepMs(std::uint32_t ms) {
  struct timespec req {};
  req.tv_sec = static_cast<time_t>(ms / 1000u);
  req.tv_nsec = static_cast<long>(ms % 1000u) * 1000000L;
  while (::nanosleep(&req, &req) != 0 && errno == EINTR) {
  }
}

}  // namespace lipseal::platform
