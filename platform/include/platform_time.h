#ifndef LIPSEAL_PLATFORM_TIME_H
#define LIPSEAL_PLATFORM_TIME_H

#include <cstdint>

namespace lipseal::platform {

std::uint64_t NowSteadyMs();
std::uint64_t NowUnixSeconds();
void SleepMs(std::uint32_t ms);

}  // namespace lipseal::platform

#endif  // LIPSEAL_PLATFORM_TIME_H
