#ifndef LIPSEAL_PLATFORM_RANDOM_H
#define LIPSEAL_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace lipseal::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);
bool RandomUint32(std::uint32_t& out);

}  // namespace lipseal::platform

#endif  // LIPSEAL_PLATFORM_RANDOM_H
