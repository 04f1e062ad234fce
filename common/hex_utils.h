#ifndef LIPSEAL_HEX_UTILS_H
#define LIPSEAL_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lipseal::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string BytesToHex(const std::vector<std::uint8_t>& data);
bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);

// Short BLAKE2b fingerprint of key material, safe to put in logs.
std::string KeyFingerprintHex(const std::uint8_t* data, std::size_t len);

}  // namespace lipseal::common

#endif  // LIPSEAL_HEX_UTILS_H
