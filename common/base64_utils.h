#ifndef LIPSEAL_BASE64_UTILS_H
#define LIPSEAL_BASE64_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lipseal::common {

// Standard alphabet with '=' padding.
std::string Base64Encode(const std::uint8_t* data, std::size_t len);
std::string Base64Encode(const std::vector<std::uint8_t>& data);

// Strict decoder: rejects characters outside the alphabet, bad padding and
// lengths that are not a multiple of four. Empty input decodes to empty.
bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out);

std::size_t Base64EncodedSize(std::size_t raw_len);

}  // namespace lipseal::common

#endif  // LIPSEAL_BASE64_UTILS_H
