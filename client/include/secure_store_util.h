#ifndef LIPSEAL_SECURE_STORE_UTIL_H
#define LIPSEAL_SECURE_STORE_UTIL_H

#include <cstdint>
#include <string>
#include <vector>

namespace lipseal::client {

// Values that do not start with magic are returned as-is with
// out_was_wrapped = false.
bool MaybeUnprotectSecureStore(const std::vector<std::uint8_t>& in,
                               const char* magic,
                               const char* entropy,
                               std::vector<std::uint8_t>& out_plain,
                               bool& out_was_wrapped,
                               std::string& error);

// Output layout: magic | le32 blob length | platform sealed blob.
bool ProtectSecureStore(const std::vector<std::uint8_t>& plain,
                        const char* magic,
                        const char* entropy,
                        std::vector<std::uint8_t>& out_wrapped,
                        std::string& error);

}  // namespace lipseal::client

#endif  // LIPSEAL_SECURE_STORE_UTIL_H
