#ifndef LIPSEAL_PLATFORM_SECURE_STORE_H
#define LIPSEAL_PLATFORM_SECURE_STORE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lipseal::platform {

bool SecureStoreSupported();

// Seals plain under a per-user master key held by the OS keyring.
// entropy is bound as associated data and must match on unprotect.
bool ProtectSecureBlob(const std::vector<std::uint8_t>& plain,
                       const std::uint8_t* entropy,
                       std::size_t entropy_len,
                       std::vector<std::uint8_t>& out,
                       std::string& error);

bool UnprotectSecureBlob(const std::vector<std::uint8_t>& blob,
                         const std::uint8_t* entropy,
                         std::size_t entropy_len,
                         std::vector<std::uint8_t>& out,
                         std::string& error);

}  // namespace lipseal::platform

#endif  // LIPSEAL_PLATFORM_SECURE_STORE_H
