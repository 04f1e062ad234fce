#ifndef LIPSEAL_KEY_AGREEMENT_H
#define LIPSEAL_KEY_AGREEMENT_H

#include <array>
#include <cstdint>
#include <vector>

#include "e2ee_error.h"

namespace lipseal::client {

inline constexpr std::size_t kKeyBytes = 32;
inline constexpr std::size_t kKeyIdBytes = 16;

using DeviceKey = std::array<std::uint8_t, kKeyBytes>;
using ContentKey = std::array<std::uint8_t, kKeyBytes>;
using KeyId = std::array<std::uint8_t, kKeyIdBytes>;

bool GenerateDeviceKey(DeviceKey& out, Error& error);

// The device key doubles as an X25519 secret key.
std::array<std::uint8_t, kKeyBytes> DerivePublicKey(const DeviceKey& device_key);

// Content key shared by two devices:
//   BLAKE2b-256(X25519(own, peer) || min(pk_a, pk_b) || max(pk_a, pk_b) || label)
// Both sides derive the same key, so it serves both directions. A low-order
// peer key (all-zero shared secret) is rejected.
bool DeriveContentKey(const DeviceKey& own_device_key,
                      const std::array<std::uint8_t, kKeyBytes>& peer_public_key,
                      ContentKey& out,
                      Error& error);

// Stable identifier of a public key, used to bind backups and file key wraps
// to the device key they belong to.
KeyId PublicKeyId(const std::array<std::uint8_t, kKeyBytes>& public_key);

bool DeviceKeyFromBytes(const std::vector<std::uint8_t>& bytes,
                        DeviceKey& out,
                        Error& error);

}  // namespace lipseal::client

#endif  // LIPSEAL_KEY_AGREEMENT_H
