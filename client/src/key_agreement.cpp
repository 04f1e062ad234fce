#include "key_agreement.h"

#include <algorithm>
#include <cstring>

#include "monocypher.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kContentKeyLabel[] = "lipseal/content-key/v1";
constexpr char kKeyIdLabel[] = "lipseal/key-id/v1";

bool AllZero(const std::uint8_t* data, std::size_t len) {
  std::uint8_t acc = 0;
  for (std::size_t i = 0; i < len; ++i) {
    acc |= data[i];
  }
  return acc == 0;
}

}  // namespace

bool GenerateDeviceKey(DeviceKey& out, Error& error) {
  error.Clear();
  if (!platform::RandomBytes(out.data(), out.size())) {
    return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
  }
  return true;
}

std::array<std::uint8_t, kKeyBytes> DerivePublicKey(const DeviceKey& device_key) {
  std::array<std::uint8_t, kKeyBytes> pk{};
  crypto_x25519_public_key(pk.data(), device_key.data());
  return pk;
}

bool DeriveContentKey(const DeviceKey& own_device_key,
                      const std::array<std::uint8_t, kKeyBytes>& peer_public_key,
                      ContentKey& out,
                      Error& error) {
  error.Clear();
  std::array<std::uint8_t, kKeyBytes> shared{};
  common::ScopedWipe wipe_shared(shared);
  crypto_x25519(shared.data(), own_device_key.data(), peer_public_key.data());
  if (AllZero(shared.data(), shared.size())) {
    return Fail(error, ErrorCode::kCryptoFailure, "peer key rejected");
  }

  const auto own_public = DerivePublicKey(own_device_key);
  const bool own_first =
      std::memcmp(own_public.data(), peer_public_key.data(), kKeyBytes) <= 0;
  const auto& first = own_first ? own_public : peer_public_key;
  const auto& second = own_first ? peer_public_key : own_public;

  crypto_blake2b_ctx ctx;
  crypto_blake2b_init(&ctx, out.size());
  crypto_blake2b_update(&ctx, shared.data(), shared.size());
  crypto_blake2b_update(&ctx, first.data(), first.size());
  crypto_blake2b_update(&ctx, second.data(), second.size());
  crypto_blake2b_update(&ctx,
                        reinterpret_cast<const std::uint8_t*>(kContentKeyLabel),
                        sizeof(kContentKeyLabel) - 1);
  crypto_blake2b_final(&ctx, out.data());
  return true;
}

KeyId PublicKeyId(const std::array<std::uint8_t, kKeyBytes>& public_key) {
  KeyId id{};
  crypto_blake2b_ctx ctx;
  crypto_blake2b_init(&ctx, id.size());
  crypto_blake2b_update(&ctx,
                        reinterpret_cast<const std::uint8_t*>(kKeyIdLabel),
                        sizeof(kKeyIdLabel) - 1);
  crypto_blake2b_update(&ctx, public_key.data(), public_key.size());
  crypto_blake2b_final(&ctx, id.data());
  return id;
}

bool DeviceKeyFromBytes(const std::vector<std::uint8_t>& bytes,
                        DeviceKey& out,
                        Error& error) {
  error.Clear();
  if (bytes.size() != out.size()) {
    return Fail(error, ErrorCode::kStorageUnavailable,
                "stored device key has wrong size");
  }
  std::memcpy(out.data(), bytes.data(), out.size());
  return true;
}

}  // namespace lipseal::client
