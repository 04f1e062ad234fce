#include "platform_secure_store.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include "hex_utils.h"
#include "monocypher.h"
#include "platform_random.h"
#include "secure_buffer.h"

#if defined(__linux__)
#include <libsecret/secret.h>
#include <unistd.h>
#endif

namespace lipseal::platform {

namespace {

constexpr char kStoreLabel[] = "lipseal secure store key";
constexpr char kStoreService[] = "lipseal_secure_store";
constexpr char kBlobMagic[] = "LIPSEAL_SECURE_STORE_V1";
constexpr std::size_t kKeyBytes = 32;
constexpr std::size_t kNonceBytes = 24;
constexpr std::size_t kTagBytes = 16;

using MasterKey = std::array<std::uint8_t, kKeyBytes>;

#if defined(__linux__)

const SecretSchema& SecureStoreSchema() {
  static const SecretSchema kSchema = {
      "com.lipseal.e2ee.secure_store",
      SECRET_SCHEMA_NONE,
      {{"name", SECRET_SCHEMA_ATTRIBUTE_STRING},
       {"uid", SECRET_SCHEMA_ATTRIBUTE_STRING},
       {nullptr, static_cast<SecretSchemaAttributeType>(0)}}};
  return kSchema;
}

std::string CurrentUidString() {
  return std::to_string(static_cast<unsigned long>(getuid()));
}

bool LoadKeyringKey(MasterKey& key, bool& found, std::string& error) {
  found = false;
  error.clear();
  GError* gerr = nullptr;
  const std::string uid = CurrentUidString();
  gchar* secret = secret_password_lookup_sync(&SecureStoreSchema(), nullptr,
                                              &gerr, "name", kStoreService,
                                              "uid", uid.c_str(), nullptr);
  if (gerr) {
    error = gerr->message ? gerr->message : "secret service error";
    g_error_free(gerr);
    return false;
  }
  if (!secret) {
    return true;
  }
  std::vector<std::uint8_t> bytes;
  const bool ok = common::HexToBytes(std::string(secret), bytes) &&
                  bytes.size() == key.size();
  secret_password_free(secret);
  if (!ok) {
    common::SecureWipe(bytes);
    error = "secret store key invalid";
    return false;
  }
  std::memcpy(key.data(), bytes.data(), key.size());
  common::SecureWipe(bytes);
  found = true;
  return true;
}

bool StoreKeyringKey(const MasterKey& key, std::string& error) {
  error.clear();
  std::string hex = common::BytesToHex(key.data(), key.size());
  common::ScopedWipe wipe_hex(hex);
  GError* gerr = nullptr;
  const std::string uid = CurrentUidString();
  const gboolean ok = secret_password_store_sync(
      &SecureStoreSchema(), SECRET_COLLECTION_DEFAULT, kStoreLabel,
      hex.c_str(), nullptr, &gerr, "name", kStoreService, "uid", uid.c_str(),
      nullptr);
  if (!ok) {
    error = gerr && gerr->message ? gerr->message : "secret store failed";
    if (gerr) {
      g_error_free(gerr);
    }
    return false;
  }
  return true;
}

#endif

bool GetOrCreateMasterKey(MasterKey& key, std::string& error) {
  error.clear();
  static bool cached = false;
  static MasterKey cached_key{};
  static std::mutex cache_mu;

  std::lock_guard<std::mutex> lock(cache_mu);
  if (cached) {
    key = cached_key;
    return true;
  }

#if defined(__linux__)
  bool found = false;
  if (!LoadKeyringKey(key, found, error)) {
    return false;
  }
  if (!found) {
    if (!RandomBytes(key.data(), key.size())) {
      error = "secure store rng failed";
      return false;
    }
    if (!StoreKeyringKey(key, error)) {
      common::SecureWipe(key);
      return false;
    }
  }
#else
  (void)key;
  error = "secure store unsupported";
  return false;
#endif

  cached_key = key;
  cached = true;
  return true;
}

// magic | nonce | mac | ciphertext
struct SealedBlob {
  std::array<std::uint8_t, kNonceBytes> nonce{};
  std::array<std::uint8_t, kTagBytes> mac{};
  std::vector<std::uint8_t> cipher;

  bool Parse(const std::vector<std::uint8_t>& blob) {
    const std::size_t magic_len = sizeof(kBlobMagic) - 1;
    const std::size_t header = magic_len + nonce.size() + mac.size();
    if (blob.size() <= header ||
        std::memcmp(blob.data(), kBlobMagic, magic_len) != 0) {
      return false;
    }
    const std::uint8_t* p = blob.data() + magic_len;
    std::memcpy(nonce.data(), p, nonce.size());
    std::memcpy(mac.data(), p + nonce.size(), mac.size());
    cipher.assign(blob.begin() + static_cast<std::ptrdiff_t>(header),
                  blob.end());
    return true;
  }

  void Serialize(std::vector<std::uint8_t>& out) const {
    const std::size_t magic_len = sizeof(kBlobMagic) - 1;
    out.clear();
    out.reserve(magic_len + nonce.size() + mac.size() + cipher.size());
    out.insert(out.end(), kBlobMagic, kBlobMagic + magic_len);
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), mac.begin(), mac.end());
    out.insert(out.end(), cipher.begin(), cipher.end());
  }
};

}  // namespace

bool SecureStoreSupported() {
#if defined(__linux__)
  return true;
#else
  return false;
#endif
}

bool ProtectSecureBlob(const std::vector<std::uint8_t>& plain,
                       const std::uint8_t* entropy,
                       std::size_t entropy_len,
                       std::vector<std::uint8_t>& out,
                       std::string& error) {
  error.clear();
  out.clear();
  if (plain.empty()) {
    error = "secure store plain empty";
    return false;
  }
  MasterKey key{};
  common::ScopedWipe wipe_key(key);
  if (!GetOrCreateMasterKey(key, error)) {
    return false;
  }
  SealedBlob sealed;
  if (!RandomBytes(sealed.nonce.data(), sealed.nonce.size())) {
    error = "secure store rng failed";
    return false;
  }
  sealed.cipher.resize(plain.size());
  crypto_aead_lock(sealed.cipher.data(), sealed.mac.data(), key.data(),
                   sealed.nonce.data(), entropy_len > 0 ? entropy : nullptr,
                   entropy_len, plain.data(), plain.size());
  sealed.Serialize(out);
  return true;
}

bool UnprotectSecureBlob(const std::vector<std::uint8_t>& blob,
                         const std::uint8_t* entropy,
                         std::size_t entropy_len,
                         std::vector<std::uint8_t>& out,
                         std::string& error) {
  error.clear();
  out.clear();
  SealedBlob sealed;
  if (!sealed.Parse(blob)) {
    error = "secure store blob invalid";
    return false;
  }
  MasterKey key{};
  common::ScopedWipe wipe_key(key);
  if (!GetOrCreateMasterKey(key, error)) {
    return false;
  }
  out.resize(sealed.cipher.size());
  if (crypto_aead_unlock(out.data(), sealed.mac.data(), key.data(),
                         sealed.nonce.data(),
                         entropy_len > 0 ? entropy : nullptr, entropy_len,
                         sealed.cipher.data(), sealed.cipher.size()) != 0) {
    common::SecureWipe(out);
    out.clear();
    error = "secure store auth failed";
    return false;
  }
  return true;
}

}  // namespace lipseal::platform
