#include "backup_service.h"

#include <array>
#include <cstring>
#include <new>

#include "base64_utils.h"
#include "hex_utils.h"
#include "monocypher.h"
#include "platform_log.h"
#include "platform_random.h"
#include "platform_time.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kLogTag[] = "backup";
constexpr std::uint8_t kMagic[4] = {'L', 'S', 'B', 'K'};
constexpr std::uint8_t kVersion = 1;
constexpr std::size_t kSaltBytes = 16;
constexpr std::size_t kNonceBytes = 24;
constexpr std::size_t kMacBytes = 16;
constexpr std::size_t kParamsBytes = sizeof(kMagic) + 1 + 4 + 4 + 8;
constexpr std::size_t kHeaderBytes =
    kParamsBytes + kKeyIdBytes + kSaltBytes + kNonceBytes;
constexpr std::size_t kBlobBytes = kHeaderBytes + kMacBytes + kKeyBytes;
constexpr std::uint32_t kMaxRestoreBlocks = 256u * 1024u;
constexpr std::uint32_t kMaxRestorePasses = 64;

void PutLe(std::vector<std::uint8_t>& out, std::uint64_t v, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
}

std::uint64_t GetLe(const std::uint8_t* p, std::size_t n) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < n; ++i) {
    v |= static_cast<std::uint64_t>(p[i]) << (8 * i);
  }
  return v;
}

bool DeriveWrappingKey(const std::string& password,
                       const std::uint8_t* salt,
                       std::uint32_t blocks,
                       std::uint32_t passes,
                       std::array<std::uint8_t, kKeyBytes>& out,
                       Error& error) {
  std::vector<std::uint8_t> work_area;
  try {
    work_area.resize(static_cast<std::size_t>(blocks) * 1024);
  } catch (const std::bad_alloc&) {
    return Fail(error, ErrorCode::kCryptoFailure, "argon2 work area alloc failed");
  }

  crypto_argon2_config cfg;
  cfg.algorithm = CRYPTO_ARGON2_ID;
  cfg.nb_blocks = blocks;
  cfg.nb_passes = passes;
  cfg.nb_lanes = 1;

  crypto_argon2_inputs in;
  in.pass = reinterpret_cast<const std::uint8_t*>(password.data());
  in.pass_size = static_cast<std::uint32_t>(password.size());
  in.salt = salt;
  in.salt_size = static_cast<std::uint32_t>(kSaltBytes);

  crypto_argon2(out.data(), static_cast<std::uint32_t>(out.size()),
                work_area.data(), cfg, in, crypto_argon2_no_extras);
  crypto_wipe(work_area.data(), work_area.size());
  return true;
}

}  // namespace

BackupService::BackupService(KeyDirectoryClient& directory,
                             KeyCache& cache,
                             BackupConfig cfg)
    : directory_(directory), cache_(cache), cfg_(cfg) {}

std::size_t BackupService::PasswordLength(const std::string& password) {
  std::size_t count = 0;
  for (const char ch : password) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

bool BackupService::SealBackup(const DeviceKey& key,
                               const std::string& password,
                               const BackupConfig& cfg,
                               std::vector<std::uint8_t>& out,
                               Error& error) {
  error.Clear();
  out.clear();
  if (PasswordLength(password) < cfg.min_password_len) {
    return Fail(error, ErrorCode::kInvalidArgument,
                "backup password must be at least " +
                    std::to_string(cfg.min_password_len) + " characters");
  }
  std::uint8_t salt[kSaltBytes];
  std::uint8_t nonce[kNonceBytes];
  if (!platform::RandomBytes(salt, sizeof(salt)) ||
      !platform::RandomBytes(nonce, sizeof(nonce))) {
    return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
  }
  std::array<std::uint8_t, kKeyBytes> wrap_key{};
  common::ScopedWipe wipe_wrap(wrap_key);
  if (!DeriveWrappingKey(password, salt, cfg.argon2_blocks, cfg.argon2_passes,
                         wrap_key, error)) {
    return false;
  }

  out.reserve(kBlobBytes);
  out.insert(out.end(), kMagic, kMagic + sizeof(kMagic));
  out.push_back(kVersion);
  PutLe(out, cfg.argon2_blocks, 4);
  PutLe(out, cfg.argon2_passes, 4);
  PutLe(out, platform::NowUnixSeconds(), 8);
  const KeyId key_id = PublicKeyId(DerivePublicKey(key));
  out.insert(out.end(), key_id.begin(), key_id.end());
  out.insert(out.end(), salt, salt + sizeof(salt));
  out.insert(out.end(), nonce, nonce + sizeof(nonce));

  std::uint8_t mac[kMacBytes];
  std::uint8_t wrapped[kKeyBytes];
  crypto_aead_lock(wrapped, mac, wrap_key.data(), nonce, out.data(),
                   kHeaderBytes, key.data(), key.size());
  out.insert(out.end(), mac, mac + sizeof(mac));
  out.insert(out.end(), wrapped, wrapped + sizeof(wrapped));
  return true;
}

bool BackupService::ReadHeader(const std::vector<std::uint8_t>& blob,
                               BackupHeader& out,
                               Error& error) {
  error.Clear();
  if (blob.size() != kBlobBytes ||
      std::memcmp(blob.data(), kMagic, sizeof(kMagic)) != 0) {
    return Fail(error, ErrorCode::kInvalidBackupPassword, "backup blob invalid");
  }
  std::size_t off = sizeof(kMagic);
  BackupHeader header;
  header.version = blob[off++];
  header.argon2_blocks = static_cast<std::uint32_t>(GetLe(&blob[off], 4));
  off += 4;
  header.argon2_passes = static_cast<std::uint32_t>(GetLe(&blob[off], 4));
  off += 4;
  header.created_at = GetLe(&blob[off], 8);
  off += 8;
  std::memcpy(header.key_id.data(), &blob[off], header.key_id.size());
  if (header.version != kVersion || header.argon2_blocks < 8 ||
      header.argon2_blocks > kMaxRestoreBlocks || header.argon2_passes == 0 ||
      header.argon2_passes > kMaxRestorePasses) {
    return Fail(error, ErrorCode::kInvalidBackupPassword,
                "backup parameters unsupported");
  }
  out = header;
  return true;
}

bool BackupService::OpenBackup(const std::vector<std::uint8_t>& blob,
                               const std::string& password,
                               DeviceKey& out,
                               BackupHeader& out_header,
                               Error& error) {
  BackupHeader header;
  if (!ReadHeader(blob, header, error)) {
    return false;
  }
  std::size_t off = kParamsBytes + kKeyIdBytes;
  const std::uint8_t* salt = &blob[off];
  off += kSaltBytes;
  const std::uint8_t* nonce = &blob[off];
  off += kNonceBytes;
  const std::uint8_t* mac = &blob[off];
  off += kMacBytes;
  const std::uint8_t* wrapped = &blob[off];

  std::array<std::uint8_t, kKeyBytes> wrap_key{};
  common::ScopedWipe wipe_wrap(wrap_key);
  if (!DeriveWrappingKey(password, salt, header.argon2_blocks,
                         header.argon2_passes, wrap_key, error)) {
    return Fail(error, ErrorCode::kInvalidBackupPassword, error.message);
  }
  DeviceKey plain{};
  if (crypto_aead_unlock(plain.data(), mac, wrap_key.data(), nonce,
                         blob.data(), kHeaderBytes, wrapped, kKeyBytes) != 0) {
    return Fail(error, ErrorCode::kInvalidBackupPassword,
                "backup password incorrect or blob corrupted");
  }
  if (PublicKeyId(DerivePublicKey(plain)) != header.key_id) {
    common::SecureWipe(plain);
    return Fail(error, ErrorCode::kInvalidBackupPassword,
                "backup key id mismatch");
  }
  out = plain;
  common::SecureWipe(plain);
  out_header = header;
  return true;
}

bool BackupService::CreateBackup(const std::string& password,
                                 std::string& out_blob_b64,
                                 Error& error) {
  error.Clear();
  out_blob_b64.clear();
  DeviceKey key{};
  common::ScopedWipe wipe_key(key);
  if (!cache_.GetOwnKey(key, error)) {
    return false;
  }
  std::vector<std::uint8_t> blob;
  if (!SealBackup(key, password, cfg_, blob, error)) {
    return false;
  }
  const std::string b64 = common::Base64Encode(blob);
  if (!directory_.UploadBackup(b64, error)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "backup uploaded",
                     {{"key_fp", common::KeyFingerprintHex(key.data(),
                                                           key.size())}});
  out_blob_b64 = b64;
  return true;
}

bool BackupService::Restore(const std::string& password, Error& error) {
  error.Clear();
  std::string blob_b64;
  bool found = false;
  if (!directory_.FetchBackup(blob_b64, found, error)) {
    return false;
  }
  if (!found) {
    return Fail(error, ErrorCode::kMissingKey, "no backup stored");
  }
  std::vector<std::uint8_t> blob;
  if (!common::Base64Decode(blob_b64, blob)) {
    return Fail(error, ErrorCode::kInvalidBackupPassword, "backup blob invalid");
  }
  DeviceKey key{};
  common::ScopedWipe wipe_key(key);
  BackupHeader header;
  if (!OpenBackup(blob, password, key, header, error)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag, "restore failed",
                       {{"reason", error.message}});
    return false;
  }
  if (!cache_.StoreOwnKey(key, error)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "device key restored",
                     {{"key_fp", common::KeyFingerprintHex(key.data(),
                                                           key.size())},
                      {"created_at", std::to_string(header.created_at)}});
  return true;
}

bool BackupService::CheckHasBackup(bool& out_has_backup, Error& error) {
  return directory_.CheckBackup(out_has_backup, error);
}

bool BackupService::BackupMatchesKey(const DeviceKey& key,
                                     bool& out_matches,
                                     Error& error) {
  error.Clear();
  out_matches = false;
  std::string blob_b64;
  bool found = false;
  if (!directory_.FetchBackup(blob_b64, found, error)) {
    return false;
  }
  if (!found) {
    return true;
  }
  std::vector<std::uint8_t> blob;
  BackupHeader header;
  Error parse_err;
  if (!common::Base64Decode(blob_b64, blob) ||
      !ReadHeader(blob, header, parse_err)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "stored backup unreadable");
    return true;
  }
  out_matches = header.key_id == PublicKeyId(DerivePublicKey(key));
  if (!out_matches) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "stored backup wraps another device key");
  }
  return true;
}

}  // namespace lipseal::client
