#include "secure_key_store.h"

#include <system_error>
#include <utility>

#include "hex_utils.h"
#include "monocypher.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "secure_buffer.h"
#include "secure_store_util.h"

namespace lipseal::client {

namespace {

constexpr char kStoreMagic[] = "LIPSEAL_KEY_V1";
constexpr char kStoreEntropy[] = "lipseal_secure_key_store";
constexpr char kLogTag[] = "key_store";
constexpr char kFileNameLabel[] = "lipseal/key-store-name/v1";
constexpr std::size_t kMaxNameBytes = 1024;

bool ValidName(const std::string& name) {
  return !name.empty() && name.size() <= kMaxNameBytes;
}

}  // namespace

std::string PeerKeyName(const std::string& user_id) {
  return std::string(kPeerKeyPrefix) + user_id;
}

FileSecureKeyStore::FileSecureKeyStore(std::filesystem::path dir,
                                       bool wrap_values)
    : dir_(std::move(dir)), wrap_values_(wrap_values) {}

std::filesystem::path FileSecureKeyStore::PathFor(
    const std::string& name) const {
  // Fixed-length file names whatever the length of the entry name.
  std::uint8_t digest[32];
  crypto_blake2b_ctx ctx;
  crypto_blake2b_init(&ctx, sizeof(digest));
  crypto_blake2b_update(&ctx,
                        reinterpret_cast<const std::uint8_t*>(kFileNameLabel),
                        sizeof(kFileNameLabel) - 1);
  crypto_blake2b_update(&ctx,
                        reinterpret_cast<const std::uint8_t*>(name.data()),
                        name.size());
  crypto_blake2b_final(&ctx, digest);
  return dir_ / (common::BytesToHex(digest, sizeof(digest)) + ".key");
}

bool FileSecureKeyStore::EnsureDir(Error& error) {
  std::error_code ec;
  if (platform::fs::Exists(dir_, ec)) {
    return true;
  }
  if (!platform::fs::CreateDirectories(dir_, ec)) {
    return Fail(error, ErrorCode::kStorageUnavailable,
                "create state dir failed: " + ec.message());
  }
  return true;
}

bool FileSecureKeyStore::Get(const std::string& name,
                             std::vector<std::uint8_t>& out,
                             bool& found,
                             Error& error) {
  error.Clear();
  out.clear();
  found = false;
  if (!ValidName(name)) {
    return Fail(error, ErrorCode::kInvalidArgument, "key name invalid");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto path = PathFor(name);
  std::error_code ec;
  std::vector<std::uint8_t> raw;
  if (!platform::fs::ReadAll(path, raw, ec)) {
    if (ec == std::errc::no_such_file_or_directory) {
      return true;
    }
    return Fail(error, ErrorCode::kStorageUnavailable,
                "read failed: " + ec.message());
  }
  common::ScopedWipe wipe_raw(raw);
  bool was_wrapped = false;
  std::string err;
  if (!MaybeUnprotectSecureStore(raw, kStoreMagic, kStoreEntropy, out,
                                 was_wrapped, err)) {
    platform::log::Log(platform::log::Level::kError, kLogTag,
                       "unwrap failed", {{"name", name}, {"error", err}});
    return Fail(error, ErrorCode::kStorageUnavailable, "unwrap failed: " + err);
  }
  if (out.empty()) {
    return Fail(error, ErrorCode::kStorageUnavailable, "stored value empty");
  }
  if (!was_wrapped && wrap_values_) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "stored value is not wrapped", {{"name", name}});
  }
  found = true;
  return true;
}

bool FileSecureKeyStore::Set(const std::string& name,
                             const std::vector<std::uint8_t>& value,
                             Error& error) {
  error.Clear();
  if (!ValidName(name)) {
    return Fail(error, ErrorCode::kInvalidArgument, "key name invalid");
  }
  if (value.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "value empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!EnsureDir(error)) {
    return false;
  }
  std::vector<std::uint8_t> payload;
  if (wrap_values_) {
    std::string err;
    if (!ProtectSecureStore(value, kStoreMagic, kStoreEntropy, payload, err)) {
      return Fail(error, ErrorCode::kStorageUnavailable, "wrap failed: " + err);
    }
  } else {
    payload = value;
  }
  common::ScopedWipe wipe_payload(payload);
  std::error_code ec;
  if (!platform::fs::AtomicWrite(PathFor(name), payload.data(), payload.size(),
                                 ec)) {
    return Fail(error, ErrorCode::kStorageUnavailable,
                "write failed: " + ec.message());
  }
  return true;
}

bool FileSecureKeyStore::Delete(const std::string& name, Error& error) {
  error.Clear();
  if (!ValidName(name)) {
    return Fail(error, ErrorCode::kInvalidArgument, "key name invalid");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  platform::fs::Remove(PathFor(name), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return Fail(error, ErrorCode::kStorageUnavailable,
                "delete failed: " + ec.message());
  }
  return true;
}

}  // namespace lipseal::client
