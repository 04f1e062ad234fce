#include "key_cache.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <system_error>
#include <thread>

#include "hex_utils.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kLogTag[] = "key_cache";

using platform::log::Level;

std::string Fingerprint(const std::array<std::uint8_t, kKeyBytes>& key) {
  return common::KeyFingerprintHex(key.data(), key.size());
}

std::size_t PrefetchWorkerCount(std::size_t pending) {
  const unsigned int hc = std::thread::hardware_concurrency();
  std::size_t workers = hc == 0 ? 2 : static_cast<std::size_t>(hc);
  workers = std::min(workers, kMaxPrefetchWorkers);
  return std::max<std::size_t>(1, std::min(workers, pending));
}

}  // namespace

KeyCache::KeyCache(SecureKeyStore& store, KeyDirectoryClient& directory)
    : store_(store), directory_(directory) {}

KeyCache::~KeyCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (own_key_) {
    common::SecureWipe(*own_key_);
  }
}

bool KeyCache::HasOwnKey(bool& out_has, Error& error) {
  out_has = false;
  DeviceKey key{};
  common::ScopedWipe wipe_key(key);
  if (GetOwnKey(key, error)) {
    out_has = true;
    return true;
  }
  if (error.code == ErrorCode::kNotInitialized) {
    error.Clear();
    return true;
  }
  return false;
}

bool KeyCache::GetOwnKey(DeviceKey& out, Error& error) {
  error.Clear();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (own_key_) {
      out = *own_key_;
      return true;
    }
  }
  std::vector<std::uint8_t> bytes;
  bool found = false;
  if (!store_.Get(kDeviceKeyName, bytes, found, error)) {
    return false;
  }
  common::ScopedWipe wipe_bytes(bytes);
  if (!found) {
    return Fail(error, ErrorCode::kNotInitialized, "no device key");
  }
  if (!DeviceKeyFromBytes(bytes, out, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  own_key_ = out;
  return true;
}

bool KeyCache::StoreOwnKey(const DeviceKey& key, Error& error) {
  error.Clear();
  std::vector<std::uint8_t> bytes(key.begin(), key.end());
  common::ScopedWipe wipe_bytes(bytes);
  if (!store_.Set(kDeviceKeyName, bytes, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  own_key_ = key;
  return true;
}

bool KeyCache::ForgetOwnKey(Error& error) {
  error.Clear();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (own_key_) {
      common::SecureWipe(*own_key_);
      own_key_.reset();
    }
  }
  return store_.Delete(kDeviceKeyName, error);
}

void KeyCache::LoadPersistedPeer(const std::string& user_id,
                                 PublicKey& out,
                                 bool& found) {
  found = false;
  std::vector<std::uint8_t> bytes;
  Error err;
  if (!store_.Get(PeerKeyName(user_id), bytes, found, err)) {
    platform::log::Log(Level::kWarn, kLogTag, "persisted peer key unreadable",
                       {{"user", user_id}, {"error", err.message}});
    found = false;
    return;
  }
  if (!found) {
    return;
  }
  if (bytes.size() != out.size()) {
    platform::log::Log(Level::kWarn, kLogTag, "persisted peer key invalid",
                       {{"user", user_id}});
    found = false;
    return;
  }
  std::memcpy(out.data(), bytes.data(), out.size());
}

void KeyCache::RememberPeer(const std::string& user_id, const PublicKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_[user_id] = key;
  failed_.erase(user_id);
}

bool KeyCache::FetchAndRecord(const std::string& user_id,
                              PublicKey& out,
                              Error& error) {
  if (!directory_.Fetch(user_id, out, error)) {
    if (error.code == ErrorCode::kPeerKeyNotFound) {
      std::lock_guard<std::mutex> lock(mutex_);
      failed_.insert(user_id);
      platform::log::Log(Level::kInfo, kLogTag, "peer has no published key",
                         {{"user", user_id}});
    }
    return false;
  }
  RememberPeer(user_id, out);

  Error store_err;
  const std::vector<std::uint8_t> bytes(out.begin(), out.end());
  if (!store_.Set(PeerKeyName(user_id), bytes, store_err)) {
    platform::log::Log(Level::kWarn, kLogTag, "persist peer key failed",
                       {{"user", user_id}, {"error", store_err.message}});
  }
  platform::log::Log(Level::kDebug, kLogTag, "peer key fetched",
                     {{"user", user_id}, {"key_fp", Fingerprint(out)}});
  return true;
}

bool KeyCache::GetPeerKey(const std::string& user_id,
                          PublicKey& out,
                          Error& error,
                          bool force_refresh) {
  error.Clear();
  if (user_id.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "user id empty");
  }
  if (!force_refresh) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto it = peers_.find(user_id);
      if (it != peers_.end()) {
        out = it->second;
        return true;
      }
      if (failed_.count(user_id) != 0) {
        return Fail(error, ErrorCode::kPeerKeyNotFound,
                    "no published key for " + user_id + " (cached)");
      }
    }
    bool found = false;
    LoadPersistedPeer(user_id, out, found);
    if (found) {
      RememberPeer(user_id, out);
      return true;
    }
  }
  return FetchAndRecord(user_id, out, error);
}

bool KeyCache::Prefetch(const std::vector<std::string>& user_ids,
                        PrefetchSummary& out,
                        Error& error) {
  error.Clear();
  out = PrefetchSummary{};

  std::vector<std::string> pending;
  std::unordered_set<std::string> seen;
  for (const auto& id : user_ids) {
    if (id.empty() || !seen.insert(id).second) {
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (peers_.count(id) != 0) {
        ++out.already_cached;
        continue;
      }
      if (failed_.count(id) != 0) {
        ++out.skipped_failed;
        continue;
      }
    }
    PublicKey key{};
    bool found = false;
    LoadPersistedPeer(id, key, found);
    if (found) {
      RememberPeer(id, key);
      ++out.already_cached;
      continue;
    }
    pending.push_back(id);
  }
  if (pending.empty()) {
    return true;
  }

  std::string token;
  if (!directory_.RequireToken(token, error)) {
    return false;
  }
  common::SecureWipe(token);

  std::vector<ErrorCode> results(pending.size(), ErrorCode::kNone);
  std::atomic<std::size_t> next{0};
  const auto drain = [this, &pending, &results, &next]() {
    for (std::size_t i = next.fetch_add(1); i < pending.size();
         i = next.fetch_add(1)) {
      PublicKey key{};
      Error err;
      if (!FetchAndRecord(pending[i], key, err)) {
        results[i] = err.code;
      }
    }
  };

  // The calling thread is one of the workers, so every id is processed even
  // when no extra thread can be started.
  const std::size_t extra = PrefetchWorkerCount(pending.size()) - 1;
  std::vector<std::thread> workers;
  workers.reserve(extra);
  for (std::size_t i = 0; i < extra; ++i) {
    try {
      workers.emplace_back(drain);
    } catch (const std::system_error& e) {
      platform::log::Log(Level::kWarn, kLogTag, "prefetch worker not started",
                         {{"error", e.what()}});
      break;
    }
  }
  drain();
  for (auto& worker : workers) {
    worker.join();
  }

  for (const ErrorCode code : results) {
    if (code == ErrorCode::kNone) {
      ++out.fetched;
    } else if (code == ErrorCode::kPeerKeyNotFound) {
      ++out.not_found;
    } else {
      ++out.transient_failures;
    }
  }
  platform::log::Log(Level::kInfo, kLogTag, "prefetch done",
                     {{"fetched", std::to_string(out.fetched)},
                      {"not_found", std::to_string(out.not_found)},
                      {"failed", std::to_string(out.transient_failures)}});
  return true;
}

void KeyCache::ClearFailedMarkers() {
  std::lock_guard<std::mutex> lock(mutex_);
  failed_.clear();
}

bool KeyCache::HasFailedMarker(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_.count(user_id) != 0;
}

bool KeyCache::IsPeerCached(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.count(user_id) != 0;
}

void KeyCache::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (own_key_) {
    common::SecureWipe(*own_key_);
    own_key_.reset();
  }
  peers_.clear();
  failed_.clear();
}

bool KeyCache::ClearPeer(const std::string& user_id, Error& error) {
  error.Clear();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.erase(user_id);
    failed_.erase(user_id);
  }
  return store_.Delete(PeerKeyName(user_id), error);
}

}  // namespace lipseal::client
