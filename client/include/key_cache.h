#ifndef LIPSEAL_KEY_CACHE_H
#define LIPSEAL_KEY_CACHE_H

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "e2ee_error.h"
#include "key_agreement.h"
#include "key_directory.h"
#include "secure_key_store.h"

namespace lipseal::client {

// Upper bound on concurrent directory fetches during Prefetch.
inline constexpr std::size_t kMaxPrefetchWorkers = 8;

struct PrefetchSummary {
  std::size_t fetched{0};
  std::size_t already_cached{0};
  std::size_t skipped_failed{0};
  std::size_t not_found{0};
  std::size_t transient_failures{0};
};

// Three-tier lookup for key material: memory, the secure key store, then the
// directory. Users whose last lookup returned NotFound carry a failed-fetch
// marker and are not looked up again until the marker is cleared, a forced
// refresh is requested, or a later fetch succeeds.
class KeyCache {
 public:
  KeyCache(SecureKeyStore& store, KeyDirectoryClient& directory);
  ~KeyCache();

  KeyCache(const KeyCache&) = delete;
  KeyCache& operator=(const KeyCache&) = delete;

  bool HasOwnKey(bool& out_has, Error& error);
  // kNotInitialized when no device key exists locally.
  bool GetOwnKey(DeviceKey& out, Error& error);
  bool StoreOwnKey(const DeviceKey& key, Error& error);
  bool ForgetOwnKey(Error& error);

  bool GetPeerKey(const std::string& user_id,
                  PublicKey& out,
                  Error& error,
                  bool force_refresh = false);

  // Fetches every id that is neither cached nor marked on a small worker pool
  // that includes the calling thread. Per-id failures are tallied in out,
  // never returned; false only when the session has no credential
  // (kNotAuthenticated).
  bool Prefetch(const std::vector<std::string>& user_ids,
                PrefetchSummary& out,
                Error& error);

  void ClearFailedMarkers();
  bool HasFailedMarker(const std::string& user_id) const;
  bool IsPeerCached(const std::string& user_id) const;

  // Drops memory state and markers; persisted peer keys survive.
  void Reset();
  // Drops every trace of one peer, including the persisted copy.
  bool ClearPeer(const std::string& user_id, Error& error);

 private:
  // Store faults are logged and reported as not found.
  void LoadPersistedPeer(const std::string& user_id,
                         PublicKey& out,
                         bool& found);
  bool FetchAndRecord(const std::string& user_id,
                      PublicKey& out,
                      Error& error);
  void RememberPeer(const std::string& user_id, const PublicKey& key);

  SecureKeyStore& store_;
  KeyDirectoryClient& directory_;

  mutable std::mutex mutex_;
  std::optional<DeviceKey> own_key_;
  std::unordered_map<std::string, PublicKey> peers_;
  std::unordered_set<std::string> failed_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_KEY_CACHE_H
