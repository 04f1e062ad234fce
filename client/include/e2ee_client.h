#ifndef LIPSEAL_E2EE_CLIENT_H
#define LIPSEAL_E2EE_CLIENT_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "backup_service.h"
#include "client_config.h"
#include "e2ee_error.h"
#include "file_cipher.h"
#include "key_agreement.h"
#include "key_cache.h"
#include "key_directory.h"
#include "key_lifecycle.h"
#include "secure_key_store.h"

namespace lipseal::client {

// Owns and wires the key store, directory client, key cache, backup service
// and lifecycle manager for one signed-in user. Content operations fail with
// kEncryptionNotReady until Start() reaches a ready state.
class E2eeClient {
 public:
  // store may be null, in which case a FileSecureKeyStore under
  // cfg.state_dir is used.
  E2eeClient(E2eeConfig cfg,
             DirectoryTransport& transport,
             AuthProvider& auth,
             LifecyclePrompter* prompter,
             std::unique_ptr<SecureKeyStore> store = nullptr);
  ~E2eeClient();

  E2eeClient(const E2eeClient&) = delete;
  E2eeClient& operator=(const E2eeClient&) = delete;

  bool Start(Error& error);
  // Sign-out: drops in-memory keys and lifecycle state.
  void Shutdown();
  bool IsReady() const { return lifecycle_->IsReady(); }

  bool PrefetchPeerKeys(const std::vector<std::string>& user_ids,
                        PrefetchSummary& out,
                        Error& error);
  bool OwnPublicKey(PublicKey& out, Error& error);

  bool EncryptMessageTo(const std::string& peer_id,
                        const std::string& plaintext,
                        std::string& out_envelope,
                        Error& error);
  bool DecryptMessageFrom(const std::string& peer_id,
                          const std::string& envelope,
                          std::string& out_plaintext,
                          Error& error);

  // File operations refresh the peer key from the directory first.
  bool EncryptFileFor(const std::string& peer_id,
                      const std::filesystem::path& input,
                      const std::string& file_name,
                      EncryptedFile& out,
                      Error& error,
                      const ProgressCallback& on_progress = {},
                      const CancellationToken* cancel = nullptr);
  // Seals the file under a fresh file key and wraps that key once per
  // recipient. Include the sender's own id to keep a readable copy.
  bool EncryptFileForRecipients(const std::vector<std::string>& recipient_ids,
                                const std::filesystem::path& input,
                                const std::string& file_name,
                                EncryptedFile& out,
                                Error& error,
                                const ProgressCallback& on_progress = {},
                                const CancellationToken* cancel = nullptr);
  // peer_id is the sender. Files with recipient keys are opened through the
  // entry addressed to this device; kMissingKey when there is none.
  bool DecryptFileFrom(const std::string& peer_id,
                       const EncryptedFile& file,
                       std::vector<std::uint8_t>& out,
                       Error& error,
                       const ProgressCallback& on_progress = {},
                       const CancellationToken* cancel = nullptr);
  bool DecryptFileFromTo(const std::string& peer_id,
                         const EncryptedFile& file,
                         const std::filesystem::path& output,
                         Error& error,
                         const ProgressCallback& on_progress = {},
                         const CancellationToken* cancel = nullptr);

  const E2eeConfig& config() const { return cfg_; }
  KeyDirectoryClient& directory() { return *directory_; }
  KeyCache& key_cache() { return *cache_; }
  BackupService& backup() { return *backup_; }
  KeyLifecycleManager& lifecycle() { return *lifecycle_; }
  const FileCipher& file_cipher() const { return file_cipher_; }

 private:
  bool ResolveContentKey(const std::string& peer_id,
                         bool refresh_peer,
                         ContentKey& out,
                         Error& error,
                         PublicKey* out_peer = nullptr);
  bool ResolveFileKey(const std::string& sender_id,
                      const EncryptedFile& file,
                      ContentKey& out,
                      Error& error);

  E2eeConfig cfg_;
  std::unique_ptr<SecureKeyStore> store_;
  std::unique_ptr<KeyDirectoryClient> directory_;
  std::unique_ptr<KeyCache> cache_;
  std::unique_ptr<BackupService> backup_;
  std::unique_ptr<KeyLifecycleManager> lifecycle_;
  FileCipher file_cipher_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_E2EE_CLIENT_H
