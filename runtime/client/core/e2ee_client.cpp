#include "e2ee_client.h"

#include <set>
#include <string>
#include <utility>

#include "file_key_wrap.h"
#include "message_cipher.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kLogTag[] = "e2ee";

// Decrypting without the sender's key is reported as a missing key.
bool DecryptKeyFailure(Error& error) {
  if (error.code == ErrorCode::kPeerKeyNotFound) {
    error.code = ErrorCode::kMissingKey;
  }
  return false;
}

}  // namespace

E2eeClient::E2eeClient(E2eeConfig cfg,
                       DirectoryTransport& transport,
                       AuthProvider& auth,
                       LifecyclePrompter* prompter,
                       std::unique_ptr<SecureKeyStore> store)
    : cfg_(std::move(cfg)),
      store_(std::move(store)),
      file_cipher_(cfg_.files) {
  platform::log::SetMinLevel(cfg_.log_level);
  if (!store_) {
    store_ = std::make_unique<FileSecureKeyStore>(cfg_.state_dir,
                                                  cfg_.wrap_secure_store);
  }
  directory_ = std::make_unique<KeyDirectoryClient>(transport, auth);
  cache_ = std::make_unique<KeyCache>(*store_, *directory_);
  backup_ = std::make_unique<BackupService>(*directory_, *cache_, cfg_.backup);
  lifecycle_ = std::make_unique<KeyLifecycleManager>(
      *cache_, *directory_, *backup_, prompter, cfg_.backup);
}

E2eeClient::~E2eeClient() {
  lifecycle_.reset();
  backup_.reset();
  cache_.reset();
}

bool E2eeClient::Start(Error& error) {
  if (!lifecycle_->Start(error)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "encryption not ready",
                       {{"state", LifecycleStateName(lifecycle_->state())},
                        {"error", ErrorCodeName(error.code)}});
    return false;
  }
  return true;
}

void E2eeClient::Shutdown() {
  lifecycle_->Reset();
  cache_->Reset();
}

bool E2eeClient::PrefetchPeerKeys(const std::vector<std::string>& user_ids,
                                  PrefetchSummary& out,
                                  Error& error) {
  return cache_->Prefetch(user_ids, out, error);
}

bool E2eeClient::OwnPublicKey(PublicKey& out, Error& error) {
  DeviceKey key{};
  common::ScopedWipe wipe_key(key);
  if (!cache_->GetOwnKey(key, error)) {
    return false;
  }
  out = DerivePublicKey(key);
  return true;
}

bool E2eeClient::ResolveContentKey(const std::string& peer_id,
                                   bool refresh_peer,
                                   ContentKey& out,
                                   Error& error,
                                   PublicKey* out_peer) {
  error.Clear();
  if (!lifecycle_->IsReady()) {
    return Fail(error, ErrorCode::kEncryptionNotReady,
                "encryption keys not initialized");
  }
  DeviceKey own{};
  common::ScopedWipe wipe_own(own);
  if (!cache_->GetOwnKey(own, error)) {
    return false;
  }
  PublicKey peer{};
  if (!cache_->GetPeerKey(peer_id, peer, error, refresh_peer)) {
    if (!refresh_peer || error.code != ErrorCode::kTransientNetworkFailure) {
      return false;
    }
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "peer key refresh failed, using cached key",
                       {{"user", peer_id}});
    if (!cache_->GetPeerKey(peer_id, peer, error, false)) {
      return false;
    }
  }
  if (out_peer) {
    *out_peer = peer;
  }
  return DeriveContentKey(own, peer, out, error);
}

bool E2eeClient::ResolveFileKey(const std::string& sender_id,
                                const EncryptedFile& file,
                                ContentKey& out,
                                Error& error) {
  if (!ResolveContentKey(sender_id, true, out, error)) {
    return DecryptKeyFailure(error);
  }
  if (file.recipient_keys.empty()) {
    return true;
  }
  ContentKey shared = out;
  common::ScopedWipe wipe_shared(shared);
  PublicKey own_public{};
  if (!OwnPublicKey(own_public, error)) {
    return false;
  }
  const RecipientKey* entry = FindRecipientKey(file.recipient_keys, own_public);
  if (!entry) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "file has no key for this device",
                       {{"sender", sender_id}});
    return Fail(error, ErrorCode::kMissingKey, "file not shared with this key");
  }
  return UnwrapFileKey(*entry, shared, out, error);
}

bool E2eeClient::EncryptMessageTo(const std::string& peer_id,
                                  const std::string& plaintext,
                                  std::string& out_envelope,
                                  Error& error) {
  out_envelope.clear();
  ContentKey key{};
  common::ScopedWipe wipe_key(key);
  if (!ResolveContentKey(peer_id, false, key, error)) {
    return false;
  }
  EncryptedEnvelope envelope;
  if (!MessageCipher::Encrypt(key, plaintext, envelope, error)) {
    return false;
  }
  out_envelope = MessageCipher::EncodeEnvelope(envelope);
  return true;
}

bool E2eeClient::DecryptMessageFrom(const std::string& peer_id,
                                    const std::string& envelope,
                                    std::string& out_plaintext,
                                    Error& error) {
  out_plaintext.clear();
  EncryptedEnvelope parsed;
  if (!MessageCipher::DecodeEnvelope(envelope, parsed, error)) {
    return false;
  }
  ContentKey key{};
  common::ScopedWipe wipe_key(key);
  if (!ResolveContentKey(peer_id, false, key, error)) {
    return DecryptKeyFailure(error);
  }
  return MessageCipher::Decrypt(parsed, key, out_plaintext, error);
}

bool E2eeClient::EncryptFileFor(const std::string& peer_id,
                                const std::filesystem::path& input,
                                const std::string& file_name,
                                EncryptedFile& out,
                                Error& error,
                                const ProgressCallback& on_progress,
                                const CancellationToken* cancel) {
  ContentKey key{};
  common::ScopedWipe wipe_key(key);
  if (!ResolveContentKey(peer_id, true, key, error)) {
    return false;
  }
  return file_cipher_.EncryptFile(key, input, file_name, out, error,
                                  on_progress, cancel);
}

bool E2eeClient::EncryptFileForRecipients(
    const std::vector<std::string>& recipient_ids,
    const std::filesystem::path& input,
    const std::string& file_name,
    EncryptedFile& out,
    Error& error,
    const ProgressCallback& on_progress,
    const CancellationToken* cancel) {
  error.Clear();
  out = EncryptedFile{};
  if (recipient_ids.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "no recipients");
  }
  if (!lifecycle_->IsReady()) {
    return Fail(error, ErrorCode::kEncryptionNotReady,
                "encryption keys not initialized");
  }
  ContentKey file_key{};
  common::ScopedWipe wipe_file_key(file_key);
  if (!GenerateFileKey(file_key, error)) {
    return false;
  }

  std::vector<RecipientKey> wraps;
  std::set<std::string> seen;
  for (const auto& id : recipient_ids) {
    if (!seen.insert(id).second) {
      continue;
    }
    ContentKey shared{};
    common::ScopedWipe wipe_shared(shared);
    PublicKey peer{};
    if (!ResolveContentKey(id, true, shared, error, &peer)) {
      platform::log::Log(platform::log::Level::kWarn, kLogTag,
                         "recipient key unavailable",
                         {{"user", id}, {"error", ErrorCodeName(error.code)}});
      return false;
    }
    RecipientKey wrap;
    if (!WrapFileKey(file_key, shared, id, peer, wrap, error)) {
      return false;
    }
    wraps.push_back(std::move(wrap));
  }

  if (!file_cipher_.EncryptFile(file_key, input, file_name, out, error,
                                on_progress, cancel)) {
    return false;
  }
  out.recipient_keys = std::move(wraps);
  platform::log::Log(platform::log::Level::kInfo, kLogTag,
                     "file sealed for recipients",
                     {{"recipients", std::to_string(out.recipient_keys.size())}});
  return true;
}

bool E2eeClient::DecryptFileFrom(const std::string& peer_id,
                                 const EncryptedFile& file,
                                 std::vector<std::uint8_t>& out,
                                 Error& error,
                                 const ProgressCallback& on_progress,
                                 const CancellationToken* cancel) {
  out.clear();
  ContentKey key{};
  common::ScopedWipe wipe_key(key);
  if (!ResolveFileKey(peer_id, file, key, error)) {
    return false;
  }
  return file_cipher_.DecryptToMemory(file, key, out, error, on_progress,
                                      cancel);
}

bool E2eeClient::DecryptFileFromTo(const std::string& peer_id,
                                   const EncryptedFile& file,
                                   const std::filesystem::path& output,
                                   Error& error,
                                   const ProgressCallback& on_progress,
                                   const CancellationToken* cancel) {
  ContentKey key{};
  common::ScopedWipe wipe_key(key);
  if (!ResolveFileKey(peer_id, file, key, error)) {
    return false;
  }
  return file_cipher_.DecryptToFile(file, key, output, error, on_progress,
                                    cancel);
}

}  // namespace lipseal::client
