#ifndef LIPSEAL_LOOPBACK_DIRECTORY_H
#define LIPSEAL_LOOPBACK_DIRECTORY_H

#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "key_directory.h"

namespace lipseal::client {

// In-process directory service. Sessions map bearer tokens to user ids; an
// unknown token answers 401.
class LoopbackDirectory : public DirectoryTransport {
 public:
  void RegisterSession(const std::string& token, const std::string& user_id);
  void SetMessageKey(const std::string& conversation_id,
                     const std::string& message_id,
                     const std::string& key_b64);
  bool HasBackupFor(const std::string& user_id) const;
  bool HasKeyFor(const std::string& user_id) const;
  void DropBackup(const std::string& user_id);
  void DropKey(const std::string& user_id);

  TransportResponse UploadKey(const std::string& token,
                              const std::string& public_key_b64) override;
  TransportResponse FetchKey(const std::string& token,
                             const std::string& user_id) override;
  TransportResponse CheckBackup(const std::string& token) override;
  TransportResponse UploadBackup(const std::string& token,
                                 const std::string& blob_b64) override;
  TransportResponse FetchBackup(const std::string& token) override;
  TransportResponse FetchMessageKey(const std::string& token,
                                    const std::string& conversation_id,
                                    const std::string& message_id) override;

 private:
  bool UserFor(const std::string& token, std::string& out_user) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> sessions_;
  std::unordered_map<std::string, std::string> keys_;
  std::unordered_map<std::string, std::string> backups_;
  std::unordered_map<std::string, std::string> message_keys_;
};

class StaticTokenAuth final : public AuthProvider {
 public:
  explicit StaticTokenAuth(std::string token) : token_(std::move(token)) {}

  bool GetToken(std::string& out_token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_.empty()) {
      return false;
    }
    out_token = token_;
    return true;
  }

  void SetToken(std::string token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = std::move(token);
  }

 private:
  std::mutex mutex_;
  std::string token_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_LOOPBACK_DIRECTORY_H
