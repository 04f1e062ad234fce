#include "loopback_directory.h"

#include <utility>

namespace lipseal::client {

namespace {

TransportResponse Respond(int status, std::string body = {},
                          std::string error = {}) {
  TransportResponse resp;
  resp.status = status;
  resp.body = std::move(body);
  resp.error = std::move(error);
  return resp;
}

TransportResponse Unauthorized() {
  return Respond(401, {}, "unauthorized");
}

std::string MessageKeyId(const std::string& conversation_id,
                         const std::string& message_id) {
  return conversation_id + "/" + message_id;
}

}  // namespace

void LoopbackDirectory::RegisterSession(const std::string& token,
                                        const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_[token] = user_id;
}

void LoopbackDirectory::SetMessageKey(const std::string& conversation_id,
                                      const std::string& message_id,
                                      const std::string& key_b64) {
  std::lock_guard<std::mutex> lock(mutex_);
  message_keys_[MessageKeyId(conversation_id, message_id)] = key_b64;
}

bool LoopbackDirectory::HasBackupFor(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return backups_.count(user_id) != 0;
}

bool LoopbackDirectory::HasKeyFor(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.count(user_id) != 0;
}

void LoopbackDirectory::DropBackup(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  backups_.erase(user_id);
}

void LoopbackDirectory::DropKey(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(user_id);
}

bool LoopbackDirectory::UserFor(const std::string& token,
                                std::string& out_user) const {
  const auto it = sessions_.find(token);
  if (it == sessions_.end()) {
    return false;
  }
  out_user = it->second;
  return true;
}

TransportResponse LoopbackDirectory::UploadKey(
    const std::string& token, const std::string& public_key_b64) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string user;
  if (!UserFor(token, user)) {
    return Unauthorized();
  }
  if (public_key_b64.empty()) {
    return Respond(400, {}, "public key missing");
  }
  keys_[user] = public_key_b64;
  return Respond(200);
}

TransportResponse LoopbackDirectory::FetchKey(const std::string& token,
                                              const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string caller;
  if (!UserFor(token, caller)) {
    return Unauthorized();
  }
  const auto it = keys_.find(user_id);
  if (it == keys_.end()) {
    return Respond(404, {}, "key not found");
  }
  return Respond(200, it->second);
}

TransportResponse LoopbackDirectory::CheckBackup(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string user;
  if (!UserFor(token, user)) {
    return Unauthorized();
  }
  return Respond(200, backups_.count(user) != 0 ? "true" : "false");
}

TransportResponse LoopbackDirectory::UploadBackup(const std::string& token,
                                                  const std::string& blob_b64) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string user;
  if (!UserFor(token, user)) {
    return Unauthorized();
  }
  if (blob_b64.empty()) {
    return Respond(400, {}, "backup missing");
  }
  backups_[user] = blob_b64;
  return Respond(200);
}

TransportResponse LoopbackDirectory::FetchBackup(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string user;
  if (!UserFor(token, user)) {
    return Unauthorized();
  }
  const auto it = backups_.find(user);
  if (it == backups_.end()) {
    return Respond(404, {}, "backup not found");
  }
  return Respond(200, it->second);
}

TransportResponse LoopbackDirectory::FetchMessageKey(
    const std::string& token,
    const std::string& conversation_id,
    const std::string& message_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string user;
  if (!UserFor(token, user)) {
    return Unauthorized();
  }
  const auto it = message_keys_.find(MessageKeyId(conversation_id, message_id));
  if (it == message_keys_.end()) {
    return Respond(404, {}, "message key not found");
  }
  return Respond(200, it->second);
}

}  // namespace lipseal::client
