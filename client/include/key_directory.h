#ifndef LIPSEAL_KEY_DIRECTORY_H
#define LIPSEAL_KEY_DIRECTORY_H

#include <array>
#include <cstdint>
#include <string>

#include "e2ee_error.h"

namespace lipseal::client {

using PublicKey = std::array<std::uint8_t, 32>;

class AuthProvider {
 public:
  virtual ~AuthProvider() = default;

  // Returns false when no session credential is available.
  virtual bool GetToken(std::string& out_token) = 0;
};

struct TransportResponse {
  // HTTP status; 0 when the request never reached the server.
  int status{0};
  std::string body;
  std::string error;
};

// One call per directory endpoint. Implementations perform the HTTP request
// with "Authorization: Bearer <token>" and report the raw outcome.
class DirectoryTransport {
 public:
  virtual ~DirectoryTransport() = default;

  // POST /keys/upload  body: base64 public key
  virtual TransportResponse UploadKey(const std::string& token,
                                      const std::string& public_key_b64) = 0;
  // GET /keys/{userId}  body: base64 public key
  virtual TransportResponse FetchKey(const std::string& token,
                                     const std::string& user_id) = 0;
  // GET /keys/backup/check  body: "true" or "false"
  virtual TransportResponse CheckBackup(const std::string& token) = 0;
  // POST /keys/backup  body: base64 backup blob
  virtual TransportResponse UploadBackup(const std::string& token,
                                         const std::string& blob_b64) = 0;
  // GET /keys/backup  body: base64 backup blob
  virtual TransportResponse FetchBackup(const std::string& token) = 0;
  // GET /messages/{conversationId}/{messageId}/decrypt-key
  virtual TransportResponse FetchMessageKey(const std::string& token,
                                            const std::string& conversation_id,
                                            const std::string& message_id) = 0;
};

class KeyDirectoryClient {
 public:
  KeyDirectoryClient(DirectoryTransport& transport, AuthProvider& auth);

  // Idempotent.
  bool Publish(const PublicKey& own_public_key, Error& error);
  bool Fetch(const std::string& user_id, PublicKey& out, Error& error);

  // Fails with kNotAuthenticated when no credential is available.
  bool RequireToken(std::string& out_token, Error& error);

  bool CheckBackup(bool& out_has_backup, Error& error);
  bool UploadBackup(const std::string& blob_b64, Error& error);
  // A 404 is reported as found = false with a true return.
  bool FetchBackup(std::string& out_blob_b64, bool& found, Error& error);
  bool FetchMessageKey(const std::string& conversation_id,
                       const std::string& message_id,
                       std::array<std::uint8_t, 32>& out_key,
                       Error& error);

 private:
  DirectoryTransport& transport_;
  AuthProvider& auth_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_KEY_DIRECTORY_H
