#ifndef LIPSEAL_NOTIFICATION_DECRYPTOR_H
#define LIPSEAL_NOTIFICATION_DECRYPTOR_H

#include <cstddef>
#include <string>

#include "e2ee_error.h"
#include "key_directory.h"

namespace lipseal::client {

struct PushMessageData {
  std::string type;  // "message" for chat pushes
  std::string conversation_id;
  std::string message_id;
  std::string sender_id;
  std::string sender_name;
  std::string message_type;  // only "text" carries a decryptable preview
  bool is_group{false};
  std::string title;              // push title, used for group chats
  std::string encrypted_content;  // envelope text
  bool decrypted{false};
};

struct DecryptedNotification {
  std::string title;
  std::string body;
  std::string conversation_id;
  std::string message_id;
};

inline constexpr std::size_t kPreviewMaxChars = 100;

class E2eeClient;

// Replaces the body of an encrypted chat push with a plaintext preview.
// With a client, the preview is opened with the content key shared with
// sender_id, the same key EncryptMessageTo seals under. Without a client, or
// for pushes with no sender, the per-message key served by the directory is
// used; that key is escrowed by the messaging service, not by this library.
class NotificationDecryptor {
 public:
  explicit NotificationDecryptor(KeyDirectoryClient& directory,
                                 E2eeClient* client = nullptr);

  static bool NeedsDecryption(const PushMessageData& data);
  // Cuts at max_chars code points and appends "..." when shortened.
  static std::string FormatPreview(const std::string& text,
                                   std::size_t max_chars = kPreviewMaxChars);

  bool Decrypt(const PushMessageData& data,
               DecryptedNotification& out,
               Error& error);

 private:
  bool DecryptWithMessageKey(const PushMessageData& data,
                             std::string& out,
                             Error& error);

  KeyDirectoryClient& directory_;
  E2eeClient* client_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_NOTIFICATION_DECRYPTOR_H
