#include "notification_decryptor.h"

#include "e2ee_client.h"
#include "message_cipher.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kLogTag[] = "notify";

}  // namespace

NotificationDecryptor::NotificationDecryptor(KeyDirectoryClient& directory,
                                             E2eeClient* client)
    : directory_(directory), client_(client) {}

bool NotificationDecryptor::NeedsDecryption(const PushMessageData& data) {
  return data.type == "message" && data.message_type == "text" &&
         !data.encrypted_content.empty() && !data.decrypted;
}

std::string NotificationDecryptor::FormatPreview(const std::string& text,
                                                 std::size_t max_chars) {
  std::size_t chars = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    if (chars == max_chars) {
      return text.substr(0, i) + "...";
    }
    const unsigned char lead = static_cast<unsigned char>(text[i]);
    std::size_t len = 1;
    if ((lead & 0xE0) == 0xC0) {
      len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
    }
    i += len;
    ++chars;
  }
  return text;
}

bool NotificationDecryptor::Decrypt(const PushMessageData& data,
                                    DecryptedNotification& out,
                                    Error& error) {
  error.Clear();
  out = DecryptedNotification{};
  if (!NeedsDecryption(data)) {
    return Fail(error, ErrorCode::kInvalidArgument,
                "notification carries no encrypted text");
  }
  std::string plain;
  if (client_ && !data.sender_id.empty()) {
    if (!client_->DecryptMessageFrom(data.sender_id, data.encrypted_content,
                                     plain, error)) {
      platform::log::Log(platform::log::Level::kWarn, kLogTag,
                         "push preview not decryptable",
                         {{"message_id", data.message_id},
                          {"error", ErrorCodeName(error.code)}});
      return false;
    }
  } else if (!DecryptWithMessageKey(data, plain, error)) {
    return false;
  }
  out.title = data.is_group
                  ? (data.title.empty() ? std::string("Group Chat") : data.title)
                  : data.sender_name;
  out.body = FormatPreview(plain);
  common::SecureWipe(plain);
  out.conversation_id = data.conversation_id;
  out.message_id = data.message_id;
  return true;
}

bool NotificationDecryptor::DecryptWithMessageKey(const PushMessageData& data,
                                                  std::string& out,
                                                  Error& error) {
  EncryptedEnvelope envelope;
  if (!MessageCipher::DecodeEnvelope(data.encrypted_content, envelope, error)) {
    return false;
  }
  ContentKey key{};
  common::ScopedWipe wipe_key(key);
  if (!directory_.FetchMessageKey(data.conversation_id, data.message_id, key,
                                  error)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "message key unavailable",
                       {{"message_id", data.message_id},
                        {"error", ErrorCodeName(error.code)}});
    return false;
  }
  return MessageCipher::Decrypt(envelope, key, out, error);
}

}  // namespace lipseal::client
