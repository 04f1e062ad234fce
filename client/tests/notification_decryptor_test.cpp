#include <cassert>
#include <filesystem>
#include <memory>
#include <string>

#include "base64_utils.h"
#include "e2ee_client.h"
#include "key_directory.h"
#include "loopback_directory.h"
#include "message_cipher.h"
#include "notification_decryptor.h"
#include "test_fakes.h"

using lipseal::client::ContentKey;
using lipseal::client::DecryptedNotification;
using lipseal::client::E2eeClient;
using lipseal::client::E2eeConfig;
using lipseal::client::EncryptedEnvelope;
using lipseal::client::Error;
using lipseal::client::ErrorCode;
using lipseal::client::KeyDirectoryClient;
using lipseal::client::LoopbackDirectory;
using lipseal::client::MessageCipher;
using lipseal::client::NotificationDecryptor;
using lipseal::client::PushMessageData;
using lipseal::client::StaticTokenAuth;
using lipseal::test::MemoryKeyStore;

namespace {

std::string Seal(const ContentKey& key, const std::string& text) {
  EncryptedEnvelope env;
  Error err;
  assert(MessageCipher::Encrypt(key, text, env, err));
  return MessageCipher::EncodeEnvelope(env);
}

PushMessageData TextPush(const std::string& envelope) {
  PushMessageData data;
  data.type = "message";
  data.conversation_id = "conv-1";
  data.message_id = "msg-1";
  data.sender_id = "bob";
  data.sender_name = "Bob";
  data.message_type = "text";
  data.title = "Weekend plans";
  data.encrypted_content = envelope;
  return data;
}

E2eeConfig ClientConfig(const std::filesystem::path& state_dir) {
  E2eeConfig cfg;
  cfg.state_dir = state_dir.string();
  cfg.wrap_secure_store = false;
  return cfg;
}

}  // namespace

int main() {
  {
    PushMessageData data = TextPush("{}");
    assert(NotificationDecryptor::NeedsDecryption(data));
    data.decrypted = true;
    assert(!NotificationDecryptor::NeedsDecryption(data));
    data = TextPush("{}");
    data.message_type = "image";
    assert(!NotificationDecryptor::NeedsDecryption(data));
    data = TextPush("{}");
    data.type = "call";
    assert(!NotificationDecryptor::NeedsDecryption(data));
    data = TextPush("");
    assert(!NotificationDecryptor::NeedsDecryption(data));
  }

  {
    const std::string exact(100, 'a');
    assert(NotificationDecryptor::FormatPreview(exact) == exact);
    const std::string longer(101, 'b');
    assert(NotificationDecryptor::FormatPreview(longer) ==
           std::string(100, 'b') + "...");
    assert(NotificationDecryptor::FormatPreview("") == "");

    std::string accents;
    for (int i = 0; i < 101; ++i) {
      accents += "\xC3\xA9";
    }
    const std::string preview = NotificationDecryptor::FormatPreview(accents);
    assert(preview.size() == 200 + 3);
    assert(preview.substr(0, 200) == accents.substr(0, 200));
    assert(NotificationDecryptor::FormatPreview("hello world", 5) ==
           "hello...");
  }

  LoopbackDirectory dir;
  dir.RegisterSession("tok-alice", "alice");
  StaticTokenAuth auth("tok-alice");
  KeyDirectoryClient directory(dir, auth);
  NotificationDecryptor decryptor(directory);

  const ContentKey key = lipseal::test::MakeKey(42);
  dir.SetMessageKey("conv-1", "msg-1",
                    lipseal::common::Base64Encode(key.data(), key.size()));

  {
    const PushMessageData data = TextPush(Seal(key, "see you at noon"));
    DecryptedNotification out;
    Error err;
    assert(decryptor.Decrypt(data, out, err));
    assert(out.title == "Bob");
    assert(out.body == "see you at noon");
    assert(out.conversation_id == "conv-1");
    assert(out.message_id == "msg-1");
  }

  {
    PushMessageData data = TextPush(Seal(key, std::string(150, 'x')));
    data.is_group = true;
    DecryptedNotification out;
    Error err;
    assert(decryptor.Decrypt(data, out, err));
    assert(out.title == "Weekend plans");
    assert(out.body == std::string(100, 'x') + "...");

    data.title.clear();
    assert(decryptor.Decrypt(data, out, err));
    assert(out.title == "Group Chat");
  }

  {
    PushMessageData data = TextPush(Seal(key, "lost"));
    data.message_id = "msg-unknown";
    DecryptedNotification out;
    Error err;
    assert(!decryptor.Decrypt(data, out, err));
    assert(err.code == ErrorCode::kMissingKey);
    assert(out.body.empty());
  }

  {
    DecryptedNotification out;
    Error err;
    assert(!decryptor.Decrypt(TextPush("not an envelope"), out, err));
    assert(err.code == ErrorCode::kMalformedPayload);

    PushMessageData data = TextPush(Seal(key, "x"));
    data.message_type = "file";
    assert(!decryptor.Decrypt(data, out, err));
    assert(err.code == ErrorCode::kInvalidArgument);
  }

  {
    auth.SetToken("");
    DecryptedNotification out;
    Error err;
    assert(!decryptor.Decrypt(TextPush(Seal(key, "x")), out, err));
    assert(err.code == ErrorCode::kNotAuthenticated);
  }

  {
    const auto state = lipseal::test::MakeTempDir("lipseal_notify_test");
    LoopbackDirectory peers;
    peers.RegisterSession("tok-alice", "alice");
    peers.RegisterSession("tok-bob", "bob");
    StaticTokenAuth alice_auth("tok-alice");
    StaticTokenAuth bob_auth("tok-bob");
    E2eeClient alice(ClientConfig(state / "alice"), peers, alice_auth, nullptr,
                     std::make_unique<MemoryKeyStore>());
    E2eeClient bob(ClientConfig(state / "bob"), peers, bob_auth, nullptr,
                   std::make_unique<MemoryKeyStore>());
    NotificationDecryptor bob_notify(bob.directory(), &bob);

    PushMessageData data = TextPush("");
    data.sender_id = "alice";
    data.sender_name = "Alice";
    data.message_id = "msg-no-escrow";
    data.encrypted_content = Seal(key, "too early");
    DecryptedNotification out;
    Error err;
    assert(!bob_notify.Decrypt(data, out, err));
    assert(err.code == ErrorCode::kEncryptionNotReady);

    assert(alice.Start(err));
    assert(bob.Start(err));
    assert(alice.EncryptMessageTo("bob", "lunch at one?", data.encrypted_content,
                                  err));
    assert(bob_notify.Decrypt(data, out, err));
    assert(out.title == "Alice");
    assert(out.body == "lunch at one?");
    assert(out.message_id == "msg-no-escrow");

    data.sender_id = "ghost";
    assert(!bob_notify.Decrypt(data, out, err));
    assert(err.code == ErrorCode::kMissingKey);
    assert(out.body.empty());

    PushMessageData escrowed = TextPush(Seal(key, "escrowed preview"));
    escrowed.sender_id.clear();
    peers.SetMessageKey("conv-1", "msg-1",
                        lipseal::common::Base64Encode(key.data(), key.size()));
    assert(bob_notify.Decrypt(escrowed, out, err));
    assert(out.body == "escrowed preview");

    alice.lifecycle().WaitForBackgroundTasks();
    bob.lifecycle().WaitForBackgroundTasks();
  }

  return 0;
}
