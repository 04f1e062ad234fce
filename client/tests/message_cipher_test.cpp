#include <cassert>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "key_agreement.h"
#include "message_cipher.h"
#include "test_fakes.h"

using lipseal::client::ContentKey;
using lipseal::client::DeriveContentKey;
using lipseal::client::DerivePublicKey;
using lipseal::client::DeviceKey;
using lipseal::client::EncryptedEnvelope;
using lipseal::client::Error;
using lipseal::client::ErrorCode;
using lipseal::client::GenerateDeviceKey;
using lipseal::client::MessageCipher;
using lipseal::test::MakeKey;

int main() {
  {
    DeviceKey alice{};
    DeviceKey bob{};
    Error err;
    assert(GenerateDeviceKey(alice, err));
    assert(GenerateDeviceKey(bob, err));
    assert(alice != bob);

    ContentKey ab{};
    ContentKey ba{};
    assert(DeriveContentKey(alice, DerivePublicKey(bob), ab, err));
    assert(DeriveContentKey(bob, DerivePublicKey(alice), ba, err));
    assert(ab == ba);

    DeviceKey carol{};
    assert(GenerateDeviceKey(carol, err));
    ContentKey ac{};
    assert(DeriveContentKey(alice, DerivePublicKey(carol), ac, err));
    assert(ac != ab);

    const std::array<std::uint8_t, 32> low_order{};
    ContentKey bad{};
    assert(!DeriveContentKey(alice, low_order, bad, err));
    assert(err.code == ErrorCode::kCryptoFailure);
  }

  {
    DeviceKey key{};
    Error err;
    assert(!lipseal::client::DeviceKeyFromBytes(std::vector<std::uint8_t>(31, 1),
                                                key, err));
    assert(err.code == ErrorCode::kStorageUnavailable);
    assert(lipseal::client::DeviceKeyFromBytes(std::vector<std::uint8_t>(32, 1),
                                               key, err));
    assert(key[0] == 1 && key[31] == 1);
  }

  {
    const ContentKey key = MakeKey(3);
    const std::string text = "Hello, Bob! \xF0\x9F\x94\x92";
    EncryptedEnvelope env;
    Error err;
    assert(MessageCipher::Encrypt(key, text, env, err));
    assert(env.ciphertext.size() == text.size());
    assert(std::string(env.ciphertext.begin(), env.ciphertext.end()) != text);

    std::string plain;
    assert(MessageCipher::Decrypt(env, key, plain, err));
    assert(plain == text);

    EncryptedEnvelope again;
    assert(MessageCipher::Encrypt(key, text, again, err));
    assert(again.iv != env.iv);
    assert(again.ciphertext != env.ciphertext);

    std::string wrong;
    assert(MessageCipher::Decrypt(env, MakeKey(4), wrong, err));
    assert(wrong != text);
  }

  {
    const ContentKey key = MakeKey(9);
    EncryptedEnvelope env;
    Error err;
    assert(MessageCipher::Encrypt(key, std::string(), env, err));
    assert(env.ciphertext.empty());
    const std::string encoded = MessageCipher::EncodeEnvelope(env);
    EncryptedEnvelope parsed;
    assert(MessageCipher::DecodeEnvelope(encoded, parsed, err));
    std::string plain = "x";
    assert(MessageCipher::Decrypt(parsed, key, plain, err));
    assert(plain.empty());
  }

  {
    const ContentKey key = MakeKey(21);
    EncryptedEnvelope env;
    Error err;
    assert(MessageCipher::Encrypt(key, "wire format", env, err));
    const std::string encoded = MessageCipher::EncodeEnvelope(env);
    assert(encoded.rfind("{\"iv\":\"", 0) == 0);
    assert(encoded.find("\",\"data\":\"") != std::string::npos);
    assert(encoded.back() == '}');

    EncryptedEnvelope parsed;
    assert(MessageCipher::DecodeEnvelope(encoded, parsed, err));
    assert(parsed.iv == env.iv);
    assert(parsed.ciphertext == env.ciphertext);
  }

  {
    EncryptedEnvelope parsed;
    Error err;
    assert(MessageCipher::DecodeEnvelope(
        " { \"data\" : \"aGk=\" , \"iv\" : \"AAAAAAAAAAAAAAAAAAAAAA==\" } ",
        parsed, err));
    assert(parsed.ciphertext.size() == 2);

    const char* bad[] = {
        "",
        "not json",
        "{\"iv\":\"AAAAAAAAAAAAAAAAAAAAAA==\"}",
        "{\"data\":\"aGk=\"}",
        "{\"iv\":\"AAAA\",\"data\":\"aGk=\"}",
        "{\"iv\":\"AAAAAAAAAAAAAAAAAAAAAA==\",\"data\":\"a*k=\"}",
        "{\"iv\":\"AAAAAAAAAAAAAAAAAAAAAA==\",\"data\":\"aGk=\",\"x\":\"y\"}",
        "{\"iv\":\"AAAAAAAAAAAAAAAAAAAAAA==\",\"data\":\"aGk=\"} trailing",
    };
    for (const char* text : bad) {
      assert(!MessageCipher::DecodeEnvelope(text, parsed, err));
      assert(err.code == ErrorCode::kMalformedPayload);
    }
  }

  return 0;
}
