#ifndef LIPSEAL_MESSAGE_CIPHER_H
#define LIPSEAL_MESSAGE_CIPHER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "e2ee_error.h"
#include "key_agreement.h"

namespace lipseal::client {

inline constexpr std::size_t kEnvelopeIvBytes = 16;

using EnvelopeIv = std::array<std::uint8_t, kEnvelopeIvBytes>;

struct EncryptedEnvelope {
  EnvelopeIv iv{};
  std::vector<std::uint8_t> ciphertext;
};

// XChaCha20 keystream XOR. The 24-byte nonce is iv || le64(stream_id), so
// one iv may serve several independent streams.
void ApplyKeystream(const ContentKey& key,
                    const EnvelopeIv& iv,
                    std::uint64_t stream_id,
                    const std::uint8_t* in,
                    std::size_t len,
                    std::uint8_t* out);

// Confidentiality only: the envelope carries no authentication tag, so a
// corrupted ciphertext decrypts to different bytes without an error.
class MessageCipher {
 public:
  static bool Encrypt(const ContentKey& key,
                      const std::uint8_t* plain,
                      std::size_t len,
                      EncryptedEnvelope& out,
                      Error& error);
  static bool Encrypt(const ContentKey& key,
                      std::string_view plaintext,
                      EncryptedEnvelope& out,
                      Error& error);

  static bool Decrypt(const EncryptedEnvelope& envelope,
                      const ContentKey& key,
                      std::vector<std::uint8_t>& out,
                      Error& error);
  static bool Decrypt(const EncryptedEnvelope& envelope,
                      const ContentKey& key,
                      std::string& out,
                      Error& error);

  // {"iv":"<base64>","data":"<base64>"}
  static std::string EncodeEnvelope(const EncryptedEnvelope& envelope);
  static bool DecodeEnvelope(std::string_view text,
                             EncryptedEnvelope& out,
                             Error& error);
};

}  // namespace lipseal::client

#endif  // LIPSEAL_MESSAGE_CIPHER_H
