#ifndef LIPSEAL_FILE_KEY_WRAP_H
#define LIPSEAL_FILE_KEY_WRAP_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "e2ee_error.h"
#include "key_agreement.h"

namespace lipseal::client {

// A random file key sealed for one recipient with XChaCha20-Poly1305. The
// wrapping key comes from the content key the sender shares with that
// recipient; the recipient's user id is the associated data.
struct RecipientKey {
  std::string user_id;
  std::string key_id;         // hex PublicKeyId of the recipient's key
  std::string encrypted_key;  // base64, 32 bytes
  std::string key_iv;         // base64, 24 bytes
  std::string key_auth_tag;   // hex, 16 bytes
};

bool GenerateFileKey(ContentKey& out, Error& error);

bool WrapFileKey(const ContentKey& file_key,
                 const ContentKey& shared_key,
                 const std::string& user_id,
                 const std::array<std::uint8_t, kKeyBytes>& recipient_public_key,
                 RecipientKey& out,
                 Error& error);

// kCryptoFailure when the wrap does not authenticate under shared_key.
bool UnwrapFileKey(const RecipientKey& entry,
                   const ContentKey& shared_key,
                   ContentKey& out,
                   Error& error);

// Entry addressed to the holder of public_key, or nullptr.
const RecipientKey* FindRecipientKey(
    const std::vector<RecipientKey>& entries,
    const std::array<std::uint8_t, kKeyBytes>& public_key);

}  // namespace lipseal::client

#endif  // LIPSEAL_FILE_KEY_WRAP_H
