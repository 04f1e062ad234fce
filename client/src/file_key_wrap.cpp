#include "file_key_wrap.h"

#include "base64_utils.h"
#include "hex_utils.h"
#include "monocypher.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kWrapLabel[] = "lipseal/file-wrap/v1";
constexpr std::size_t kWrapNonceBytes = 24;
constexpr std::size_t kWrapMacBytes = 16;

void DeriveWrapKey(const ContentKey& shared_key, ContentKey& out) {
  crypto_blake2b_keyed(out.data(), out.size(), shared_key.data(),
                       shared_key.size(),
                       reinterpret_cast<const std::uint8_t*>(kWrapLabel),
                       sizeof(kWrapLabel) - 1);
}

}  // namespace

bool GenerateFileKey(ContentKey& out, Error& error) {
  error.Clear();
  if (!platform::RandomBytes(out.data(), out.size())) {
    return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
  }
  return true;
}

bool WrapFileKey(const ContentKey& file_key,
                 const ContentKey& shared_key,
                 const std::string& user_id,
                 const std::array<std::uint8_t, kKeyBytes>& recipient_public_key,
                 RecipientKey& out,
                 Error& error) {
  error.Clear();
  out = RecipientKey{};
  if (user_id.empty()) {
    return Fail(error, ErrorCode::kInvalidArgument, "recipient id empty");
  }
  std::uint8_t nonce[kWrapNonceBytes];
  if (!platform::RandomBytes(nonce, sizeof(nonce))) {
    return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
  }
  ContentKey wrap_key{};
  common::ScopedWipe wipe_wrap(wrap_key);
  DeriveWrapKey(shared_key, wrap_key);

  std::uint8_t sealed[kKeyBytes];
  std::uint8_t mac[kWrapMacBytes];
  crypto_aead_lock(sealed, mac, wrap_key.data(), nonce,
                   reinterpret_cast<const std::uint8_t*>(user_id.data()),
                   user_id.size(), file_key.data(), file_key.size());

  const KeyId id = PublicKeyId(recipient_public_key);
  out.user_id = user_id;
  out.key_id = common::BytesToHex(id.data(), id.size());
  out.encrypted_key = common::Base64Encode(sealed, sizeof(sealed));
  out.key_iv = common::Base64Encode(nonce, sizeof(nonce));
  out.key_auth_tag = common::BytesToHex(mac, sizeof(mac));
  return true;
}

bool UnwrapFileKey(const RecipientKey& entry,
                   const ContentKey& shared_key,
                   ContentKey& out,
                   Error& error) {
  error.Clear();
  std::vector<std::uint8_t> sealed;
  std::vector<std::uint8_t> nonce;
  std::vector<std::uint8_t> mac;
  if (!common::Base64Decode(entry.encrypted_key, sealed) ||
      sealed.size() != kKeyBytes ||
      !common::Base64Decode(entry.key_iv, nonce) ||
      nonce.size() != kWrapNonceBytes ||
      !common::HexToBytes(entry.key_auth_tag, mac) ||
      mac.size() != kWrapMacBytes) {
    return Fail(error, ErrorCode::kMalformedPayload, "recipient key invalid");
  }
  ContentKey wrap_key{};
  common::ScopedWipe wipe_wrap(wrap_key);
  DeriveWrapKey(shared_key, wrap_key);
  if (crypto_aead_unlock(out.data(), mac.data(), wrap_key.data(), nonce.data(),
                         reinterpret_cast<const std::uint8_t*>(
                             entry.user_id.data()),
                         entry.user_id.size(), sealed.data(),
                         sealed.size()) != 0) {
    common::SecureWipe(out.data(), out.size());
    return Fail(error, ErrorCode::kCryptoFailure, "file key unwrap failed");
  }
  return true;
}

const RecipientKey* FindRecipientKey(
    const std::vector<RecipientKey>& entries,
    const std::array<std::uint8_t, kKeyBytes>& public_key) {
  const KeyId id = PublicKeyId(public_key);
  const std::string hex = common::BytesToHex(id.data(), id.size());
  for (const auto& entry : entries) {
    if (entry.key_id == hex) {
      return &entry;
    }
  }
  return nullptr;
}

}  // namespace lipseal::client
