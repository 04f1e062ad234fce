#include "message_cipher.h"

#include <cstring>

#include "base64_utils.h"
#include "monocypher.h"
#include "platform_random.h"

namespace lipseal::client {

namespace {

void SkipSpace(std::string_view text, std::size_t& pos) {
  while (pos < text.size() &&
         (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\r' ||
          text[pos] == '\n')) {
    ++pos;
  }
}

bool Expect(std::string_view text, std::size_t& pos, char ch) {
  SkipSpace(text, pos);
  if (pos >= text.size() || text[pos] != ch) {
    return false;
  }
  ++pos;
  return true;
}

// Base64 strings never contain escapes, so a quoted run is taken verbatim.
bool ReadQuoted(std::string_view text, std::size_t& pos, std::string_view& out) {
  if (!Expect(text, pos, '"')) {
    return false;
  }
  const std::size_t end = text.find('"', pos);
  if (end == std::string_view::npos) {
    return false;
  }
  out = text.substr(pos, end - pos);
  if (out.find('\\') != std::string_view::npos) {
    return false;
  }
  pos = end + 1;
  return true;
}

}  // namespace

void ApplyKeystream(const ContentKey& key,
                    const EnvelopeIv& iv,
                    std::uint64_t stream_id,
                    const std::uint8_t* in,
                    std::size_t len,
                    std::uint8_t* out) {
  if (len == 0) {
    return;
  }
  std::uint8_t nonce[24];
  std::memcpy(nonce, iv.data(), iv.size());
  for (std::size_t i = 0; i < 8; ++i) {
    nonce[iv.size() + i] = static_cast<std::uint8_t>(stream_id >> (8 * i));
  }
  crypto_chacha20_x(out, in, len, key.data(), nonce, 0);
}

bool MessageCipher::Encrypt(const ContentKey& key,
                            const std::uint8_t* plain,
                            std::size_t len,
                            EncryptedEnvelope& out,
                            Error& error) {
  error.Clear();
  out.ciphertext.clear();
  if (len > 0 && !plain) {
    return Fail(error, ErrorCode::kInvalidArgument, "plaintext null");
  }
  if (!platform::RandomBytes(out.iv.data(), out.iv.size())) {
    return Fail(error, ErrorCode::kCryptoFailure, "rng failed");
  }
  out.ciphertext.resize(len);
  ApplyKeystream(key, out.iv, 0, plain, len, out.ciphertext.data());
  return true;
}

bool MessageCipher::Encrypt(const ContentKey& key,
                            std::string_view plaintext,
                            EncryptedEnvelope& out,
                            Error& error) {
  return Encrypt(key, reinterpret_cast<const std::uint8_t*>(plaintext.data()),
                 plaintext.size(), out, error);
}

bool MessageCipher::Decrypt(const EncryptedEnvelope& envelope,
                            const ContentKey& key,
                            std::vector<std::uint8_t>& out,
                            Error& error) {
  error.Clear();
  out.resize(envelope.ciphertext.size());
  ApplyKeystream(key, envelope.iv, 0, envelope.ciphertext.data(),
                 envelope.ciphertext.size(), out.data());
  return true;
}

bool MessageCipher::Decrypt(const EncryptedEnvelope& envelope,
                            const ContentKey& key,
                            std::string& out,
                            Error& error) {
  std::vector<std::uint8_t> plain;
  if (!Decrypt(envelope, key, plain, error)) {
    return false;
  }
  out.assign(reinterpret_cast<const char*>(plain.data()), plain.size());
  return true;
}

std::string MessageCipher::EncodeEnvelope(const EncryptedEnvelope& envelope) {
  std::string out;
  out.reserve(24 + common::Base64EncodedSize(envelope.iv.size()) +
              common::Base64EncodedSize(envelope.ciphertext.size()));
  out.append("{\"iv\":\"");
  out.append(common::Base64Encode(envelope.iv.data(), envelope.iv.size()));
  out.append("\",\"data\":\"");
  out.append(common::Base64Encode(envelope.ciphertext));
  out.append("\"}");
  return out;
}

bool MessageCipher::DecodeEnvelope(std::string_view text,
                                   EncryptedEnvelope& out,
                                   Error& error) {
  error.Clear();
  out = EncryptedEnvelope{};
  std::size_t pos = 0;
  std::string_view iv_b64;
  std::string_view data_b64;
  bool have_iv = false;
  bool have_data = false;
  if (!Expect(text, pos, '{')) {
    return Fail(error, ErrorCode::kMalformedPayload, "envelope not an object");
  }
  while (true) {
    std::string_view name;
    std::string_view value;
    if (!ReadQuoted(text, pos, name) || !Expect(text, pos, ':') ||
        !ReadQuoted(text, pos, value)) {
      return Fail(error, ErrorCode::kMalformedPayload, "envelope field invalid");
    }
    if (name == "iv" && !have_iv) {
      iv_b64 = value;
      have_iv = true;
    } else if (name == "data" && !have_data) {
      data_b64 = value;
      have_data = true;
    } else {
      return Fail(error, ErrorCode::kMalformedPayload,
                  "envelope field unexpected");
    }
    SkipSpace(text, pos);
    if (pos < text.size() && text[pos] == ',') {
      ++pos;
      continue;
    }
    break;
  }
  if (!Expect(text, pos, '}')) {
    return Fail(error, ErrorCode::kMalformedPayload, "envelope not closed");
  }
  SkipSpace(text, pos);
  if (pos != text.size() || !have_iv || !have_data) {
    return Fail(error, ErrorCode::kMalformedPayload, "envelope incomplete");
  }

  std::vector<std::uint8_t> iv;
  if (!common::Base64Decode(iv_b64, iv) || iv.size() != out.iv.size()) {
    return Fail(error, ErrorCode::kMalformedPayload, "envelope iv invalid");
  }
  std::memcpy(out.iv.data(), iv.data(), out.iv.size());
  if (!common::Base64Decode(data_b64, out.ciphertext)) {
    out.ciphertext.clear();
    return Fail(error, ErrorCode::kMalformedPayload, "envelope data invalid");
  }
  return true;
}

}  // namespace lipseal::client
