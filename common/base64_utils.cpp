#include "base64_utils.h"

#include <openssl/evp.h>

#include <algorithm>

namespace lipseal::common {

namespace {

// EVP block calls take int lengths; large payloads go through in segments.
constexpr std::size_t kEncodeSegment = 3 * 16384;
constexpr std::size_t kDecodeSegment = 4 * 16384;

bool InAlphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}  // namespace

std::size_t Base64EncodedSize(std::size_t raw_len) {
  return ((raw_len + 2) / 3) * 4;
}

std::string Base64Encode(const std::uint8_t* data, std::size_t len) {
  std::string out;
  if (!data || len == 0) {
    return out;
  }
  out.resize(Base64EncodedSize(len));
  std::vector<unsigned char> buf(Base64EncodedSize(kEncodeSegment) + 1);
  std::size_t written = 0;
  for (std::size_t off = 0; off < len; off += kEncodeSegment) {
    const std::size_t n = std::min(kEncodeSegment, len - off);
    const int produced =
        EVP_EncodeBlock(buf.data(), data + off, static_cast<int>(n));
    std::copy(buf.begin(), buf.begin() + produced, out.begin() + written);
    written += static_cast<std::size_t>(produced);
  }
  out.resize(written);
  return out;
}

std::string Base64Encode(const std::vector<std::uint8_t>& data) {
  return Base64Encode(data.data(), data.size());
}

bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out) {
  out.clear();
  if (text.empty()) {
    return true;
  }
  if ((text.size() % 4) != 0) {
    return false;
  }
  // EVP_DecodeBlock trims whitespace and tolerates misplaced padding, so the
  // layout is checked here first.
  std::size_t pad = 0;
  while (pad < text.size() && text[text.size() - 1 - pad] == '=') {
    ++pad;
  }
  if (pad > 2) {
    return false;
  }
  for (std::size_t i = 0; i < text.size() - pad; ++i) {
    if (!InAlphabet(text[i])) {
      return false;
    }
  }

  out.resize((text.size() / 4) * 3);
  std::size_t written = 0;
  for (std::size_t off = 0; off < text.size(); off += kDecodeSegment) {
    const std::size_t n = std::min(kDecodeSegment, text.size() - off);
    const int produced = EVP_DecodeBlock(
        out.data() + written,
        reinterpret_cast<const unsigned char*>(text.data() + off),
        static_cast<int>(n));
    if (produced < 0) {
      out.clear();
      return false;
    }
    written += static_cast<std::size_t>(produced);
  }
  // Padding bytes come back as zeros from the last block.
  out.resize(written - pad);
  return true;
}

}  // namespace lipseal::common
