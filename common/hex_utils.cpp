#include "hex_utils.h"

#include <array>

#include "monocypher.h"

namespace lipseal::common {

namespace {

constexpr std::size_t kFingerprintBytes = 8;

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

}  // namespace

std::string BytesToHex(const std::uint8_t* data, std::size_t len) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  if (!data || len == 0) {
    return out;
  }
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[data[i] >> 4];
    out[i * 2 + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

std::string BytesToHex(const std::vector<std::uint8_t>& data) {
  return BytesToHex(data.data(), data.size());
}

bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out) {
  out.clear();
  if (hex.empty() || (hex.size() % 2) != 0) {
    return false;
  }
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out.clear();
      return false;
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out) {
  return HexToBytes(std::string_view(hex), out);
}

std::string KeyFingerprintHex(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return {};
  }
  std::array<std::uint8_t, kFingerprintBytes> fp{};
  crypto_blake2b(fp.data(), fp.size(), data, len);
  return BytesToHex(fp.data(), fp.size());
}

}  // namespace lipseal::common
