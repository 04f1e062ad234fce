#include "secure_store_util.h"

#include <cstring>

#include "platform_secure_store.h"

namespace lipseal::client {

namespace {

bool HasPrefix(const std::vector<std::uint8_t>& data,
               const char* prefix,
               std::size_t prefix_len) {
  if (prefix_len == 0 || data.size() < prefix_len) {
    return false;
  }
  return std::memcmp(data.data(), prefix, prefix_len) == 0;
}

std::uint32_t ReadLe32(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(p[0]) |
         (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) |
         (static_cast<std::uint32_t>(p[3]) << 24);
}

void AppendLe32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

}  // namespace

bool MaybeUnprotectSecureStore(const std::vector<std::uint8_t>& in,
                               const char* magic,
                               const char* entropy,
                               std::vector<std::uint8_t>& out_plain,
                               bool& out_was_wrapped,
                               std::string& error) {
  error.clear();
  out_plain.clear();
  out_was_wrapped = false;
  const std::size_t magic_len = magic ? std::strlen(magic) : 0;
  if (magic_len == 0) {
    error = "secure store magic empty";
    return false;
  }
  if (!HasPrefix(in, magic, magic_len)) {
    out_plain = in;
    return true;
  }
  if (in.size() < magic_len + 4) {
    error = "secure store header truncated";
    return false;
  }
  const std::uint32_t blob_len = ReadLe32(in.data() + magic_len);
  const std::size_t off = magic_len + 4;
  if (off + blob_len != in.size()) {
    error = "secure store size invalid";
    return false;
  }
  const std::vector<std::uint8_t> blob(
      in.begin() + static_cast<std::ptrdiff_t>(off), in.end());
  const auto* entropy_ptr = reinterpret_cast<const std::uint8_t*>(entropy);
  const std::size_t entropy_len = entropy ? std::strlen(entropy) : 0;
  if (!platform::UnprotectSecureBlob(blob, entropy_ptr, entropy_len,
                                     out_plain, error)) {
    return false;
  }
  out_was_wrapped = true;
  return true;
}

bool ProtectSecureStore(const std::vector<std::uint8_t>& plain,
                        const char* magic,
                        const char* entropy,
                        std::vector<std::uint8_t>& out_wrapped,
                        std::string& error) {
  error.clear();
  out_wrapped.clear();
  if (plain.empty()) {
    error = "secure store plain empty";
    return false;
  }
  const std::size_t magic_len = magic ? std::strlen(magic) : 0;
  if (magic_len == 0) {
    error = "secure store magic empty";
    return false;
  }
  const auto* entropy_ptr = reinterpret_cast<const std::uint8_t*>(entropy);
  const std::size_t entropy_len = entropy ? std::strlen(entropy) : 0;
  std::vector<std::uint8_t> blob;
  if (!platform::ProtectSecureBlob(plain, entropy_ptr, entropy_len, blob,
                                   error)) {
    return false;
  }
  out_wrapped.reserve(magic_len + 4 + blob.size());
  out_wrapped.insert(out_wrapped.end(), magic, magic + magic_len);
  AppendLe32(out_wrapped, static_cast<std::uint32_t>(blob.size()));
  out_wrapped.insert(out_wrapped.end(), blob.begin(), blob.end());
  return true;
}

}  // namespace lipseal::client
