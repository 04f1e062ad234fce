#ifndef LIPSEAL_SECURE_BUFFER_H
#define LIPSEAL_SECURE_BUFFER_H

#include <cstddef>

#include "monocypher.h"

namespace lipseal::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  crypto_wipe(data, len);
}

// Any contiguous byte or char container: std::vector, std::array,
// std::string.
template <typename Buffer>
inline void SecureWipe(Buffer& buf) {
  if (buf.empty()) {
    return;
  }
  SecureWipe(static_cast<void*>(&buf[0]), buf.size() * sizeof(buf[0]));
}

// Zeroes whatever the buffer holds when the guard goes out of scope, so a
// buffer that was resized after the guard was taken is still covered.
template <typename Buffer>
class ScopedWipe {
 public:
  explicit ScopedWipe(Buffer& buf) : buf_(&buf) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() { SecureWipe(*buf_); }

 private:
  Buffer* buf_;
};

}  // namespace lipseal::common

#endif  // LIPSEAL_SECURE_BUFFER_H
