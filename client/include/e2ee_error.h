#ifndef LIPSEAL_E2EE_ERROR_H
#define LIPSEAL_E2EE_ERROR_H

#include <cstdint>
#include <string>
#include <utility>

namespace lipseal::client {

enum class ErrorCode : std::uint8_t {
  kNone = 0,
  kNotInitialized = 1,
  kStorageUnavailable = 2,
  kNotAuthenticated = 3,
  kPeerKeyNotFound = 4,
  kTransientNetworkFailure = 5,
  kMasterIntegrityMismatch = 6,
  kChunkIntegrityMismatch = 7,
  kInvalidBackupPassword = 8,
  kEncryptionNotReady = 9,
  kMissingKey = 10,
  kMalformedPayload = 11,
  kInvalidArgument = 12,
  kCancelled = 13,
  kIoError = 14,
  kCryptoFailure = 15,
};

const char* ErrorCodeName(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::kNone};
  std::string message;
  // Only meaningful for kChunkIntegrityMismatch.
  std::uint32_t chunk_index{0};

  void Clear() {
    code = ErrorCode::kNone;
    message.clear();
    chunk_index = 0;
  }
  bool ok() const { return code == ErrorCode::kNone; }
};

inline bool Fail(Error& error, ErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
  error.chunk_index = 0;
  return false;
}

}  // namespace lipseal::client

#endif  // LIPSEAL_E2EE_ERROR_H
