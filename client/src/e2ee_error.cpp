#include "e2ee_error.h"

namespace lipseal::client {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kNotInitialized:
      return "not_initialized";
    case ErrorCode::kStorageUnavailable:
      return "storage_unavailable";
    case ErrorCode::kNotAuthenticated:
      return "not_authenticated";
    case ErrorCode::kPeerKeyNotFound:
      return "peer_key_not_found";
    case ErrorCode::kTransientNetworkFailure:
      return "transient_network_failure";
    case ErrorCode::kMasterIntegrityMismatch:
      return "master_integrity_mismatch";
    case ErrorCode::kChunkIntegrityMismatch:
      return "chunk_integrity_mismatch";
    case ErrorCode::kInvalidBackupPassword:
      return "invalid_backup_password";
    case ErrorCode::kEncryptionNotReady:
      return "encryption_not_ready";
    case ErrorCode::kMissingKey:
      return "missing_key";
    case ErrorCode::kMalformedPayload:
      return "malformed_payload";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kCancelled:
      return "cancelled";
    case ErrorCode::kIoError:
      return "io_error";
    case ErrorCode::kCryptoFailure:
      return "crypto_failure";
  }
  return "unknown";
}

}  // namespace lipseal::client
