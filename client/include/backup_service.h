#ifndef LIPSEAL_BACKUP_SERVICE_H
#define LIPSEAL_BACKUP_SERVICE_H

#include <cstdint>
#include <string>
#include <vector>

#include "client_config.h"
#include "e2ee_error.h"
#include "key_agreement.h"
#include "key_cache.h"
#include "key_directory.h"

namespace lipseal::client {

// Binary layout of a backup blob (little endian):
//   "LSBK" | u8 version | u32 argon2 blocks | u32 argon2 passes |
//   u64 created_at | key_id[16] | salt[16] | nonce[24] | mac[16] |
//   wrapped_key[32]
// Everything before mac is authenticated as associated data. key_id is
// PublicKeyId of the wrapped device key.
struct BackupHeader {
  std::uint8_t version{0};
  std::uint32_t argon2_blocks{0};
  std::uint32_t argon2_passes{0};
  std::uint64_t created_at{0};
  KeyId key_id{};
};

class BackupService {
 public:
  BackupService(KeyDirectoryClient& directory, KeyCache& cache,
                BackupConfig cfg);

  // Wraps the local device key under password and uploads it.
  bool CreateBackup(const std::string& password,
                    std::string& out_blob_b64,
                    Error& error);
  // Installs the unwrapped key through the key cache. Every failure after the
  // blob is fetched is kInvalidBackupPassword and installs nothing.
  bool Restore(const std::string& password, Error& error);
  bool CheckHasBackup(bool& out_has_backup, Error& error);
  // Fetches the stored blob and reports whether it wraps key. A missing or
  // unparsable blob is reported as no match.
  bool BackupMatchesKey(const DeviceKey& key, bool& out_matches, Error& error);

  const BackupConfig& config() const { return cfg_; }

  static bool SealBackup(const DeviceKey& key,
                         const std::string& password,
                         const BackupConfig& cfg,
                         std::vector<std::uint8_t>& out,
                         Error& error);
  static bool OpenBackup(const std::vector<std::uint8_t>& blob,
                         const std::string& password,
                         DeviceKey& out,
                         BackupHeader& out_header,
                         Error& error);
  // Reads the unauthenticated header fields without a password.
  static bool ReadHeader(const std::vector<std::uint8_t>& blob,
                         BackupHeader& out,
                         Error& error);
  // Counts UTF-8 code points.
  static std::size_t PasswordLength(const std::string& password);

 private:
  KeyDirectoryClient& directory_;
  KeyCache& cache_;
  BackupConfig cfg_;
};

}  // namespace lipseal::client

#endif  // LIPSEAL_BACKUP_SERVICE_H
