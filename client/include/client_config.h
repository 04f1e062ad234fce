#ifndef LIPSEAL_CLIENT_CONFIG_H
#define LIPSEAL_CLIENT_CONFIG_H

#include <cstdint>
#include <string>

#include "platform_log.h"

namespace lipseal::client {

inline constexpr std::uint32_t kDefaultChunkSize = 512u * 1024u;
inline constexpr std::uint32_t kDefaultChunkedThreshold = 5u * 1024u * 1024u;

struct FilesConfig {
  std::uint32_t chunk_size{kDefaultChunkSize};
  // Payloads larger than this use the chunked format.
  std::uint32_t chunked_threshold{kDefaultChunkedThreshold};
};

struct BackupConfig {
  std::uint32_t min_password_len{8};
  std::uint32_t argon2_blocks{4096};
  std::uint32_t argon2_passes{3};
  std::uint32_t max_restore_attempts{3};
};

struct E2eeConfig {
  std::string state_dir{"./lipseal_state"};
  // false stores raw key bytes; only for headless hosts and tests.
  bool wrap_secure_store{true};
  FilesConfig files;
  BackupConfig backup;
  platform::log::Level log_level{platform::log::Level::kInfo};
};

bool LoadE2eeConfig(const std::string& path, E2eeConfig& out_cfg,
                    std::string& error);

}  // namespace lipseal::client

#endif  // LIPSEAL_CLIENT_CONFIG_H
