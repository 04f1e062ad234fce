#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include "client_config.h"
#include "test_fakes.h"

using lipseal::client::E2eeConfig;
using lipseal::client::LoadE2eeConfig;
using lipseal::platform::log::Level;

namespace {

void WriteConfig(const std::filesystem::path& path, const std::string& body) {
  std::ofstream out(path);
  out << body;
  out.close();
}

}  // namespace

int main() {
  const auto dir = lipseal::test::MakeTempDir("lipseal_client_config_test");
  const auto path = dir / "lipseal.ini";

  {
    E2eeConfig cfg;
    std::string err;
    assert(!LoadE2eeConfig((dir / "missing.ini").string(), cfg, err));
    assert(!err.empty());
  }

  {
    WriteConfig(path,
                "# comment\n"
                "[e2ee]\n"
                "state_dir = /var/lib/lipseal  ; inline\n"
                "wrap_secure_store = off\n"
                "[files]\n"
                "chunk_size=65536\n"
                "chunked_threshold=1048576\n"
                "[backup]\n"
                "min_password_len=12\n"
                "argon2_blocks=1024\n"
                "argon2_passes=2\n"
                "max_restore_attempts=5\n"
                "[log]\n"
                "level=debug\n");
    E2eeConfig cfg;
    std::string err;
    assert(LoadE2eeConfig(path.string(), cfg, err));
    assert(err.empty());
    assert(cfg.state_dir == "/var/lib/lipseal");
    assert(!cfg.wrap_secure_store);
    assert(cfg.files.chunk_size == 65536);
    assert(cfg.files.chunked_threshold == 1048576);
    assert(cfg.backup.min_password_len == 12);
    assert(cfg.backup.argon2_blocks == 1024);
    assert(cfg.backup.argon2_passes == 2);
    assert(cfg.backup.max_restore_attempts == 5);
    assert(cfg.log_level == Level::kDebug);
  }

  {
    WriteConfig(path, "[e2ee]\nunknown_key=1\n");
    E2eeConfig cfg;
    std::string err;
    assert(LoadE2eeConfig(path.string(), cfg, err));
    assert(cfg.files.chunk_size == lipseal::client::kDefaultChunkSize);
    assert(cfg.files.chunked_threshold ==
           lipseal::client::kDefaultChunkedThreshold);
    assert(cfg.backup.min_password_len == 8);
    assert(cfg.wrap_secure_store);
  }

  {
    WriteConfig(path, "[files]\nchunk_size=abc\n");
    E2eeConfig cfg;
    std::string err;
    assert(!LoadE2eeConfig(path.string(), cfg, err));
    assert(err == "invalid chunk_size at line 2");
  }

  {
    WriteConfig(path, "[files]\nchunk_size\n");
    E2eeConfig cfg;
    std::string err;
    assert(!LoadE2eeConfig(path.string(), cfg, err));
    assert(err == "invalid line 2");
  }

  {
    WriteConfig(path, "[files]\nchunk_size=1024\n");
    E2eeConfig cfg;
    std::string err;
    assert(!LoadE2eeConfig(path.string(), cfg, err));
  }

  {
    WriteConfig(path, "[backup]\nmin_password_len=4\n");
    E2eeConfig cfg;
    std::string err;
    assert(!LoadE2eeConfig(path.string(), cfg, err));
  }

  {
    WriteConfig(path, "[backup]\nargon2_passes=0\n");
    E2eeConfig cfg;
    std::string err;
    assert(!LoadE2eeConfig(path.string(), cfg, err));
  }

  {
    WriteConfig(path, "[log]\nlevel=loud\n");
    E2eeConfig cfg;
    std::string err;
    assert(!LoadE2eeConfig(path.string(), cfg, err));
    assert(err == "invalid level at line 2");
  }

  return 0;
}
