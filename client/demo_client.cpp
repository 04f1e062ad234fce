#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "client_config.h"
#include "e2ee_client.h"
#include "loopback_directory.h"
#include "platform_log.h"
#include "platform_random.h"

namespace {

using lipseal::client::E2eeClient;
using lipseal::client::E2eeConfig;
using lipseal::client::EncryptedFile;
using lipseal::client::Error;
using lipseal::client::ErrorCodeName;
using lipseal::client::FileProgress;
using lipseal::client::FilePhaseName;
using lipseal::client::RestoreAnswer;
using lipseal::client::RestoreChoice;
using lipseal::platform::log::Level;
using lipseal::platform::log::Log;

constexpr char kTag[] = "demo";

class FixedPasswordPrompter final : public lipseal::client::LifecyclePrompter {
 public:
  explicit FixedPasswordPrompter(std::string password)
      : password_(std::move(password)) {}

  bool RequestNewBackupPassword(std::string& out_password) override {
    if (password_.empty()) {
      return false;
    }
    out_password = password_;
    return true;
  }

  RestoreAnswer RequestRestorePassword(std::uint32_t attempt,
                                       const std::string& last_error) override {
    RestoreAnswer answer;
    if (attempt > 1) {
      Log(Level::kWarn, kTag, "restore retry", {{"reason", last_error}});
    }
    answer.choice = RestoreChoice::kPassword;
    answer.password = password_;
    return answer;
  }

  void OfferBackup() override {
    Log(Level::kInfo, kTag, "backup offered to user");
  }

 private:
  std::string password_;
};

E2eeConfig ConfigFor(const E2eeConfig& base, const std::string& user) {
  E2eeConfig cfg = base;
  cfg.state_dir = (std::filesystem::path(base.state_dir) / user).string();
  return cfg;
}

bool Report(const char* what, bool ok, const Error& err) {
  if (ok) {
    Log(Level::kInfo, kTag, what, {{"result", "ok"}});
  } else {
    Log(Level::kError, kTag, what,
        {{"result", ErrorCodeName(err.code)}, {"detail", err.message}});
  }
  return ok;
}

}  // namespace

int main(int argc, char** argv) {
  E2eeConfig base;
  std::string cfg_err;
  const std::string cfg_path = argc > 1 ? argv[1] : "lipseal.ini";
  std::error_code ec;
  if (std::filesystem::exists(cfg_path, ec)) {
    if (!lipseal::client::LoadE2eeConfig(cfg_path, base, cfg_err)) {
      Log(Level::kError, kTag, "config load failed", {{"error", cfg_err}});
      return 1;
    }
  } else {
    base.wrap_secure_store = false;
  }

  lipseal::client::LoopbackDirectory directory;
  directory.RegisterSession("alice-session", "alice");
  directory.RegisterSession("bob-session", "bob");
  lipseal::client::StaticTokenAuth alice_auth("alice-session");
  lipseal::client::StaticTokenAuth bob_auth("bob-session");
  FixedPasswordPrompter alice_prompter("correct horse battery");
  FixedPasswordPrompter bob_prompter("");

  Error err;
  E2eeClient alice(ConfigFor(base, "alice"), directory, alice_auth,
                   &alice_prompter);
  E2eeClient bob(ConfigFor(base, "bob"), directory, bob_auth, &bob_prompter);
  if (!Report("alice start", alice.Start(err), err) ||
      !Report("bob start", bob.Start(err), err)) {
    return 1;
  }

  std::string envelope;
  std::string plain;
  if (!Report("alice encrypt",
              alice.EncryptMessageTo("bob", "hello bob", envelope, err), err) ||
      !Report("bob decrypt",
              bob.DecryptMessageFrom("alice", envelope, plain, err), err)) {
    return 1;
  }
  Log(Level::kInfo, kTag, "message delivered", {{"text", plain}});

  std::filesystem::create_directories(base.state_dir, ec);
  const auto input =
      std::filesystem::path(base.state_dir) / "demo_attachment.bin";
  {
    std::vector<std::uint8_t> data(base.files.chunked_threshold + 1024);
    if (!lipseal::platform::RandomBytes(data.data(), data.size())) {
      return 1;
    }
    std::ofstream ofs(input, std::ios::binary | std::ios::trunc);
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      Log(Level::kError, kTag, "write demo attachment failed");
      return 1;
    }
  }
  const auto on_progress = [](const FileProgress& p) {
    Log(Level::kDebug, kTag, "progress",
        {{"phase", FilePhaseName(p.phase)},
         {"chunk", std::to_string(p.current_chunk)},
         {"percent", std::to_string(static_cast<int>(p.percentage))}});
  };
  EncryptedFile file;
  if (!Report("alice encrypt file",
              alice.EncryptFileFor("bob", input, "", file, err, on_progress),
              err)) {
    return 1;
  }
  const auto output = std::filesystem::path(base.state_dir) / "demo_received.bin";
  if (!Report("bob decrypt file",
              bob.DecryptFileFromTo("alice", file, output, err, on_progress),
              err)) {
    return 1;
  }
  Log(Level::kInfo, kTag, "file delivered",
      {{"chunked", file.chunked ? "yes" : "no"},
       {"chunks", std::to_string(file.chunked_file.total_chunks)}});

  // A second device for alice restores the device key from the backup.
  FixedPasswordPrompter restore_prompter("correct horse battery");
  E2eeClient alice_new_device(ConfigFor(base, "alice_device2"), directory,
                              alice_auth, &restore_prompter);
  if (!Report("alice restore", alice_new_device.Start(err), err)) {
    return 1;
  }
  std::string again;
  if (!Report("restored decrypt",
              alice_new_device.DecryptMessageFrom("bob", envelope, again, err),
              err)) {
    return 1;
  }
  return again == "hello bob" ? 0 : 1;
}
