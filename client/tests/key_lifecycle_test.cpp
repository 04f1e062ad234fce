#include <cassert>
#include <chrono>
#include <string>
#include <thread>

#include "backup_service.h"
#include "key_agreement.h"
#include "key_cache.h"
#include "key_directory.h"
#include "key_lifecycle.h"
#include "loopback_directory.h"
#include "test_fakes.h"

using lipseal::client::BackupConfig;
using lipseal::client::BackupService;
using lipseal::client::DeviceKey;
using lipseal::client::Error;
using lipseal::client::ErrorCode;
using lipseal::client::GenerateDeviceKey;
using lipseal::client::KeyCache;
using lipseal::client::KeyDirectoryClient;
using lipseal::client::KeyLifecycleManager;
using lipseal::client::LifecycleState;
using lipseal::client::RestoreAnswer;
using lipseal::client::RestoreChoice;
using lipseal::client::StaticTokenAuth;
using lipseal::test::CountingDirectory;
using lipseal::test::MemoryKeyStore;
using lipseal::test::ScriptedPrompter;

namespace {

BackupConfig FastBackup() {
  BackupConfig cfg;
  cfg.argon2_blocks = 8;
  cfg.argon2_passes = 1;
  cfg.max_restore_attempts = 3;
  return cfg;
}

// One device of one user, wired the way the client wires it.
struct Device {
  Device(CountingDirectory& dir,
         const std::string& token,
         ScriptedPrompter* prompter)
      : auth(token),
        directory(dir, auth),
        cache(store, directory),
        backup(directory, cache, FastBackup()),
        manager(cache, directory, backup, prompter, FastBackup()) {}

  DeviceKey OwnKey() {
    DeviceKey key{};
    Error err;
    assert(cache.GetOwnKey(key, err));
    return key;
  }

  MemoryKeyStore store;
  StaticTokenAuth auth;
  KeyDirectoryClient directory;
  KeyCache cache;
  BackupService backup;
  KeyLifecycleManager manager;
};

RestoreAnswer Choice(RestoreChoice choice, const std::string& password = {}) {
  RestoreAnswer answer;
  answer.choice = choice;
  answer.password = password;
  return answer;
}

}  // namespace

int main() {
  const std::string password = "alice backup pw";
  CountingDirectory dir;
  dir.RegisterSession("tok-alice", "alice");
  dir.RegisterSession("tok-bob", "bob");
  dir.RegisterSession("tok-legacy", "legacy");
  dir.RegisterSession("tok-carol", "carol");

  {
    assert(std::string(lipseal::client::LifecycleStateName(
               LifecycleState::kReadyNoPrompt)) == "ready_no_prompt");
  }

  DeviceKey alice_key{};
  {
    ScriptedPrompter prompter;
    prompter.new_password = password;
    Device phone(dir, "tok-alice", &prompter);
    assert(phone.manager.state() == LifecycleState::kUninitialized);
    assert(!phone.manager.IsReady());

    Error err;
    assert(phone.manager.Start(err));
    assert(phone.manager.state() == LifecycleState::kReady);
    assert(phone.manager.IsReady());
    assert(phone.manager.HasBackup());
    assert(prompter.new_password_requests == 1);
    assert(prompter.restore_requests == 0);
    assert(dir.HasKeyFor("alice"));
    assert(dir.HasBackupFor("alice"));
    alice_key = phone.OwnKey();

    bool has = false;
    assert(phone.backup.CheckHasBackup(has, err));
    assert(has);

    assert(phone.manager.Start(err));
    assert(prompter.new_password_requests == 1);

    phone.manager.Reset();
    assert(phone.manager.state() == LifecycleState::kUninitialized);
    assert(phone.manager.Start(err));
    assert(phone.manager.state() == LifecycleState::kReadyNoPrompt);
    assert(phone.OwnKey() == alice_key);
  }

  {
    ScriptedPrompter prompter;
    prompter.restore_script.push_back(ScriptedPrompter::Password("not it at all"));
    prompter.restore_script.push_back(ScriptedPrompter::Password(password));
    Device laptop(dir, "tok-alice", &prompter);
    Error err;
    assert(laptop.manager.Start(err));
    assert(laptop.manager.state() == LifecycleState::kReady);
    assert(laptop.manager.HasBackup());
    assert(prompter.restore_requests == 2);
    assert(prompter.last_attempt == 2);
    assert(prompter.restore_errors.size() == 1);
    assert(prompter.new_password_requests == 0);
    assert(laptop.OwnKey() == alice_key);
  }

  {
    ScriptedPrompter prompter;
    for (int i = 0; i < 3; ++i) {
      prompter.restore_script.push_back(
          ScriptedPrompter::Password("wrong guess " + std::to_string(i)));
    }
    Device tablet(dir, "tok-alice", &prompter);
    Error err;
    assert(!tablet.manager.Start(err));
    assert(err.code == ErrorCode::kInvalidBackupPassword);
    assert(tablet.manager.state() == LifecycleState::kNeedsRestore);
    assert(!tablet.manager.IsReady());
    assert(prompter.restore_requests == 3);
    assert(!tablet.store.Has("e2ee_device_key"));

    assert(!tablet.manager.CreateBackupNow(password, err));
    assert(err.code == ErrorCode::kEncryptionNotReady);
  }

  {
    ScriptedPrompter prompter;
    prompter.restore_script.push_back(Choice(RestoreChoice::kSkip));
    Device tablet(dir, "tok-alice", &prompter);
    Error err;
    assert(!tablet.manager.Start(err));
    assert(err.code == ErrorCode::kNotInitialized);
    assert(!tablet.manager.IsReady());
    assert(tablet.manager.state() == LifecycleState::kNeedsRestore);
  }

  {
    Device headless(dir, "tok-alice", nullptr);
    Error err;
    assert(!headless.manager.Start(err));
    assert(err.code == ErrorCode::kNotInitialized);
    assert(!headless.manager.IsReady());
  }

  {
    ScriptedPrompter prompter;
    Device phone(dir, "tok-bob", &prompter);
    Error err;
    assert(phone.manager.Start(err));
    assert(phone.manager.state() == LifecycleState::kReady);
    assert(!phone.manager.HasBackup());
    assert(dir.HasKeyFor("bob"));
    assert(!dir.HasBackupFor("bob"));

    assert(!phone.manager.CreateBackupNow("tiny", err));
    assert(err.code == ErrorCode::kInvalidArgument);
    assert(phone.manager.CreateBackupNow("bob backup password", err));
    assert(phone.manager.HasBackup());
    assert(dir.HasBackupFor("bob"));
  }

  {
    ScriptedPrompter prompter;
    prompter.restore_script.push_back(
        Choice(RestoreChoice::kStartFresh, "carol fresh password"));
    Device first(dir, "tok-carol", nullptr);
    Error err;
    assert(first.manager.Start(err));
    assert(first.manager.CreateBackupNow("carol first password", err));
    const DeviceKey old_key = first.OwnKey();

    Device second(dir, "tok-carol", &prompter);
    assert(second.manager.Start(err));
    assert(second.manager.state() == LifecycleState::kReady);
    assert(second.OwnKey() != old_key);
    assert(second.manager.HasBackup());

    ScriptedPrompter third_prompter;
    third_prompter.restore_script.push_back(
        ScriptedPrompter::Password("carol fresh password"));
    Device third(dir, "tok-carol", &third_prompter);
    assert(third.manager.Start(err));
    assert(third.OwnKey() == second.OwnKey());

    assert(third.manager.StartFresh("", err));
    assert(third.manager.state() == LifecycleState::kLegacyNoBackup);
    assert(third.manager.IsReady());
    assert(!third.manager.HasBackup());
    assert(third.OwnKey() != second.OwnKey());
    third.manager.WaitForBackgroundTasks();
    assert(third_prompter.offers.load() == 1);
  }

  {
    dir.RegisterSession("tok-gina", "gina");
    ScriptedPrompter prompter;
    prompter.new_password = "gina backup password";
    prompter.new_password_delay = std::chrono::milliseconds(100);
    Device phone(dir, "tok-gina", &prompter);
    Error first_err;
    Error second_err;
    bool first_ok = false;
    bool second_ok = false;
    std::thread first([&]() { first_ok = phone.manager.Start(first_err); });
    std::thread second([&]() { second_ok = phone.manager.Start(second_err); });
    first.join();
    second.join();
    assert(first_ok);
    assert(second_ok);
    assert(prompter.new_password_requests == 1);
    assert(phone.store.SetCount("e2ee_device_key") == 1);
    assert(phone.manager.state() == LifecycleState::kReady);

    ScriptedPrompter tablet_prompter;
    tablet_prompter.restore_script.push_back(
        ScriptedPrompter::Password("gina backup password"));
    Device tablet(dir, "tok-gina", &tablet_prompter);
    Error err;
    assert(tablet.manager.Start(err));
    assert(tablet.OwnKey() == phone.OwnKey());
  }

  {
    dir.RegisterSession("tok-hana", "hana");
    ScriptedPrompter prompter;
    prompter.new_password = "hana first password";
    Device phone(dir, "tok-hana", &prompter);
    Error err;
    assert(phone.manager.Start(err));
    assert(phone.manager.HasBackup());
    const DeviceKey stale = phone.OwnKey();

    assert(phone.manager.StartFresh("", err));
    const DeviceKey current = phone.OwnKey();
    assert(current != stale);
    assert(phone.manager.state() == LifecycleState::kLegacyNoBackup);
    assert(!phone.manager.HasBackup());
    phone.manager.WaitForBackgroundTasks();
    assert(prompter.offers.load() == 1);

    phone.manager.Reset();
    assert(phone.manager.Start(err));
    assert(phone.manager.state() == LifecycleState::kLegacyNoBackup);
    assert(!phone.manager.HasBackup());
    phone.manager.WaitForBackgroundTasks();
    assert(prompter.offers.load() == 2);

    assert(phone.manager.CreateBackupNow("hana second password", err));
    assert(phone.manager.state() == LifecycleState::kReady);

    ScriptedPrompter tablet_prompter;
    tablet_prompter.restore_script.push_back(
        ScriptedPrompter::Password("hana first password"));
    tablet_prompter.restore_script.push_back(
        ScriptedPrompter::Password("hana second password"));
    Device tablet(dir, "tok-hana", &tablet_prompter);
    assert(tablet.manager.Start(err));
    assert(tablet_prompter.restore_requests == 2);
    assert(tablet.OwnKey() == current);
  }

  {
    dir.RegisterSession("tok-ivan", "ivan");
    dir.upload_status = 500;
    ScriptedPrompter prompter;
    Device phone(dir, "tok-ivan", &prompter);
    Error err;
    assert(phone.manager.Start(err));
    assert(phone.manager.state() == LifecycleState::kReady);
    assert(phone.manager.IsReady());
    assert(!dir.HasKeyFor("ivan"));

    dir.upload_status = 0;
    phone.manager.Reset();
    assert(phone.manager.Start(err));
    assert(phone.manager.IsReady());
    assert(dir.HasKeyFor("ivan"));
    phone.manager.WaitForBackgroundTasks();
  }

  {
    dir.RegisterSession("tok-jo", "jo");
    ScriptedPrompter prompter;
    prompter.new_password = "jo backup password";
    Device phone(dir, "tok-jo", &prompter);
    phone.store.fail_writes = true;
    Error err;
    assert(!phone.manager.Start(err));
    assert(err.code == ErrorCode::kStorageUnavailable);
    assert(phone.manager.state() == LifecycleState::kUninitialized);
    assert(!phone.manager.IsReady());
    assert(!dir.HasKeyFor("jo"));
    assert(!dir.HasBackupFor("jo"));

    assert(!phone.manager.CreateBackupNow("jo backup password", err));
    assert(err.code == ErrorCode::kEncryptionNotReady);
  }

  {
    ScriptedPrompter prompter;
    Device old_install(dir, "tok-legacy", &prompter);
    DeviceKey key{};
    Error err;
    assert(GenerateDeviceKey(key, err));
    assert(old_install.cache.StoreOwnKey(key, err));

    assert(old_install.manager.Start(err));
    assert(old_install.manager.state() == LifecycleState::kLegacyNoBackup);
    assert(old_install.manager.IsReady());
    assert(dir.HasKeyFor("legacy"));
    old_install.manager.WaitForBackgroundTasks();
    assert(prompter.offers.load() == 1);
    assert(prompter.new_password_requests == 0);
    assert(old_install.manager.state() == LifecycleState::kLegacyNoBackup);

    assert(old_install.manager.CreateBackupNow("legacy backup pw", err));
    assert(old_install.manager.state() == LifecycleState::kReady);
    assert(old_install.OwnKey() == key);

    old_install.manager.Reset();
    assert(old_install.manager.Start(err));
    assert(old_install.manager.state() == LifecycleState::kReadyNoPrompt);
    old_install.manager.WaitForBackgroundTasks();
    assert(prompter.offers.load() == 1);
  }

  {
    dir.DropBackup("legacy");
    dir.check_status = 503;
    ScriptedPrompter prompter;
    Device flaky(dir, "tok-legacy", &prompter);
    DeviceKey key{};
    Error err;
    assert(GenerateDeviceKey(key, err));
    assert(flaky.cache.StoreOwnKey(key, err));
    assert(flaky.manager.Start(err));
    assert(flaky.manager.state() == LifecycleState::kLegacyNoBackup);
    flaky.manager.WaitForBackgroundTasks();
    assert(prompter.offers.load() == 0);
    dir.check_status = 0;
  }

  {
    dir.check_status = 503;
    ScriptedPrompter prompter;
    dir.RegisterSession("tok-dana", "dana");
    Device offline(dir, "tok-dana", &prompter);
    Error err;
    assert(!offline.manager.Start(err));
    assert(err.code == ErrorCode::kTransientNetworkFailure);
    assert(!offline.manager.IsReady());
    assert(prompter.new_password_requests == 0);
    dir.check_status = 0;
  }

  {
    ScriptedPrompter prompter;
    Device signed_out(dir, "", &prompter);
    Error err;
    assert(!signed_out.manager.Start(err));
    assert(err.code == ErrorCode::kNotAuthenticated);
    assert(signed_out.manager.state() == LifecycleState::kUninitialized);
  }

  return 0;
}
