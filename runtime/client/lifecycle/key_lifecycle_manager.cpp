#include "key_lifecycle.h"

#include "hex_utils.h"
#include "key_agreement.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace lipseal::client {

namespace {

constexpr char kLogTag[] = "lifecycle";

using platform::log::Level;

bool IsReadyState(LifecycleState state) {
  return state == LifecycleState::kReady ||
         state == LifecycleState::kReadyNoPrompt ||
         state == LifecycleState::kLegacyNoBackup;
}

}  // namespace

const char* LifecycleStateName(LifecycleState state) {
  switch (state) {
    case LifecycleState::kUninitialized:
      return "uninitialized";
    case LifecycleState::kNewUser:
      return "new_user";
    case LifecycleState::kNeedsRestore:
      return "needs_restore";
    case LifecycleState::kLegacyNoBackup:
      return "legacy_no_backup";
    case LifecycleState::kReadyNoPrompt:
      return "ready_no_prompt";
    case LifecycleState::kReady:
      return "ready";
  }
  return "unknown";
}

KeyLifecycleManager::KeyLifecycleManager(KeyCache& cache,
                                         KeyDirectoryClient& directory,
                                         BackupService& backup,
                                         LifecyclePrompter* prompter,
                                         BackupConfig cfg)
    : cache_(cache),
      directory_(directory),
      backup_(backup),
      prompter_(prompter),
      cfg_(cfg) {}

KeyLifecycleManager::~KeyLifecycleManager() {
  stop_background_.store(true);
  JoinBackground();
}

LifecycleState KeyLifecycleManager::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool KeyLifecycleManager::IsReady() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return IsReadyState(state_);
}

bool KeyLifecycleManager::HasBackup() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return has_backup_;
}

void KeyLifecycleManager::SetState(LifecycleState state) {
  LifecycleState prev;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    prev = state_;
    state_ = state;
  }
  if (prev != state) {
    platform::log::Log(Level::kInfo, kLogTag, "state changed",
                       {{"from", LifecycleStateName(prev)},
                        {"to", LifecycleStateName(state)}});
  }
}

bool KeyLifecycleManager::Start(Error& error) {
  error.Clear();
  std::lock_guard<std::mutex> start_lock(start_mutex_);
  if (IsReady()) {
    return true;
  }

  bool has_local = false;
  if (!cache_.HasOwnKey(has_local, error)) {
    platform::log::Log(Level::kError, kLogTag, "local key lookup failed",
                       {{"error", error.message}});
    return false;
  }

  bool has_backup = false;
  bool backup_known = true;
  Error check_err;
  if (!CheckBackupState(has_local, has_backup, check_err)) {
    if (check_err.code == ErrorCode::kNotAuthenticated || !has_local) {
      error = check_err;
      platform::log::Log(Level::kWarn, kLogTag, "backup check failed",
                         {{"error", check_err.message}});
      return false;
    }
    platform::log::Log(Level::kWarn, kLogTag,
                       "backup check failed, continuing with local key",
                       {{"error", check_err.message}});
    backup_known = false;
  }

  if (!has_local && has_backup) {
    SetState(LifecycleState::kNeedsRestore);
    return RunRestore(error);
  }
  if (!has_local) {
    SetState(LifecycleState::kNewUser);
    std::string password;
    if (prompter_ && !prompter_->RequestNewBackupPassword(password)) {
      password.clear();
    }
    common::ScopedWipe wipe_password(password);
    return RunNewUser(password, false, error);
  }

  PublishOwnKey();
  if (has_backup) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      has_backup_ = true;
    }
    SetState(LifecycleState::kReadyNoPrompt);
    return true;
  }
  SetState(LifecycleState::kLegacyNoBackup);
  if (!backup_known) {
    platform::log::Log(Level::kInfo, kLogTag,
                       "backup state unknown, rechecking in background");
  }
  StartBackupRecheck();
  return true;
}

bool KeyLifecycleManager::CheckBackupState(bool has_local,
                                      bool& out_has_backup,
                                      Error& error) {
  out_has_backup = false;
  if (!backup_.CheckHasBackup(out_has_backup, error)) {
    return false;
  }
  if (!out_has_backup || !has_local) {
    return true;
  }
  DeviceKey key{};
  common::ScopedWipe wipe_key(key);
  if (!cache_.GetOwnKey(key, error)) {
    return false;
  }
  return backup_.BackupMatchesKey(key, out_has_backup, error);
}

bool KeyLifecycleManager::RunNewUser(const std::string& password,
                                     bool replaces_key,
                                     Error& error) {
  DeviceKey key{};
  common::ScopedWipe wipe_key(key);
  if (!GenerateDeviceKey(key, error) || !cache_.StoreOwnKey(key, error)) {
    platform::log::Log(Level::kError, kLogTag, "device key setup failed",
                       {{"error", error.message}});
    SetState(LifecycleState::kUninitialized);
    return false;
  }
  platform::log::Log(Level::kInfo, kLogTag, "device key generated",
                     {{"key_fp", common::KeyFingerprintHex(key.data(),
                                                           key.size())}});

  bool uploaded = false;
  if (!password.empty()) {
    std::string blob_b64;
    Error backup_err;
    if (backup_.CreateBackup(password, blob_b64, backup_err)) {
      uploaded = true;
    } else {
      platform::log::Log(Level::kWarn, kLogTag, "backup creation failed",
                         {{"error", backup_err.message}});
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    has_backup_ = uploaded;
  }
  PublishOwnKey();
  if (replaces_key && !uploaded) {
    SetState(LifecycleState::kLegacyNoBackup);
    StartBackupRecheck();
    return true;
  }
  SetState(LifecycleState::kReady);
  return true;
}

bool KeyLifecycleManager::RunRestore(Error& error) {
  if (!prompter_) {
    return Fail(error, ErrorCode::kNotInitialized,
                "backup restore requires a password");
  }
  std::string last_error;
  for (std::uint32_t attempt = 1; attempt <= cfg_.max_restore_attempts;
       ++attempt) {
    RestoreAnswer answer = prompter_->RequestRestorePassword(attempt, last_error);
    common::ScopedWipe wipe_password(answer.password);
    if (answer.choice == RestoreChoice::kSkip) {
      return Fail(error, ErrorCode::kNotInitialized, "restore skipped");
    }
    if (answer.choice == RestoreChoice::kStartFresh) {
      platform::log::Log(Level::kWarn, kLogTag,
                         "restore declined, generating a new device key");
      SetState(LifecycleState::kNewUser);
      return RunNewUser(answer.password, true, error);
    }
    if (backup_.Restore(answer.password, error)) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        has_backup_ = true;
      }
      PublishOwnKey();
      SetState(LifecycleState::kReady);
      return true;
    }
    if (error.code != ErrorCode::kInvalidBackupPassword) {
      return false;
    }
    last_error = error.message;
    platform::log::Log(Level::kInfo, kLogTag, "restore attempt failed",
                       {{"attempt", std::to_string(attempt)}});
  }
  return Fail(error, ErrorCode::kInvalidBackupPassword,
              "restore attempts exhausted");
}

void KeyLifecycleManager::PublishOwnKey() {
  DeviceKey key{};
  common::ScopedWipe wipe_key(key);
  Error err;
  if (!cache_.GetOwnKey(key, err)) {
    platform::log::Log(Level::kWarn, kLogTag, "publish skipped",
                       {{"error", err.message}});
    return;
  }
  const auto public_key = DerivePublicKey(key);
  if (!directory_.Publish(public_key, err)) {
    platform::log::Log(Level::kWarn, kLogTag, "publish failed",
                       {{"error", err.message}});
    return;
  }
  platform::log::Log(Level::kDebug, kLogTag, "public key published",
                     {{"key_fp", common::KeyFingerprintHex(
                                     public_key.data(), public_key.size())}});
}

void KeyLifecycleManager::StartBackupRecheck() {
  std::lock_guard<std::mutex> lock(background_mutex_);
  if (background_.joinable()) {
    background_.join();
  }
  stop_background_.store(false);
  background_ = std::thread([this]() {
    bool has_backup = false;
    Error err;
    if (!CheckBackupState(true, has_backup, err)) {
      platform::log::Log(Level::kWarn, kLogTag, "backup recheck failed",
                         {{"error", err.message}});
      return;
    }
    if (stop_background_.load()) {
      return;
    }
    if (has_backup) {
      {
        std::lock_guard<std::mutex> state_lock(mutex_);
        has_backup_ = true;
        if (state_ == LifecycleState::kLegacyNoBackup) {
          state_ = LifecycleState::kReadyNoPrompt;
        }
      }
      platform::log::Log(Level::kInfo, kLogTag, "backup found on recheck");
      return;
    }
    if (prompter_) {
      prompter_->OfferBackup();
    }
  });
}

void KeyLifecycleManager::JoinBackground() {
  std::lock_guard<std::mutex> lock(background_mutex_);
  if (background_.joinable()) {
    background_.join();
  }
}

void KeyLifecycleManager::WaitForBackgroundTasks() {
  JoinBackground();
}

bool KeyLifecycleManager::CreateBackupNow(const std::string& password,
                                          Error& error) {
  error.Clear();
  if (!IsReady()) {
    return Fail(error, ErrorCode::kEncryptionNotReady, "keys not initialized");
  }
  std::string blob_b64;
  if (!backup_.CreateBackup(password, blob_b64, error)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  has_backup_ = true;
  if (state_ == LifecycleState::kLegacyNoBackup) {
    state_ = LifecycleState::kReady;
  }
  return true;
}

bool KeyLifecycleManager::StartFresh(const std::string& password,
                                     Error& error) {
  error.Clear();
  std::lock_guard<std::mutex> start_lock(start_mutex_);
  stop_background_.store(true);
  JoinBackground();
  if (!cache_.ForgetOwnKey(error)) {
    return false;
  }
  SetState(LifecycleState::kNewUser);
  return RunNewUser(password, true, error);
}

void KeyLifecycleManager::Reset() {
  stop_background_.store(true);
  JoinBackground();
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = LifecycleState::kUninitialized;
  has_backup_ = false;
}

}  // namespace lipseal::client
