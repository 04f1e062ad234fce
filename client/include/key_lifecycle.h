#ifndef LIPSEAL_KEY_LIFECYCLE_H
#define LIPSEAL_KEY_LIFECYCLE_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "backup_service.h"
#include "client_config.h"
#include "e2ee_error.h"
#include "key_cache.h"
#include "key_directory.h"

namespace lipseal::client {

enum class LifecycleState : std::uint8_t {
  kUninitialized = 0,
  kNewUser = 1,
  kNeedsRestore = 2,
  kLegacyNoBackup = 3,
  kReadyNoPrompt = 4,
  kReady = 5,
};

const char* LifecycleStateName(LifecycleState state);

enum class RestoreChoice : std::uint8_t {
  kPassword = 0,
  kStartFresh = 1,
  kSkip = 2,
};

struct RestoreAnswer {
  RestoreChoice choice{RestoreChoice::kSkip};
  // Backup password for kPassword; optional new backup password for
  // kStartFresh.
  std::string password;
};

// UI collaborator. Calls may block while the user answers.
class LifecyclePrompter {
 public:
  virtual ~LifecyclePrompter() = default;

  // Returns false when the user skips backup creation.
  virtual bool RequestNewBackupPassword(std::string& out_password) = 0;
  // attempt starts at 1; last_error is empty on the first attempt.
  virtual RestoreAnswer RequestRestorePassword(std::uint32_t attempt,
                                               const std::string& last_error) = 0;
  // Non-blocking offer to create a backup; runs on a background thread.
  virtual void OfferBackup() = 0;
};

class KeyLifecycleManager {
 public:
  KeyLifecycleManager(KeyCache& cache,
                      KeyDirectoryClient& directory,
                      BackupService& backup,
                      LifecyclePrompter* prompter,
                      BackupConfig cfg);
  ~KeyLifecycleManager();

  KeyLifecycleManager(const KeyLifecycleManager&) = delete;
  KeyLifecycleManager& operator=(const KeyLifecycleManager&) = delete;

  // Runs once per authenticated session. Returns true when a ready state was
  // reached. Concurrent calls are serialized; later callers see the state the
  // first one reached.
  bool Start(Error& error);

  LifecycleState state() const;
  bool IsReady() const;
  bool HasBackup() const;

  bool CreateBackupNow(const std::string& password, Error& error);
  // Discards the local key and runs the new-user path. An empty password
  // skips the backup upload; the manager is then kLegacyNoBackup, since any
  // stored backup wraps the discarded key, and a backup is offered.
  bool StartFresh(const std::string& password, Error& error);

  // Back to kUninitialized; joins background work. Stored keys are kept.
  void Reset();
  void WaitForBackgroundTasks();

 private:
  bool RunNewUser(const std::string& password, bool replaces_key, Error& error);
  bool RunRestore(Error& error);
  // A stored backup only counts when it wraps the local device key.
  bool CheckBackupState(bool has_local, bool& out_has_backup, Error& error);
  void PublishOwnKey();
  void StartBackupRecheck();
  void SetState(LifecycleState state);
  void JoinBackground();

  KeyCache& cache_;
  KeyDirectoryClient& directory_;
  BackupService& backup_;
  LifecyclePrompter* prompter_{nullptr};
  BackupConfig cfg_;

  std::mutex start_mutex_;
  mutable std::mutex mutex_;
  LifecycleState state_{LifecycleState::kUninitialized};
  bool has_backup_{false};

  std::mutex background_mutex_;
  std::thread background_;
  std::atomic<bool> stop_background_{false};
};

}  // namespace lipseal::client

#endif  // LIPSEAL_KEY_LIFECYCLE_H
