#ifndef CLIPSYNC_SYNC_ORCHESTRATOR_H
#define CLIPSYNC_SYNC_ORCHESTRATOR_H

#include <cstdint>
#include <functional>
#include <string>

#include "clipsync_config.h"
#include "encryption_service.h"
#include "event_bus.h"
#include "preference_store.h"
#include "store_controller.h"
#include "sync_backend.h"
#include "sync_state.h"
#include "task_runner.h"

namespace clipsync {

// Which precondition stopped a sync request, checked in declaration order.
enum class SyncGuard : std::uint8_t {
  kOk = 0,
  kBackendUnavailable = 1,
  kSyncDisabled = 2,
  kAccountUnavailable = 3,
  kAlreadySyncing = 4
};

const char* SyncGuardName(SyncGuard guard);

// Drives SyncStateMachine.
//
// Every state read and write happens on `main`. Public methods may be called
// from any thread; they post to `main` and return immediately. Blocking
// collaborator calls (probe, account query, store flush) run on `worker`,
// are bounded by the configured timeouts, and report back on `main`.
//
// Disable() starts a new epoch: results of steps started before it are
// discarded when they arrive.
//
// Both runners must be stopped before the orchestrator is destroyed.
class SyncOrchestrator {
 public:
  using GuardCallback = std::function<void(SyncGuard)>;

  SyncOrchestrator(TaskRunner& main,
                   TaskRunner& worker,
                   SyncStateMachine& state,
                   EncryptionService& encryption,
                   PreferenceStore& preferences,
                   SyncBackend& backend,
                   StoreController& store,
                   EventBus& bus,
                   SyncConfig config);
  ~SyncOrchestrator();

  SyncOrchestrator(const SyncOrchestrator&) = delete;
  SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

  // Subscribes to backend events and restores the persisted user intent.
  void Start();

  void Enable();
  void Disable();
  void CheckAccountStatus();
  // `on_guard`, if set, runs on `main` with the guard outcome.
  void TriggerSync(GuardCallback on_guard = {});
  void ResolveConflicts(GuardCallback on_guard = {});
  void HandleRemoteChange(const Event& event);

  // Guards a-d of a sync request, in order.
  static SyncGuard EvaluateSyncGuards(const SyncState& state);
  // sync_enabled after a successful account query: never turns sync on
  // unless the backend is available and the user still wants sync.
  static bool DeriveSyncEnabled(const SyncState& state, AccountStatus account);

  static std::string DeviceInfo();

  const SyncConfig& config() const { return config_; }

 private:
  struct StepOutcome {
    bool ok{false};
    std::string error;
    BackendProbe probe;
    AccountStatus account{AccountStatus::kUnknown};
  };
  using StepWork = std::function<StepOutcome()>;
  using StepDone = std::function<void(const StepOutcome&)>;

  void StartOnMain();
  void EnableOnMain();
  void FinishEnableOnMain();
  void DisableOnMain();
  void CheckAccountStatusOnMain();
  void TriggerSyncOnMain(const GuardCallback& on_guard);
  void ResolveConflictsOnMain(const GuardCallback& on_guard);
  void PerformSyncOnMain();
  // False once the running cycle was ended by an account failure or a
  // loss of availability; the caller then leaves the state alone.
  bool SyncCycleStillCurrent(const char* phase);

  void PersistIntent(bool wants_sync);
  // Runs `work` on the worker; `done` runs on main at most once, with a
  // failed outcome carrying `timeout_message` if `work` has not finished
  // within `timeout_ms`.
  void RunBlockingStep(const char* step, std::uint32_t timeout_ms,
                       std::string timeout_message, StepWork work,
                       StepDone done);

  TaskRunner& main_;
  TaskRunner& worker_;
  SyncStateMachine& state_;
  EncryptionService& encryption_;
  PreferenceStore& preferences_;
  SyncBackend& backend_;
  StoreController& store_;
  EventBus& bus_;
  const SyncConfig config_;

  EventBus::Token remote_change_token_{0};
  EventBus::Token account_change_token_{0};
  // main-context only
  std::uint64_t epoch_{0};
  bool probe_in_flight_{false};
};

}  // namespace clipsync

#endif  // CLIPSYNC_SYNC_ORCHESTRATOR_H
