#include "sync_orchestrator.h"

#include <chrono>
#include <exception>
#include <memory>
#include <utility>

#include "platform_identity.h"
#include "platform_log.h"
#include "platform_time.h"

namespace clipsync {

namespace plog = clipsync::platform::log;

namespace {

constexpr char kLogTag[] = "sync";
constexpr char kBackendUnavailableMessage[] = "Sync backend not available";
constexpr char kSyncTimedOutMessage[] = "sync timed out";

std::chrono::milliseconds Ms(std::uint32_t ms) {
  return std::chrono::milliseconds(ms);
}

}  // namespace

const char* SyncGuardName(SyncGuard guard) {
  switch (guard) {
    case SyncGuard::kOk:
      return "ok";
    case SyncGuard::kBackendUnavailable:
      return "backend_unavailable";
    case SyncGuard::kSyncDisabled:
      return "sync_disabled";
    case SyncGuard::kAccountUnavailable:
      return "account_unavailable";
    case SyncGuard::kAlreadySyncing:
      return "already_syncing";
  }
  return "unknown";
}

SyncOrchestrator::SyncOrchestrator(TaskRunner& main,
                                   TaskRunner& worker,
                                   SyncStateMachine& state,
                                   EncryptionService& encryption,
                                   PreferenceStore& preferences,
                                   SyncBackend& backend,
                                   StoreController& store,
                                   EventBus& bus,
                                   SyncConfig config)
    : main_(main),
      worker_(worker),
      state_(state),
      encryption_(encryption),
      preferences_(preferences),
      backend_(backend),
      store_(store),
      bus_(bus),
      config_(std::move(config)) {}

SyncOrchestrator::~SyncOrchestrator() {
  if (remote_change_token_ != 0) {
    bus_.Unsubscribe(remote_change_token_);
  }
  if (account_change_token_ != 0) {
    bus_.Unsubscribe(account_change_token_);
  }
}

SyncGuard SyncOrchestrator::EvaluateSyncGuards(const SyncState& state) {
  if (!state.backend_available) {
    return SyncGuard::kBackendUnavailable;
  }
  if (!state.sync_enabled) {
    return SyncGuard::kSyncDisabled;
  }
  if (state.account_status != AccountStatus::kAvailable) {
    return SyncGuard::kAccountUnavailable;
  }
  if (state.status.kind == SyncStatusKind::kSyncing) {
    return SyncGuard::kAlreadySyncing;
  }
  return SyncGuard::kOk;
}

bool SyncOrchestrator::DeriveSyncEnabled(const SyncState& state,
                                         AccountStatus account) {
  return account == AccountStatus::kAvailable && state.backend_available &&
         state.user_wants_sync;
}

std::string SyncOrchestrator::DeviceInfo() {
  return "Device: " + platform::HostName() + "\nSystem: " +
         platform::OsDescription();
}

void SyncOrchestrator::Start() {
  if (remote_change_token_ == 0) {
    remote_change_token_ = bus_.Subscribe(
        EventKind::kRemoteStoreChanged,
        [this](const Event& event) { HandleRemoteChange(event); });
  }
  if (account_change_token_ == 0) {
    account_change_token_ = bus_.Subscribe(
        EventKind::kAccountChanged,
        [this](const Event&) { CheckAccountStatus(); });
  }
  main_.Post([this] { StartOnMain(); });
}

void SyncOrchestrator::Enable() {
  main_.Post([this] { EnableOnMain(); });
}

void SyncOrchestrator::Disable() {
  main_.Post([this] { DisableOnMain(); });
}

void SyncOrchestrator::CheckAccountStatus() {
  main_.Post([this] { CheckAccountStatusOnMain(); });
}

void SyncOrchestrator::TriggerSync(GuardCallback on_guard) {
  main_.Post([this, on_guard = std::move(on_guard)] {
    TriggerSyncOnMain(on_guard);
  });
}

void SyncOrchestrator::ResolveConflicts(GuardCallback on_guard) {
  main_.Post([this, on_guard = std::move(on_guard)] {
    ResolveConflictsOnMain(on_guard);
  });
}

void SyncOrchestrator::HandleRemoteChange(const Event& event) {
  const std::string source = event.source;
  main_.Post([this, source] {
    plog::Log(plog::Level::kDebug, kLogTag, "remote store changed",
              {{"source", source.empty() ? "<unknown>" : source}});
    Event reload;
    reload.kind = EventKind::kClipboardDataChanged;
    reload.source = "sync";
    reload.unix_ms = platform::NowUnixMs();
    bus_.Publish(reload);
  });
}

void SyncOrchestrator::StartOnMain() {
  bool wants = false;
  bool found = false;
  std::string error;
  if (!preferences_.LoadBool(kSyncIntentPreferenceKey, wants, found, error)) {
    plog::Log(plog::Level::kWarn, kLogTag, "sync preference unreadable",
              {{"error", error}});
    wants = false;
  } else if (!found) {
    wants = false;
  }
  state_.SetUserWantsSync(wants);
  plog::Log(plog::Level::kInfo, kLogTag, "sync subsystem started",
            {{"user_wants_sync", wants ? "1" : "0"},
             {"resume", config_.resume_on_start ? "1" : "0"}});
  if (wants && config_.resume_on_start) {
    EnableOnMain();
    CheckAccountStatusOnMain();
  }
}

void SyncOrchestrator::EnableOnMain() {
  state_.SetUserWantsSync(true);
  PersistIntent(true);
  encryption_.Initialize();

  if (state_.Snapshot().backend_available) {
    FinishEnableOnMain();
    return;
  }
  if (probe_in_flight_) {
    return;
  }
  probe_in_flight_ = true;
  RunBlockingStep(
      "availability probe", config_.probe_timeout_ms,
      "Sync backend probe timed out",
      [this] {
        StepOutcome outcome;
        outcome.probe = backend_.Probe();
        outcome.ok = outcome.probe.available;
        outcome.error = outcome.probe.message;
        return outcome;
      },
      [this](const StepOutcome& outcome) {
        probe_in_flight_ = false;
        if (!outcome.ok) {
          const std::string message =
              outcome.error.empty() ? kBackendUnavailableMessage : outcome.error;
          plog::Log(plog::Level::kWarn, kLogTag, "sync backend unavailable",
                    {{"reason", message}});
          state_.SetStatus(SyncStatus::Error(message));
          return;
        }
        state_.SetBackendAvailable(true);
        FinishEnableOnMain();
      });
}

void SyncOrchestrator::FinishEnableOnMain() {
  if (!state_.Snapshot().user_wants_sync) {
    return;
  }
  if (!state_.SetSyncEnabled(true)) {
    return;
  }
  plog::Log(plog::Level::kInfo, kLogTag, "sync enabled");
  if (state_.Snapshot().account_status == AccountStatus::kAvailable) {
    TriggerSyncOnMain({});
  }
}

void SyncOrchestrator::DisableOnMain() {
  ++epoch_;
  probe_in_flight_ = false;
  state_.ResetForDisable();
  PersistIntent(false);
  encryption_.Disable();
  plog::Log(plog::Level::kInfo, kLogTag, "sync disabled");
}

void SyncOrchestrator::CheckAccountStatusOnMain() {
  if (!state_.Snapshot().user_wants_sync) {
    plog::Log(plog::Level::kDebug, kLogTag,
              "account check skipped: sync not wanted");
    return;
  }
  RunBlockingStep(
      "account status query", config_.account_timeout_ms,
      "account status query timed out",
      [this] {
        StepOutcome outcome;
        outcome.ok = backend_.QueryAccountStatus(outcome.account, outcome.error);
        return outcome;
      },
      [this](const StepOutcome& outcome) {
        if (!outcome.ok) {
          plog::Log(plog::Level::kWarn, kLogTag, "account status query failed",
                    {{"error", outcome.error}});
          state_.MarkAccountQueryFailed("Failed to check sync account: " +
                                        outcome.error);
          return;
        }
        state_.SetAccountStatus(outcome.account);
        const bool enabled =
            DeriveSyncEnabled(state_.Snapshot(), outcome.account);
        state_.SetSyncEnabled(enabled);
        plog::Log(plog::Level::kInfo, kLogTag, "account status updated",
                  {{"account", AccountStatusName(outcome.account)},
                   {"sync_enabled", enabled ? "1" : "0"}});
      });
}

void SyncOrchestrator::TriggerSyncOnMain(const GuardCallback& on_guard) {
  const SyncGuard guard = EvaluateSyncGuards(state_.Snapshot());
  if (guard == SyncGuard::kBackendUnavailable) {
    state_.SetStatus(SyncStatus::Error(kBackendUnavailableMessage));
  }
  if (guard == SyncGuard::kOk) {
    PerformSyncOnMain();
  } else {
    plog::Log(plog::Level::kDebug, kLogTag, "sync request rejected",
              {{"guard", SyncGuardName(guard)}});
  }
  if (on_guard) {
    on_guard(guard);
  }
}

void SyncOrchestrator::ResolveConflictsOnMain(const GuardCallback& on_guard) {
  const SyncState snapshot = state_.Snapshot();
  SyncGuard guard = SyncGuard::kOk;
  if (!snapshot.backend_available) {
    guard = SyncGuard::kBackendUnavailable;
  } else if (!snapshot.sync_enabled) {
    guard = SyncGuard::kSyncDisabled;
  } else if (snapshot.status.kind == SyncStatusKind::kSyncing) {
    guard = SyncGuard::kAlreadySyncing;
  }
  if (guard == SyncGuard::kOk) {
    plog::Log(plog::Level::kInfo, kLogTag, "resolving conflicts");
    PerformSyncOnMain();
  }
  if (on_guard) {
    on_guard(guard);
  }
}

void SyncOrchestrator::PerformSyncOnMain() {
  state_.SetStatus(SyncStatus::Syncing());
  plog::Log(plog::Level::kInfo, kLogTag, "sync started");
  RunBlockingStep(
      "store flush", config_.flush_timeout_ms, kSyncTimedOutMessage,
      [this] {
        StepOutcome outcome;
        if (!store_.HasPendingChanges()) {
          outcome.ok = true;
          return outcome;
        }
        outcome.ok = store_.Flush(outcome.error);
        return outcome;
      },
      [this](const StepOutcome& outcome) {
        if (!SyncCycleStillCurrent("flush")) {
          return;
        }
        if (!outcome.ok) {
          plog::Log(plog::Level::kWarn, kLogTag, "sync failed",
                    {{"error", outcome.error}});
          state_.SetStatus(SyncStatus::Error(outcome.error));
          return;
        }
        const std::uint64_t epoch = epoch_;
        const bool posted = main_.PostDelayed(
            [this, epoch] {
              if (epoch != epoch_ || !SyncCycleStillCurrent("grace")) {
                return;
              }
              state_.MarkSyncSucceeded(platform::NowUnixMs());
              plog::Log(plog::Level::kInfo, kLogTag, "sync completed");
            },
            Ms(config_.propagation_grace_ms));
        if (!posted) {
          plog::Log(plog::Level::kWarn, kLogTag,
                    "main context stopped before sync completed");
        }
      });
}

bool SyncOrchestrator::SyncCycleStillCurrent(const char* phase) {
  const SyncState snapshot = state_.Snapshot();
  if (snapshot.status.kind != SyncStatusKind::kSyncing) {
    plog::Log(plog::Level::kDebug, kLogTag, "sync cycle superseded",
              {{"phase", phase},
               {"status", SyncStatusKindName(snapshot.status.kind)}});
    return false;
  }
  if (!snapshot.backend_available || !snapshot.sync_enabled) {
    plog::Log(plog::Level::kInfo, kLogTag, "sync abandoned: sync turned off",
              {{"phase", phase}});
    state_.SetStatus(SyncStatus::Idle());
    return false;
  }
  return true;
}

void SyncOrchestrator::PersistIntent(bool wants_sync) {
  std::string error;
  if (!preferences_.SaveBool(kSyncIntentPreferenceKey, wants_sync, error)) {
    plog::Log(plog::Level::kWarn, kLogTag, "failed to persist sync preference",
              {{"error", error}});
  }
}

void SyncOrchestrator::RunBlockingStep(const char* step,
                                       std::uint32_t timeout_ms,
                                       std::string timeout_message,
                                       StepWork work,
                                       StepDone done) {
  // Touched on main only; whichever of completion and timeout runs first wins.
  auto settled = std::make_shared<bool>(false);
  auto on_done = std::make_shared<StepDone>(std::move(done));
  const std::uint64_t epoch = epoch_;
  const std::string step_name = step;

  auto settle = [this, settled, on_done, epoch, step_name](
                    const StepOutcome& outcome) {
    if (*settled) {
      plog::Log(plog::Level::kDebug, kLogTag, "late result dropped",
                {{"step", step_name}});
      return;
    }
    *settled = true;
    if (epoch != epoch_) {
      plog::Log(plog::Level::kDebug, kLogTag, "stale result discarded",
                {{"step", step_name}});
      return;
    }
    (*on_done)(outcome);
  };

  main_.PostDelayed(
      [settle, timeout_message = std::move(timeout_message)] {
        StepOutcome timed_out;
        timed_out.error = timeout_message;
        settle(timed_out);
      },
      Ms(timeout_ms));

  const bool posted = worker_.Post([this, work = std::move(work), settle,
                                    step_name] {
    StepOutcome outcome;
    try {
      outcome = work();
    } catch (const std::exception& ex) {
      outcome = StepOutcome{};
      outcome.error = ex.what();
    } catch (...) {
      outcome = StepOutcome{};
      outcome.error = step_name + " failed: unknown error";
    }
    main_.Post([settle, outcome] { settle(outcome); });
  });
  if (!posted) {
    main_.Post([settle, step_name] {
      StepOutcome failed;
      failed.error = step_name + " could not start: worker stopped";
      settle(failed);
    });
  }
}

}  // namespace clipsync
