#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "clipsync_config.h"
#include "credential_store.h"
#include "encryption_service.h"
#include "event_bus.h"
#include "platform_log.h"
#include "platform_secure_store.h"
#include "platform_time.h"
#include "preference_store.h"
#include "store_controller.h"
#include "sync_backend.h"
#include "sync_orchestrator.h"
#include "sync_state.h"
#include "task_runner.h"

namespace {

namespace plog = clipsync::platform::log;

void LogError(const std::string& msg) {
  std::cerr << "[clipsync_cli] " << msg << "\n";
}

void PrintUsage() {
  std::cerr << "usage: clipsync_cli [--config <path>] <command> [arg]\n"
               "commands:\n"
               "  status\n"
               "  enable\n"
               "  disable\n"
               "  sync\n"
               "  encrypt <text>    uses the sync key; needs `enable` first\n"
               "  decrypt <base64>  uses the sync key; needs `enable` first\n"
               "  device-info\n";
}

// The CLI has no clipboard database; there is never anything to flush.
class NoLocalChanges : public clipsync::StoreController {
 public:
  bool HasPendingChanges() override { return false; }
  bool Flush(std::string& error) override {
    error.clear();
    return true;
  }
};

// Blocks until `pred` holds for the current snapshot or `timeout` elapses.
bool WaitForState(clipsync::SyncStateMachine& state,
                  const std::function<bool(const clipsync::SyncState&)>& pred,
                  std::chrono::milliseconds timeout) {
  struct Signal {
    std::mutex mutex;
    std::condition_variable cv;
  };
  // A notification already in flight may still run after Unsubscribe().
  auto signal = std::make_shared<Signal>();
  const auto id = state.Subscribe([signal](const clipsync::SyncState&) {
    std::lock_guard<std::mutex> lock(signal->mutex);
    signal->cv.notify_all();
  });
  bool ok = false;
  {
    std::unique_lock<std::mutex> lock(signal->mutex);
    ok = signal->cv.wait_for(lock, timeout,
                             [&] { return pred(state.Snapshot()); });
  }
  state.Unsubscribe(id);
  return ok;
}

// Returns once every task posted to `runner` before this call has run.
bool Drain(clipsync::TaskRunner& runner, std::chrono::milliseconds timeout) {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (!runner.Post([done] { done->set_value(); })) {
    return false;
  }
  return future.wait_for(timeout) == std::future_status::ready;
}

bool Settled(const clipsync::SyncState& s) {
  return s.status.kind == clipsync::SyncStatusKind::kError || s.sync_enabled;
}

void PrintState(const clipsync::SyncState& s) {
  std::cout << "status: " << clipsync::SyncStatusText(s.status) << "\n"
            << "account: " << clipsync::AccountStatusMessage(s.account_status)
            << "\n"
            << "backend_available: " << (s.backend_available ? "yes" : "no")
            << "\n"
            << "sync_enabled: " << (s.sync_enabled ? "yes" : "no") << "\n"
            << "user_wants_sync: " << (s.user_wants_sync ? "yes" : "no")
            << "\n";
  if (s.last_sync_unix_ms) {
    std::cout << "last_sync: "
              << clipsync::platform::FormatLocalTime(*s.last_sync_unix_ms)
              << "\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  int argi = 1;
  if (argi + 1 < argc && std::string(argv[argi]) == "--config") {
    config_path = argv[argi + 1];
    argi += 2;
  }
  if (argi >= argc) {
    PrintUsage();
    return 2;
  }
  const std::string command = argv[argi++];
  const std::string arg = argi < argc ? argv[argi] : std::string();

  clipsync::ClipsyncConfig cfg;
  std::string error;
  if (!config_path.empty() &&
      !clipsync::LoadClipsyncConfig(config_path, cfg, error)) {
    LogError(error);
    return 1;
  }
  plog::SetMinLevel(cfg.log.level);

  if (command == "device-info") {
    std::cout << clipsync::SyncOrchestrator::DeviceInfo() << "\n";
    return 0;
  }

  std::unique_ptr<clipsync::CredentialStore> credentials;
  if (cfg.storage.credential_backend == clipsync::CredentialBackend::kMemory ||
      !clipsync::platform::SecureStoreSupported()) {
    if (cfg.storage.credential_backend == clipsync::CredentialBackend::kPlatform) {
      plog::Log(plog::Level::kWarn, "cli",
                "no platform credential store; key lasts for this process only");
    }
    credentials = std::make_unique<clipsync::MemoryCredentialStore>();
  } else {
    credentials = std::make_unique<clipsync::PlatformCredentialStore>();
  }
  clipsync::EncryptionService encryption(*credentials);

  const bool crypto_command = command == "encrypt" || command == "decrypt";
  if (crypto_command && arg.empty()) {
    PrintUsage();
    return 2;
  }
  if (!crypto_command && command != "status" && command != "enable" &&
      command != "disable" && command != "sync") {
    PrintUsage();
    return 2;
  }

  clipsync::TaskRunner main_runner("clipsync-main");
  clipsync::TaskRunner worker_runner("clipsync-worker", cfg.sync.worker_threads);
  if (!main_runner.Start(error) || !worker_runner.Start(error)) {
    LogError(error);
    return 1;
  }

  clipsync::FilePreferenceStore preferences(cfg.storage.preferences_path);
  clipsync::EntitlementGatedBackend backend(
      clipsync::ResolveAppIdentity(cfg.app.bundle_id), nullptr);
  NoLocalChanges store;
  clipsync::EventBus bus;
  clipsync::SyncStateMachine state;
  clipsync::SyncConfig sync_cfg = cfg.sync;
  // Encryption only comes up through the orchestrator's enable path.
  sync_cfg.resume_on_start = command == "sync" || crypto_command;

  int rc = 0;
  {
    clipsync::SyncOrchestrator orchestrator(main_runner, worker_runner, state,
                                            encryption, preferences, backend,
                                            store, bus, sync_cfg);
    orchestrator.Start();
    const auto drain_timeout = std::chrono::milliseconds(2000);
    const auto probe_wait =
        std::chrono::milliseconds(sync_cfg.probe_timeout_ms + 500);
    if (!Drain(main_runner, drain_timeout)) {
      LogError("main context did not start");
      rc = 1;
    } else if (crypto_command) {
      if (!state.Snapshot().user_wants_sync) {
        LogError("sync is not enabled; run `enable` first");
        rc = 1;
      } else if (!encryption.IsEnabled()) {
        LogError("encryption key unavailable");
        rc = 1;
      } else {
        std::cout << (command == "encrypt" ? encryption.EncryptString(arg)
                                           : encryption.DecryptString(arg))
                  << "\n";
      }
    } else if (command == "enable") {
      orchestrator.Enable();
      if (!WaitForState(state, Settled, probe_wait)) {
        LogError("enable did not settle in time");
        rc = 1;
      }
    } else if (command == "disable") {
      orchestrator.Disable();
      if (!Drain(main_runner, drain_timeout)) {
        LogError("disable not processed");
        rc = 1;
      }
    } else if (command == "sync") {
      if (!state.Snapshot().user_wants_sync) {
        LogError("sync is not enabled; run `enable` first");
        rc = 1;
      } else {
        if (!WaitForState(state, Settled, probe_wait)) {
          LogError("backend probe did not settle in time");
        }
        const bool account_known = WaitForState(
            state,
            [](const clipsync::SyncState& s) {
              return s.account_status != clipsync::AccountStatus::kUnknown ||
                     s.status.kind == clipsync::SyncStatusKind::kError;
            },
            std::chrono::milliseconds(sync_cfg.account_timeout_ms + 500));
        if (!account_known) {
          LogError("account status did not settle in time");
        }
        auto guard_promise =
            std::make_shared<std::promise<clipsync::SyncGuard>>();
        auto guard_future = guard_promise->get_future();
        orchestrator.TriggerSync([guard_promise](clipsync::SyncGuard g) {
          guard_promise->set_value(g);
        });
        if (guard_future.wait_for(drain_timeout) != std::future_status::ready) {
          LogError("sync request not processed");
          rc = 1;
        } else {
          const clipsync::SyncGuard guard = guard_future.get();
          if (guard == clipsync::SyncGuard::kOk) {
            const bool finished = WaitForState(
                state,
                [](const clipsync::SyncState& s) {
                  return s.status.kind != clipsync::SyncStatusKind::kSyncing;
                },
                std::chrono::milliseconds(sync_cfg.flush_timeout_ms +
                                          sync_cfg.propagation_grace_ms + 500));
            if (!finished ||
                state.Snapshot().status.kind != clipsync::SyncStatusKind::kSuccess) {
              rc = 1;
            }
          } else {
            LogError(std::string("sync not started: ") +
                     clipsync::SyncGuardName(guard));
            rc = 1;
          }
        }
      }
    }
    if (!crypto_command) {
      PrintState(state.Snapshot());
    }
    main_runner.Stop();
    worker_runner.Stop();
  }
  return rc;
}
