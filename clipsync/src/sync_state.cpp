#include "sync_state.h"

#include <algorithm>

#include "platform_log.h"

namespace clipsync {

namespace plog = clipsync::platform::log;

namespace {

constexpr char kLogTag[] = "sync_state";

bool SameState(const SyncState& a, const SyncState& b) {
  return a.status == b.status && a.last_sync_unix_ms == b.last_sync_unix_ms &&
         a.account_status == b.account_status &&
         a.backend_available == b.backend_available &&
         a.sync_enabled == b.sync_enabled &&
         a.user_wants_sync == b.user_wants_sync;
}

}  // namespace

const char* SyncStatusKindName(SyncStatusKind kind) {
  switch (kind) {
    case SyncStatusKind::kIdle:
      return "idle";
    case SyncStatusKind::kSyncing:
      return "syncing";
    case SyncStatusKind::kSuccess:
      return "success";
    case SyncStatusKind::kError:
      return "error";
  }
  return "idle";
}

const char* AccountStatusName(AccountStatus status) {
  switch (status) {
    case AccountStatus::kUnknown:
      return "unknown";
    case AccountStatus::kAvailable:
      return "available";
    case AccountStatus::kNoAccount:
      return "no_account";
    case AccountStatus::kRestricted:
      return "restricted";
    case AccountStatus::kTemporarilyUnavailable:
      return "temporarily_unavailable";
  }
  return "unknown";
}

std::string AccountStatusMessage(AccountStatus status) {
  switch (status) {
    case AccountStatus::kAvailable:
      return "Signed in to sync account";
    case AccountStatus::kNoAccount:
      return "No sync account - sign in to enable sync";
    case AccountStatus::kRestricted:
      return "Sync account restricted";
    case AccountStatus::kUnknown:
      return "Checking sync account status...";
    case AccountStatus::kTemporarilyUnavailable:
      return "Sync account temporarily unavailable";
  }
  return "Unknown status";
}

std::string SyncStatusText(const SyncStatus& status) {
  switch (status.kind) {
    case SyncStatusKind::kIdle:
      return "Ready to sync";
    case SyncStatusKind::kSyncing:
      return "Syncing...";
    case SyncStatusKind::kSuccess:
      return "Sync completed successfully";
    case SyncStatusKind::kError:
      return "Sync error: " + status.message;
  }
  return "Ready to sync";
}

SyncState SyncStateMachine::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

SyncStateMachine::SubscriptionId SyncStateMachine::Subscribe(
    Subscriber subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(subscriber));
  return id;
}

void SyncStateMachine::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const auto& entry) { return entry.first == id; }),
      subscribers_.end());
}

template <typename Fn>
void SyncStateMachine::Mutate(Fn&& fn) {
  SyncState snapshot;
  std::vector<std::pair<SubscriptionId, Subscriber>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    SyncState next = state_;
    fn(next);
    if (next.sync_enabled && !next.backend_available) {
      next.sync_enabled = false;
    }
    if (SameState(next, state_)) {
      return;
    }
    state_ = next;
    snapshot = state_;
    subscribers = subscribers_;
  }
  for (const auto& entry : subscribers) {
    if (entry.second) {
      entry.second(snapshot);
    }
  }
}

void SyncStateMachine::SetStatus(SyncStatus status) {
  Mutate([&status](SyncState& s) { s.status = std::move(status); });
}

void SyncStateMachine::SetAccountStatus(AccountStatus status) {
  Mutate([status](SyncState& s) { s.account_status = status; });
}

void SyncStateMachine::SetBackendAvailable(bool available) {
  Mutate([available](SyncState& s) {
    s.backend_available = available;
    if (!available) {
      s.sync_enabled = false;
    }
  });
}

bool SyncStateMachine::SetSyncEnabled(bool enabled) {
  if (enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.backend_available) {
      plog::Log(plog::Level::kWarn, kLogTag,
                "rejected sync_enabled=1 while backend unavailable");
      return false;
    }
  }
  Mutate([enabled](SyncState& s) { s.sync_enabled = enabled; });
  return true;
}

void SyncStateMachine::SetUserWantsSync(bool wants) {
  Mutate([wants](SyncState& s) { s.user_wants_sync = wants; });
}

void SyncStateMachine::MarkSyncSucceeded(std::uint64_t unix_ms) {
  Mutate([unix_ms](SyncState& s) {
    s.status = SyncStatus::Success();
    s.last_sync_unix_ms = unix_ms;
  });
}

void SyncStateMachine::ResetForDisable() {
  Mutate([](SyncState& s) {
    s.user_wants_sync = false;
    s.sync_enabled = false;
    s.status = SyncStatus::Idle();
  });
}

void SyncStateMachine::MarkAccountQueryFailed(std::string message) {
  Mutate([&message](SyncState& s) {
    s.account_status = AccountStatus::kUnknown;
    s.sync_enabled = false;
    s.backend_available = false;
    s.status = SyncStatus::Error(std::move(message));
  });
}

}  // namespace clipsync
