#ifndef CLIPSYNC_SYNC_STATE_H
#define CLIPSYNC_SYNC_STATE_H

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clipsync {

enum class SyncStatusKind : std::uint8_t {
  kIdle = 0,
  kSyncing = 1,
  kSuccess = 2,
  kError = 3
};

struct SyncStatus {
  SyncStatusKind kind{SyncStatusKind::kIdle};
  std::string message;  // only set for kError

  static SyncStatus Idle() { return {}; }
  static SyncStatus Syncing() { return {SyncStatusKind::kSyncing, {}}; }
  static SyncStatus Success() { return {SyncStatusKind::kSuccess, {}}; }
  static SyncStatus Error(std::string msg) {
    return {SyncStatusKind::kError, std::move(msg)};
  }

  bool operator==(const SyncStatus& other) const {
    return kind == other.kind && message == other.message;
  }
  bool operator!=(const SyncStatus& other) const { return !(*this == other); }
};

enum class AccountStatus : std::uint8_t {
  kUnknown = 0,
  kAvailable = 1,
  kNoAccount = 2,
  kRestricted = 3,
  kTemporarilyUnavailable = 4
};

struct SyncState {
  SyncStatus status;
  std::optional<std::uint64_t> last_sync_unix_ms;
  AccountStatus account_status{AccountStatus::kUnknown};
  bool backend_available{false};
  bool sync_enabled{false};
  bool user_wants_sync{false};
};

const char* SyncStatusKindName(SyncStatusKind kind);
const char* AccountStatusName(AccountStatus status);
// Text shown to the user for an account status.
std::string AccountStatusMessage(AccountStatus status);
std::string SyncStatusText(const SyncStatus& status);

// Observable holder of the process-wide SyncState.
//
// Every mutator that changes a field notifies each subscriber once with the
// new snapshot. The invariant sync_enabled => backend_available is enforced:
// SetSyncEnabled(true) is rejected while the backend is unavailable, and
// SetBackendAvailable(false) also clears sync_enabled.
//
// Mutators are meant to be called from a single context. Subscribers run on
// that context, synchronously, after the change is applied.
class SyncStateMachine {
 public:
  using Subscriber = std::function<void(const SyncState&)>;
  using SubscriptionId = std::uint64_t;

  SyncStateMachine() = default;
  explicit SyncStateMachine(SyncState initial) : state_(std::move(initial)) {}

  SyncStateMachine(const SyncStateMachine&) = delete;
  SyncStateMachine& operator=(const SyncStateMachine&) = delete;

  SyncState Snapshot() const;

  SubscriptionId Subscribe(Subscriber subscriber);
  void Unsubscribe(SubscriptionId id);

  void SetStatus(SyncStatus status);
  void SetAccountStatus(AccountStatus status);
  void SetBackendAvailable(bool available);
  bool SetSyncEnabled(bool enabled);
  void SetUserWantsSync(bool wants);
  void MarkSyncSucceeded(std::uint64_t unix_ms);

  // Disable path: one notification for the combined change.
  void ResetForDisable();
  // Account query failure: one notification for the combined change.
  void MarkAccountQueryFailed(std::string message);

 private:
  template <typename Fn>
  void Mutate(Fn&& fn);

  mutable std::mutex mutex_;
  SyncState state_;
  std::vector<std::pair<SubscriptionId, Subscriber>> subscribers_;
  SubscriptionId next_id_{1};
};

}  // namespace clipsync

#endif  // CLIPSYNC_SYNC_STATE_H
