#ifndef CLIPSYNC_TESTS_TEST_SUPPORT_H
#define CLIPSYNC_TESTS_TEST_SUPPORT_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "store_controller.h"
#include "sync_backend.h"
#include "sync_state.h"
#include "task_runner.h"

namespace clipsync::testing {

inline std::filesystem::path TempDir(const std::string& name) {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec) / name;
  if (ec) {
    dir = std::filesystem::path{"."} / name;
  }
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

// Runs every task already posted to `runner`; false on timeout.
inline bool Drain(TaskRunner& runner,
                  std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (!runner.Post([done] { done->set_value(); })) {
    return false;
  }
  return future.wait_for(timeout) == std::future_status::ready;
}

inline bool WaitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

// Scriptable backend; calls arrive on worker threads.
class FakeBackend : public SyncBackend {
 public:
  void SetProbe(bool available, std::string message = {}) {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_.available = available;
    probe_.message = std::move(message);
  }
  void SetAccount(bool ok, AccountStatus status, std::string error = {}) {
    std::lock_guard<std::mutex> lock(mutex_);
    account_ok_ = ok;
    account_ = status;
    account_error_ = std::move(error);
  }
  void SetProbeDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_delay_ = delay;
  }
  void SetAccountDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    account_delay_ = delay;
  }
  void SetThrowOnProbe(bool do_throw) {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_on_probe_ = do_throw;
  }

  BackendProbe Probe() override {
    std::chrono::milliseconds delay;
    BackendProbe result;
    bool do_throw = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++probe_count_;
      delay = probe_delay_;
      result = probe_;
      do_throw = throw_on_probe_;
    }
    std::this_thread::sleep_for(delay);
    if (do_throw) {
      throw std::runtime_error("probe transport failure");
    }
    return result;
  }

  bool QueryAccountStatus(AccountStatus& out, std::string& error) override {
    std::chrono::milliseconds delay;
    bool ok = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++account_count_;
      delay = account_delay_;
      ok = account_ok_;
      out = account_;
      error = account_error_;
    }
    std::this_thread::sleep_for(delay);
    return ok;
  }

  std::size_t probe_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probe_count_;
  }
  std::size_t account_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return account_count_;
  }

 private:
  mutable std::mutex mutex_;
  BackendProbe probe_{true, {}};
  bool account_ok_{true};
  AccountStatus account_{AccountStatus::kAvailable};
  std::string account_error_;
  std::chrono::milliseconds probe_delay_{0};
  std::chrono::milliseconds account_delay_{0};
  bool throw_on_probe_{false};
  std::size_t probe_count_{0};
  std::size_t account_count_{0};
};

class FakeStoreController : public StoreController {
 public:
  void SetPending(bool pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = pending;
  }
  void SetFlushResult(bool ok, std::string error = {}) {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_ok_ = ok;
    flush_error_ = std::move(error);
  }
  void SetFlushDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_delay_ = delay;
  }
  void SetThrowOnFlush(bool do_throw) {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_on_flush_ = do_throw;
  }
  // Throws a non-std::exception value.
  void SetThrowCodeOnFlush(bool do_throw) {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_code_on_flush_ = do_throw;
  }

  bool HasPendingChanges() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
  }

  bool Flush(std::string& error) override {
    std::chrono::milliseconds delay;
    bool ok = false;
    bool do_throw = false;
    bool throw_code = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++flush_count_;
      throw_code = throw_code_on_flush_;
      delay = flush_delay_;
      ok = flush_ok_;
      error = flush_error_;
      do_throw = throw_on_flush_;
    }
    std::this_thread::sleep_for(delay);
    if (do_throw) {
      throw std::runtime_error("store write exploded");
    }
    if (throw_code) {
      throw 7;
    }
    if (ok) {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_ = false;
    }
    return ok;
  }

  std::size_t flush_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_count_;
  }

 private:
  mutable std::mutex mutex_;
  bool pending_{false};
  bool flush_ok_{true};
  std::string flush_error_;
  std::chrono::milliseconds flush_delay_{0};
  bool throw_on_flush_{false};
  bool throw_code_on_flush_{false};
  std::size_t flush_count_{0};
};

// Records every snapshot a SyncStateMachine publishes.
class StateRecorder {
 public:
  explicit StateRecorder(SyncStateMachine& state)
      : state_(state), shared_(std::make_shared<Shared>()) {
    auto shared = shared_;
    id_ = state_.Subscribe([shared](const SyncState& s) {
      std::lock_guard<std::mutex> lock(shared->mutex);
      shared->history.push_back(s);
      shared->cv.notify_all();
    });
  }
  ~StateRecorder() { state_.Unsubscribe(id_); }

  StateRecorder(const StateRecorder&) = delete;
  StateRecorder& operator=(const StateRecorder&) = delete;

  bool WaitFor(const std::function<bool(const SyncState&)>& pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    std::unique_lock<std::mutex> lock(shared_->mutex);
    return shared_->cv.wait_for(lock, timeout,
                                [&] { return pred(state_.Snapshot()); });
  }

  std::vector<SyncState> history() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->history;
  }

  std::vector<SyncStatusKind> status_kinds() const {
    std::vector<SyncStatusKind> kinds;
    for (const auto& s : history()) {
      if (kinds.empty() || kinds.back() != s.status.kind) {
        kinds.push_back(s.status.kind);
      }
    }
    return kinds;
  }

 private:
  struct Shared {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<SyncState> history;
  };

  SyncStateMachine& state_;
  std::shared_ptr<Shared> shared_;
  SyncStateMachine::SubscriptionId id_{0};
};

}  // namespace clipsync::testing

#endif  // CLIPSYNC_TESTS_TEST_SUPPORT_H
