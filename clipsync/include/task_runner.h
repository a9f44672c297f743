#ifndef CLIPSYNC_TASK_RUNNER_H
#define CLIPSYNC_TASK_RUNNER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace clipsync {

// Executes posted closures on its own thread(s). With one thread, tasks run
// strictly in due-time order, then FIFO; this is the "main" context that owns
// sync state. With several threads it is a plain worker pool.
class TaskRunner {
 public:
  using Task = std::function<void()>;

  explicit TaskRunner(std::string name, std::size_t thread_count = 1);
  ~TaskRunner();

  TaskRunner(const TaskRunner&) = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;

  bool Start(std::string& error);
  // Joins the threads. Tasks not yet started are discarded; a running task
  // finishes first.
  void Stop();

  // Return false once the runner is stopped.
  bool Post(Task task);
  bool PostDelayed(Task task, std::chrono::milliseconds delay);

  // Waits until no task is queued, delayed or running. Returns false on
  // timeout.
  bool WaitForIdle(std::chrono::milliseconds timeout);

  const std::string& name() const { return name_; }

 private:
  struct PendingTask {
    std::chrono::steady_clock::time_point due;
    std::uint64_t seq;
    Task task;
  };
  struct LaterFirst {
    bool operator()(const PendingTask& a, const PendingTask& b) const {
      if (a.due != b.due) {
        return a.due > b.due;
      }
      return a.seq > b.seq;
    }
  };

  void Run();

  const std::string name_;
  const std::size_t thread_count_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::priority_queue<PendingTask, std::vector<PendingTask>, LaterFirst> queue_;
  std::vector<std::thread> threads_;
  std::uint64_t next_seq_{0};
  std::size_t running_tasks_{0};
  bool started_{false};
  bool stopping_{false};
};

}  // namespace clipsync

#endif  // CLIPSYNC_TASK_RUNNER_H
