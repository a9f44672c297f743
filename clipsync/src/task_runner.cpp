#include "task_runner.h"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

#include "platform_log.h"

namespace clipsync {

namespace plog = clipsync::platform::log;

TaskRunner::TaskRunner(std::string name, std::size_t thread_count)
    : name_(std::move(name)), thread_count_(std::max<std::size_t>(1, thread_count)) {}

TaskRunner::~TaskRunner() { Stop(); }

bool TaskRunner::Start(std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  if (started_) {
    return true;
  }
  if (stopping_) {
    error = name_ + ": runner already stopped";
    return false;
  }
  try {
    for (std::size_t i = 0; i < thread_count_; ++i) {
      threads_.emplace_back(&TaskRunner::Run, this);
    }
  } catch (const std::system_error& ex) {
    error = name_ + ": thread start failed: " + ex.what();
    stopping_ = true;
    cv_.notify_all();
    return false;
  }
  started_ = true;
  return true;
}

void TaskRunner::Stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    threads.swap(threads_);
  }
  cv_.notify_all();
  for (auto& t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }
  std::lock_guard<std::mutex> lock(mutex_);
  while (!queue_.empty()) {
    queue_.pop();
  }
  idle_cv_.notify_all();
}

bool TaskRunner::Post(Task task) {
  return PostDelayed(std::move(task), std::chrono::milliseconds(0));
}

bool TaskRunner::PostDelayed(Task task, std::chrono::milliseconds delay) {
  if (!task) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return false;
    }
    const auto due = std::chrono::steady_clock::now() +
                     std::max(delay, std::chrono::milliseconds(0));
    queue_.push(PendingTask{due, next_seq_++, std::move(task)});
  }
  cv_.notify_all();
  return true;
}

bool TaskRunner::WaitForIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return queue_.empty() && running_tasks_ == 0;
  });
}

void TaskRunner::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (queue_.empty()) {
      cv_.wait(lock);
      continue;
    }
    const auto due = queue_.top().due;
    if (due > std::chrono::steady_clock::now()) {
      cv_.wait_until(lock, due);
      continue;
    }
    Task task = queue_.top().task;
    queue_.pop();
    ++running_tasks_;
    lock.unlock();
    try {
      task();
    } catch (const std::exception& ex) {
      plog::Log(plog::Level::kError, "task_runner", "task threw",
                {{"runner", name_}, {"what", ex.what()}});
    } catch (...) {
      plog::Log(plog::Level::kError, "task_runner", "task threw",
                {{"runner", name_}, {"what", "non-standard exception"}});
    }
    task = nullptr;
    lock.lock();
    --running_tasks_;
    if (queue_.empty() && running_tasks_ == 0) {
      idle_cv_.notify_all();
    }
  }
}

}  // namespace clipsync
