#include "io/background_dispatcher.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <exception>

namespace agentfw {

BackgroundDispatcher::BackgroundDispatcher(std::size_t workers,
                                           std::size_t max_queue_depth)
    : preferred_workers_(workers == 0 ? 1 : workers),
      max_queue_depth_(max_queue_depth == 0 ? 1 : max_queue_depth) {}

BackgroundDispatcher::~BackgroundDispatcher() { Stop(); }

void BackgroundDispatcher::Start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }
    stop_ = false;
    running_ = true;
  }
  for (std::size_t i = 0; i < preferred_workers_; ++i) {
    workers_.emplace_back(&BackgroundDispatcher::Worker, this);
  }
}

void BackgroundDispatcher::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stop_ = true;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

bool BackgroundDispatcher::Dispatch(BackgroundTask task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_ || !running_ || tasks_.size() >= max_queue_depth_) {
      ++dropped_;
      GlobalMetrics().RecordDroppedTask();
      log::Warn("dispatch", "background task dropped", "task=" + task.name);
      return false;
    }
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void BackgroundDispatcher::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [&] { return tasks_.empty() && in_flight_ == 0; });
}

std::size_t BackgroundDispatcher::Dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::size_t BackgroundDispatcher::Failed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_;
}

void BackgroundDispatcher::Worker() {
  while (true) {
    BackgroundTask task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
      ++in_flight_;
    }
    bool ok = true;
    try {
      if (task.run) {
        task.run();
      }
    } catch (const std::exception &ex) {
      ok = false;
      log::Warn("dispatch", "background task failed",
                "task=" + task.name + " error=" + ex.what());
    } catch (...) {
      ok = false;
      log::Warn("dispatch", "background task failed", "task=" + task.name +
                                                          " error=unknown");
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!ok) {
        ++failed_;
      }
      --in_flight_;
    }
    idle_cv_.notify_all();
  }
}

} // namespace agentfw
