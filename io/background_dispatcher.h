#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace agentfw {

struct BackgroundTask {
  std::string name;
  std::function<void()> run;
};

// Fire-and-forget executor for side effects (audit writes, alert delivery).
// Dispatch never blocks the caller: a full queue drops the task. Exceptions
// escaping a task are logged and discarded in the worker.
class BackgroundDispatcher {
 public:
  explicit BackgroundDispatcher(std::size_t workers = 2,
                                std::size_t max_queue_depth = 1024);
  ~BackgroundDispatcher();

  BackgroundDispatcher(const BackgroundDispatcher&) = delete;
  BackgroundDispatcher& operator=(const BackgroundDispatcher&) = delete;

  void Start();
  // Runs every task already queued, then joins the workers.
  void Stop();

  // Returns false when the task was dropped (queue full or stopped).
  bool Dispatch(BackgroundTask task);

  // Blocks until the queue is empty and no task is running. Tests only.
  void WaitIdle();

  std::size_t Dropped() const;
  std::size_t Failed() const;

 private:
  void Worker();

  std::vector<std::thread> workers_;
  std::queue<BackgroundTask> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool running_{false};
  bool stop_{false};
  std::size_t in_flight_{0};
  std::size_t preferred_workers_{2};
  std::size_t max_queue_depth_{1024};
  std::size_t dropped_{0};
  std::size_t failed_{0};
};

}  // namespace agentfw
