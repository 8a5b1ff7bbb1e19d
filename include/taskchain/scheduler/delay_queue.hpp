#pragma once

#include "taskchain/scheduler/task_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace taskchain {

// In-process delayed task queue.
//
// A timer thread keeps submitted messages ordered by due time and sleeps in
// poll() on an eventfd until the earliest one is due or a submission wakes
// it. Due messages move to a ready list drained by a fixed pool of worker
// threads, each of which runs the dispatch callback synchronously.
class DelayQueue final : public ITaskQueue {
public:
  using SteadyClock = std::chrono::steady_clock;
  using Dispatch = std::function<void(TaskMessage)>;

  struct Options {
    std::size_t workers{4};
    std::size_t capacity{4096};
  };

  DelayQueue(Options options, Dispatch dispatch);
  ~DelayQueue() override;

  DelayQueue(const DelayQueue&) = delete;
  auto operator=(const DelayQueue&) -> DelayQueue& = delete;

  auto start() -> void;
  // Stops accepting work, lets in-flight dispatches finish and drops
  // everything still waiting.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto submit(TaskMessage msg,
                            std::chrono::milliseconds delay = {})
      -> Result<void> override;

  // Scheduled + ready + in flight.
  [[nodiscard]] auto pending() const -> std::size_t;

  // Blocks until nothing is scheduled, ready or running, or the timeout
  // expires. Returns true when idle.
  [[nodiscard]] auto wait_idle(std::chrono::milliseconds timeout) -> bool;

private:
  auto timer_loop() -> void;
  auto worker_loop() -> void;
  auto promote_due(SteadyClock::time_point now) -> void;
  auto next_due() const -> SteadyClock::time_point;
  auto notify() -> void;

  Options options_;
  Dispatch dispatch_;

  std::atomic<bool> running_{false};
  int wake_fd_{-1};

  mutable std::mutex mu_;
  std::condition_variable ready_cv_;
  std::condition_variable idle_cv_;
  std::multimap<SteadyClock::time_point, TaskMessage> schedule_;
  std::deque<TaskMessage> ready_;
  std::size_t in_flight_{0};

  std::thread timer_;
  std::vector<std::thread> workers_;
};

}  // namespace taskchain
