#include "taskchain/scheduler/delay_queue.hpp"

#include "taskchain/util/log.hpp"

#include <sys/eventfd.h>

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace taskchain {

namespace {

constexpr int kIdlePollMs = 60000;
// Longer delays are clamped so the due time cannot overflow.
constexpr std::chrono::milliseconds kMaxDelay = std::chrono::hours(24 * 30);

}  // namespace

DelayQueue::DelayQueue(Options options, Dispatch dispatch)
    : options_(options), dispatch_(std::move(dispatch)) {
  if (options_.workers == 0) {
    options_.workers = 1;
  }
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd: {}", std::strerror(errno));
  }
}

DelayQueue::~DelayQueue() {
  stop();
  if (wake_fd_ >= 0) {
    close(wake_fd_);
    wake_fd_ = -1;
  }
}

auto DelayQueue::start() -> void {
  if (running_.exchange(true))
    return;

  timer_ = std::thread([this] { timer_loop(); });
  workers_.reserve(options_.workers);
  for (std::size_t i = 0; i < options_.workers; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
  log::info("Delay queue started with {} workers", options_.workers);
}

auto DelayQueue::stop() -> void {
  {
    std::lock_guard lock(mu_);
    if (!running_.exchange(false))
      return;
  }
  notify();
  ready_cv_.notify_all();

  if (timer_.joinable()) {
    timer_.join();
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  std::size_t dropped = 0;
  {
    std::lock_guard lock(mu_);
    dropped = schedule_.size() + ready_.size();
    schedule_.clear();
    ready_.clear();
  }
  idle_cv_.notify_all();
  if (dropped > 0) {
    log::warn("Delay queue stopped, dropped {} pending messages", dropped);
  }
  log::info("Delay queue stopped");
}

auto DelayQueue::submit(TaskMessage msg, std::chrono::milliseconds delay)
    -> Result<void> {
  {
    std::lock_guard lock(mu_);
    if (!running_.load(std::memory_order_acquire)) {
      return fail(Error::QueueStopped);
    }
    if (schedule_.size() + ready_.size() >= options_.capacity) {
      log::warn("Delay queue full, rejecting {}", msg.task);
      return fail(Error::QueueFull);
    }

    delay = std::clamp(delay, std::chrono::milliseconds{0}, kMaxDelay);
    if (delay.count() == 0) {
      ready_.push_back(std::move(msg));
      ready_cv_.notify_one();
      return ok();
    }
    schedule_.emplace(SteadyClock::now() + delay, std::move(msg));
  }
  notify();
  return ok();
}

auto DelayQueue::pending() const -> std::size_t {
  std::lock_guard lock(mu_);
  return schedule_.size() + ready_.size() + in_flight_;
}

auto DelayQueue::wait_idle(std::chrono::milliseconds timeout) -> bool {
  std::unique_lock lock(mu_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return schedule_.empty() && ready_.empty() && in_flight_ == 0;
  });
}

auto DelayQueue::timer_loop() -> void {
  pollfd pfd{wake_fd_, POLLIN, 0};

  while (running_.load(std::memory_order_relaxed)) {
    auto now = SteadyClock::now();
    SteadyClock::time_point next_time;
    {
      std::lock_guard lock(mu_);
      promote_due(now);
      next_time = next_due();
    }

    int timeout_ms = kIdlePollMs;
    if (next_time != SteadyClock::time_point::max()) {
      auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
          next_time - now);
      // Round up so a message is never promoted before its due time.
      timeout_ms = static_cast<int>(std::clamp<std::int64_t>(
          delay.count() + 1, 0, kIdlePollMs));
    }

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      break;
    }

    // Drain eventfd
    std::uint64_t val;
    while (::read(wake_fd_, &val, sizeof(val)) > 0) {
    }
  }
}

auto DelayQueue::promote_due(SteadyClock::time_point now) -> void {
  bool promoted = false;
  while (!schedule_.empty()) {
    auto it = schedule_.begin();
    if (it->first > now)
      break;
    ready_.push_back(std::move(it->second));
    schedule_.erase(it);
    promoted = true;
  }
  if (promoted) {
    ready_cv_.notify_all();
  }
}

auto DelayQueue::next_due() const -> SteadyClock::time_point {
  return schedule_.empty() ? SteadyClock::time_point::max()
                           : schedule_.begin()->first;
}

auto DelayQueue::worker_loop() -> void {
  while (true) {
    TaskMessage msg;
    {
      std::unique_lock lock(mu_);
      ready_cv_.wait(lock, [this] {
        return !ready_.empty() || !running_.load(std::memory_order_acquire);
      });
      if (!running_.load(std::memory_order_acquire)) {
        return;
      }
      msg = std::move(ready_.front());
      ready_.pop_front();
      ++in_flight_;
    }

    auto task_name = msg.task;
    try {
      dispatch_(std::move(msg));
    } catch (const std::exception& e) {
      log::error("Dispatch of {} threw: {}", task_name, e.what());
    }

    {
      std::lock_guard lock(mu_);
      --in_flight_;
      if (schedule_.empty() && ready_.empty() && in_flight_ == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

auto DelayQueue::notify() -> void {
  if (wake_fd_ < 0) {
    return;
  }
  std::uint64_t val = 1;
  if (write(wake_fd_, &val, sizeof(val)) < 0) {
    log::warn("Failed to write to eventfd: {}", std::strerror(errno));
  }
}

}  // namespace taskchain
