#pragma once

#include "taskchain/cache/cache_key.hpp"
#include "taskchain/cache/cache_store.hpp"
#include "taskchain/cache/records.hpp"
#include "taskchain/channel/channel.hpp"
#include "taskchain/core/error.hpp"
#include "taskchain/scheduler/task_queue.hpp"
#include "taskchain/task/task.hpp"
#include "taskchain/util/clock.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>

namespace taskchain {

// How one invocation ended.
enum class RunOutcome : std::uint8_t {
  PresenceLost,       // nobody listening; chain ends
  Superseded,         // a newer chain owns the identity
  FreshCacheHit,      // external trigger with a fresh cached result
  DuplicateDelivery,  // same (identity, seq_id) already running here
  RetryScheduled,     // failed; rerun submitted per backoff
  GaveUp,             // failed; backoff declined another attempt
  PublishFailed,      // succeeded but nothing received it; not cached
  Completed,          // succeeded, cached; non-polling chain ends
  Rescheduled,        // succeeded, cached; polling rerun submitted
};

[[nodiscard]] constexpr auto to_string_view(RunOutcome outcome) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {
      "presence_lost", "superseded", "fresh_cache_hit",
      "duplicate_delivery", "retry_scheduled", "gave_up",
      "publish_failed", "completed", "rescheduled"};
  return names[static_cast<std::uint8_t>(outcome)];
}

// Outcome of the execution step, consumed by the state machine.
struct StepSuccess {
  nlohmann::json payload;
};

struct StepRetry {
  Delay delay;
  std::error_code error;
};

struct StepGiveUp {
  std::error_code error;
};

using StepResult = std::variant<StepSuccess, StepRetry, StepGiveUp>;

// Runs one invocation of a cached, self-rescheduling task to completion:
// presence gate, sequence conflict check, execution, error bookkeeping,
// publish, cache write and resubmission.
//
// Domain failures never escape run(); they become backoff decisions. An
// error return means the cache store or the queue failed and the chain was
// abandoned.
class TaskRunner {
public:
  TaskRunner(ICacheStore& cache, ITaskQueue& queue, IPresenceOracle& presence,
             IResultPublisher& publisher,
             const IClock& clock = system_clock());

  TaskRunner(const TaskRunner&) = delete;
  auto operator=(const TaskRunner&) -> TaskRunner& = delete;

  [[nodiscard]] auto run(Task& task, TaskMessage msg) -> Result<RunOutcome>;

private:
  struct Chain {
    Task& task;
    TaskMessage msg;
    CacheKeys keys;
    std::string id_str;
    SeqId seq;
    std::optional<ErrorRecord> errors;
  };

  // Releases an in-flight claim on scope exit.
  class Claim {
  public:
    Claim(TaskRunner& runner, std::string token)
        : runner_(runner), token_(std::move(token)) {
    }
    ~Claim() { runner_.release(token_); }

    Claim(const Claim&) = delete;
    auto operator=(const Claim&) -> Claim& = delete;

  private:
    TaskRunner& runner_;
    std::string token_;
  };

  [[nodiscard]] auto attempt(Chain& chain) -> StepResult;
  [[nodiscard]] auto finish(Chain& chain, StepSuccess& step)
      -> Result<RunOutcome>;
  [[nodiscard]] auto finish(Chain& chain, StepRetry& step)
      -> Result<RunOutcome>;
  [[nodiscard]] auto finish(Chain& chain, StepGiveUp& step)
      -> Result<RunOutcome>;
  [[nodiscard]] auto resubmit(const Chain& chain,
                              std::chrono::milliseconds delay) -> Result<void>;

  [[nodiscard]] auto claim(const std::string& token) -> bool;
  auto release(const std::string& token) -> void;

  ICacheStore& cache_;
  ITaskQueue& queue_;
  IPresenceOracle& presence_;
  IResultPublisher& publisher_;
  const IClock& clock_;

  std::mutex in_flight_mu_;
  std::unordered_set<std::string> in_flight_;
};

}  // namespace taskchain
