#pragma once

#include "taskchain/core/error.hpp"
#include "taskchain/scheduler/backoff.hpp"
#include "taskchain/scheduler/task_message.hpp"
#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <system_error>

namespace taskchain {

struct TaskSpec {
  std::string name;
  // Age after which a cached result no longer satisfies a new external
  // trigger. Also the rerun cadence of polling tasks.
  std::chrono::seconds result_fresh{0};
  // Age after which a cached result is not returned at all.
  std::chrono::seconds result_expires{0};
  bool polling{false};
};

// Upper bound on any configured duration: 30 days.
inline constexpr std::chrono::seconds kMaxConfiguredDuration{30 * 24 * 3600};

// A cached, deduplicated unit of domain work. One instance serves every
// worker thread, so execute() and backoff() must be thread-safe.
class Task {
public:
  explicit Task(TaskSpec spec) : spec_(std::move(spec)) {}
  virtual ~Task() = default;

  Task(const Task&) = delete;
  auto operator=(const Task&) -> Task& = delete;

  [[nodiscard]] auto spec() const noexcept -> const TaskSpec& { return spec_; }
  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return spec_.name;
  }

  // The only slow or failing step of a run.
  [[nodiscard]] virtual auto execute(const UserId& user,
                                     const nlohmann::json& args)
      -> Result<nlohmann::json> = 0;

  // Maps the failure history of the current chain to a retry delay. May
  // have side effects beyond scheduling. `kwargs` never holds seq_id.
  [[nodiscard]] virtual auto backoff(const std::error_code& error,
                                     FailureOffsets failures,
                                     const UserId& user,
                                     const nlohmann::json& args,
                                     const nlohmann::json& kwargs)
      -> BackoffDecision {
    (void)error;
    (void)user;
    (void)args;
    (void)kwargs;
    return default_backoff(failures);
  }

private:
  friend class TaskRegistry;
  TaskSpec spec_;
};

// A plain queued job outside the cache/chain machinery, dispatched by name.
class Job {
public:
  virtual ~Job() = default;

  [[nodiscard]] virtual auto name() const -> std::string_view = 0;
  [[nodiscard]] virtual auto run(const TaskMessage& msg) -> Result<void> = 0;
};

}  // namespace taskchain
