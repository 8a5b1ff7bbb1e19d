#pragma once

#include "taskchain/cache/cache_store.hpp"
#include "taskchain/core/error.hpp"
#include "taskchain/scheduler/task_queue.hpp"
#include "taskchain/task/task_registry.hpp"
#include "taskchain/util/clock.hpp"
#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace taskchain {

// Entry points used by whatever serves clients: cache-aware reads and
// external triggers. Triggers never carry a seq_id, so each one may start a
// new chain.
class TaskClient {
public:
  TaskClient(const TaskRegistry& registry, ICacheStore& cache,
             ITaskQueue& queue, const IClock& clock = system_clock());

  // Submits the task for execution now.
  [[nodiscard]] auto trigger(std::string_view task, const UserId& user,
                             nlohmann::json args,
                             nlohmann::json kwargs = nlohmann::json::object())
      -> Result<void>;

  // Returns the cached payload while it is younger than result_expires.
  // Submits the task when nothing is cached or the cached result is older
  // than result_fresh.
  [[nodiscard]] auto smart_delay(
      std::string_view task, const UserId& user, nlohmann::json args,
      nlohmann::json kwargs = nlohmann::json::object())
      -> Result<std::optional<nlohmann::json>>;

  // Drops the cached result so the next read or trigger recomputes.
  [[nodiscard]] auto clear_cache(
      std::string_view task, const UserId& user, nlohmann::json args,
      nlohmann::json kwargs = nlohmann::json::object()) -> Result<void>;

private:
  [[nodiscard]] auto make_message(std::string_view task, const UserId& user,
                                  nlohmann::json args,
                                  nlohmann::json kwargs) const -> TaskMessage;

  const TaskRegistry& registry_;
  ICacheStore& cache_;
  ITaskQueue& queue_;
  const IClock& clock_;
};

}  // namespace taskchain
