#pragma once

#include "taskchain/core/error.hpp"
#include "taskchain/task/task.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace taskchain {

struct TaskOverride {
  std::optional<std::chrono::seconds> result_fresh;
  std::optional<std::chrono::seconds> result_expires;
  std::optional<bool> polling;
};

// Static table of tasks and jobs keyed by name. Filled once at start-up;
// read-only afterwards.
class TaskRegistry {
public:
  [[nodiscard]] auto add(std::unique_ptr<Task> task) -> Result<void>;
  [[nodiscard]] auto add(std::unique_ptr<Job> job) -> Result<void>;

  [[nodiscard]] auto find_task(std::string_view name) const -> Task*;
  [[nodiscard]] auto find_job(std::string_view name) const -> Job*;

  [[nodiscard]] auto task_names() const -> std::vector<std::string>;
  [[nodiscard]] auto job_names() const -> std::vector<std::string>;

  // Fails with NotFound for an override naming an unknown task, and with
  // InvalidArgument when a polling task would end up with result_fresh < 1s.
  [[nodiscard]] auto apply_overrides(
      const std::map<std::string, TaskOverride>& overrides) -> Result<void>;

private:
  [[nodiscard]] auto taken(std::string_view name) const -> bool;

  std::unordered_map<std::string, std::unique_ptr<Task>, StringHash,
                     StringEqual>
      tasks_;
  std::unordered_map<std::string, std::unique_ptr<Job>, StringHash,
                     StringEqual>
      jobs_;
};

}  // namespace taskchain
