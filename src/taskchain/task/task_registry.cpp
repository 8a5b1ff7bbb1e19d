#include "taskchain/task/task_registry.hpp"

#include "taskchain/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace taskchain {

auto TaskRegistry::taken(std::string_view name) const -> bool {
  return tasks_.find(name) != tasks_.end() || jobs_.find(name) != jobs_.end();
}

auto TaskRegistry::add(std::unique_ptr<Task> task) -> Result<void> {
  if (!task || task->name().empty()) {
    return fail(Error::InvalidArgument);
  }
  if (taken(task->name())) {
    log::error("Task name {} registered twice", task->name());
    return fail(Error::InvalidArgument);
  }
  auto name = task->name();
  tasks_.emplace(std::move(name), std::move(task));
  return ok();
}

auto TaskRegistry::add(std::unique_ptr<Job> job) -> Result<void> {
  if (!job || job->name().empty()) {
    return fail(Error::InvalidArgument);
  }
  if (taken(job->name())) {
    log::error("Job name {} registered twice", job->name());
    return fail(Error::InvalidArgument);
  }
  std::string name{job->name()};
  jobs_.emplace(std::move(name), std::move(job));
  return ok();
}

auto TaskRegistry::find_task(std::string_view name) const -> Task* {
  auto it = tasks_.find(name);
  return it != tasks_.end() ? it->second.get() : nullptr;
}

auto TaskRegistry::find_job(std::string_view name) const -> Job* {
  auto it = jobs_.find(name);
  return it != jobs_.end() ? it->second.get() : nullptr;
}

auto TaskRegistry::task_names() const -> std::vector<std::string> {
  auto names = tasks_ | std::views::keys | std::ranges::to<std::vector>();
  std::ranges::sort(names);
  return names;
}

auto TaskRegistry::job_names() const -> std::vector<std::string> {
  auto names = jobs_ | std::views::keys | std::ranges::to<std::vector>();
  std::ranges::sort(names);
  return names;
}

auto TaskRegistry::apply_overrides(
    const std::map<std::string, TaskOverride>& overrides) -> Result<void> {
  for (const auto& [name, o] : overrides) {
    auto* task = find_task(name);
    if (!task) {
      log::error("Override for unknown task {}", name);
      return fail(Error::NotFound);
    }
    auto spec = task->spec_;
    if (o.result_fresh)
      spec.result_fresh = *o.result_fresh;
    if (o.result_expires)
      spec.result_expires = *o.result_expires;
    if (o.polling)
      spec.polling = *o.polling;
    if (spec.polling && spec.result_fresh < std::chrono::seconds{1}) {
      log::error("Task {}: polling needs result_fresh of at least 1s", name);
      return fail(Error::InvalidArgument);
    }
    task->spec_ = spec;
    log::info("Task {}: fresh={}s expires={}s polling={}", name,
              spec.result_fresh.count(), spec.result_expires.count(),
              spec.polling);
  }
  return ok();
}

}  // namespace taskchain
