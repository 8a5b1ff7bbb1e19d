#include "taskchain/task/dispatcher.hpp"

#include "taskchain/util/log.hpp"

namespace taskchain {

TaskDispatcher::TaskDispatcher(const TaskRegistry& registry,
                               TaskRunner& runner)
    : registry_(registry), runner_(runner) {
}

auto TaskDispatcher::dispatch(TaskMessage msg) -> void {
  if (auto* task = registry_.find_task(msg.task)) {
    auto id = msg.describe();
    auto outcome = runner_.run(*task, std::move(msg));
    if (!outcome) {
      log::error("{}: invocation aborted: {}", id, outcome.error().message());
      return;
    }
    log::debug("{}: {}", id, to_string_view(*outcome));
    return;
  }

  if (auto* job = registry_.find_job(msg.task)) {
    if (auto r = job->run(msg); !r) {
      log::error("{}: job failed: {}", msg.describe(), r.error().message());
    }
    return;
  }

  log::error("No task or job named {}, dropping message", msg.task);
}

}  // namespace taskchain
