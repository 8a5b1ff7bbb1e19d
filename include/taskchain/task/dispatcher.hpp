#pragma once

#include "taskchain/scheduler/task_message.hpp"
#include "taskchain/task/task_registry.hpp"
#include "taskchain/task/task_runner.hpp"

namespace taskchain {

// Queue consumer: routes a delivered message to the runner (cached tasks) or
// straight to the job (plain jobs). Always returns normally.
class TaskDispatcher {
public:
  TaskDispatcher(const TaskRegistry& registry, TaskRunner& runner);

  auto dispatch(TaskMessage msg) -> void;

private:
  const TaskRegistry& registry_;
  TaskRunner& runner_;
};

}  // namespace taskchain
