#pragma once

#include "taskchain/core/error.hpp"
#include "taskchain/scheduler/task_message.hpp"

#include <chrono>

namespace taskchain {

// Delivery is at-least-once and unordered: a message runs no earlier than
// `delay` after submission.
class ITaskQueue {
public:
  virtual ~ITaskQueue() = default;

  [[nodiscard]] virtual auto submit(TaskMessage msg,
                                    std::chrono::milliseconds delay = {})
      -> Result<void> = 0;
};

}  // namespace taskchain
