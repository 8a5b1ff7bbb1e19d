#pragma once

#include "taskchain/core/error.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace taskchain {

struct CommandOptions {
  std::chrono::seconds timeout{60};
  // Added to (or overriding) the inherited environment.
  std::vector<std::pair<std::string, std::string>> env;
  std::string working_dir;
};

struct CommandResult {
  int exit_code{-1};
  // stdout and stderr interleaved.
  std::string output;
  bool timed_out{false};
  std::chrono::milliseconds duration{0};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && !timed_out;
  }
};

// Runs argv synchronously in its own process group. The whole group is
// killed once the timeout passes. Fails only when the process cannot be
// started; a non-zero exit is a successful Result.
[[nodiscard]] auto run_command(const std::vector<std::string>& argv,
                               const CommandOptions& options = {})
    -> Result<CommandResult>;

// run_command({"/bin/sh", "-c", cmd}).
[[nodiscard]] auto run_shell(std::string_view cmd,
                             const CommandOptions& options = {})
    -> Result<CommandResult>;

}  // namespace taskchain
