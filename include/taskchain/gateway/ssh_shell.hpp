#pragma once

#include "taskchain/gateway/gateway.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace taskchain {

// Remote execution through the system ssh client. ssh reserves exit status
// 255 for its own failures, which become ConnectionFailed.
class SshShell final : public IRemoteShell {
public:
  SshShell(std::vector<std::string> ssh_options, std::chrono::seconds timeout);

  auto run(const UserId& user, const SshTarget& target,
           const std::string& command) -> Result<RemoteCommandResult> override;

private:
  std::vector<std::string> ssh_options_;
  std::chrono::seconds timeout_;
};

}  // namespace taskchain
