#pragma once

#include "taskchain/config/system_config.hpp"
#include "taskchain/gateway/command_runner.hpp"
#include "taskchain/gateway/gateway.hpp"

#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace taskchain {

// Parses the summary of `ping -q`: packet counters and, when any reply
// arrived, the rtt min/avg/max/mdev line.
[[nodiscard]] auto parse_ping_output(std::string_view output)
    -> Result<nlohmann::json>;

// Parses one line of `uptime` output.
[[nodiscard]] auto parse_uptime_output(std::string_view output)
    -> Result<nlohmann::json>;

// Cloud gateway backed by operator-configured shell commands, the system
// ping binary and ssh.
class CommandCloudGateway final : public ICloudGateway {
public:
  explicit CommandCloudGateway(GatewayConfig config);

  auto list_machines(const UserId& user, const BackendId& backend)
      -> Result<nlohmann::json> override;
  auto list_images(const UserId& user, const BackendId& backend)
      -> Result<nlohmann::json> override;
  auto list_sizes(const UserId& user, const BackendId& backend)
      -> Result<nlohmann::json> override;
  auto list_locations(const UserId& user, const BackendId& backend)
      -> Result<nlohmann::json> override;

  auto probe(const UserId& user, const BackendId& backend,
             const MachineId& machine, const std::string& host)
      -> Result<nlohmann::json> override;
  auto ping(const std::string& host) -> Result<nlohmann::json> override;

  auto disable_backend(const UserId& user, const BackendId& backend)
      -> Result<void> override;
  auto enable_monitoring(const UserId& user, const BackendId& backend,
                         const MachineId& machine)
      -> Result<std::string> override;

  [[nodiscard]] auto is_disabled(const UserId& user,
                                 const BackendId& backend) const -> bool;

private:
  // Resolves the configured command for a backend and runs it, returning
  // its stdout.
  [[nodiscard]] auto run_backend_command(
      const UserId& user, const BackendId& backend, const MachineId& machine,
      std::string BackendCommands::* which, std::string_view what)
      -> Result<std::string>;
  [[nodiscard]] auto list(const UserId& user, const BackendId& backend,
                          std::string BackendCommands::* which,
                          std::string_view what) -> Result<nlohmann::json>;

  GatewayConfig config_;

  mutable std::mutex mu_;
  std::set<std::pair<std::string, std::string>> disabled_;
};

}  // namespace taskchain
