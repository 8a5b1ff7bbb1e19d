#pragma once

#include "taskchain/core/error.hpp"
#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace taskchain {

// Cloud provider capability the catalogue tasks are written against.
// Listings return JSON arrays; probe and ping return JSON objects.
class ICloudGateway {
public:
  virtual ~ICloudGateway() = default;

  [[nodiscard]] virtual auto list_machines(const UserId& user,
                                           const BackendId& backend)
      -> Result<nlohmann::json> = 0;
  [[nodiscard]] virtual auto list_images(const UserId& user,
                                         const BackendId& backend)
      -> Result<nlohmann::json> = 0;
  [[nodiscard]] virtual auto list_sizes(const UserId& user,
                                        const BackendId& backend)
      -> Result<nlohmann::json> = 0;
  [[nodiscard]] virtual auto list_locations(const UserId& user,
                                            const BackendId& backend)
      -> Result<nlohmann::json> = 0;

  // Load and uptime of a machine, read over SSH.
  [[nodiscard]] virtual auto probe(const UserId& user,
                                   const BackendId& backend,
                                   const MachineId& machine,
                                   const std::string& host)
      -> Result<nlohmann::json> = 0;
  // Packet loss and round-trip statistics.
  [[nodiscard]] virtual auto ping(const std::string& host)
      -> Result<nlohmann::json> = 0;

  // Later calls for this backend fail with NotFound.
  [[nodiscard]] virtual auto disable_backend(const UserId& user,
                                             const BackendId& backend)
      -> Result<void> = 0;

  // Returns a shell snippet to run before a deployment script.
  [[nodiscard]] virtual auto enable_monitoring(const UserId& user,
                                               const BackendId& backend,
                                               const MachineId& machine)
      -> Result<std::string> = 0;
};

// A host handed to ssh or ping. A leading '-' would be read as an option.
[[nodiscard]] inline auto is_valid_host(std::string_view host) noexcept
    -> bool {
  return !host.empty() && host.front() != '-';
}

struct SshTarget {
  std::string host;
  std::string username;
  std::uint16_t port{22};
  std::string key_path;
};

struct RemoteCommandResult {
  int exit_code{-1};
  std::string output;
  std::chrono::milliseconds duration{0};
};

// Runs a command on a remote machine. Connection problems are errors
// (ConnectionFailed, Timeout); a command exiting non-zero is not.
class IRemoteShell {
public:
  virtual ~IRemoteShell() = default;
  [[nodiscard]] virtual auto run(const UserId& user, const SshTarget& target,
                                 const std::string& command)
      -> Result<RemoteCommandResult> = 0;
};

}  // namespace taskchain
