#pragma once

#include "taskchain/channel/channel.hpp"
#include "taskchain/config/system_config.hpp"
#include "taskchain/gateway/gateway.hpp"
#include "taskchain/scheduler/task_queue.hpp"
#include "taskchain/task/task.hpp"
#include "taskchain/task/task_registry.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace taskchain {

// kwargs counter carried between attempts of post_deploy_steps.
inline constexpr const char* kRetriesField = "retries";

// Runs a deployment script on a freshly created machine.
//
// args:   [backend_id, machine_id, command]
// kwargs: monitoring (bool), username, port, key_path
//
// Retries on transient errors and while the machine has no public IPv4
// address, up to max_retries times. The final outcome always reaches the
// user and the admin channel.
class PostDeployJob final : public Job {
public:
  PostDeployJob(ICloudGateway& gateway, IRemoteShell& shell,
                INotifier& notifier, ITaskQueue& queue, DeployConfig config,
                std::string default_ssh_user = "root");

  [[nodiscard]] auto name() const -> std::string_view override {
    return "post_deploy_steps";
  }
  auto run(const TaskMessage& msg) -> Result<void> override;

private:
  struct Machine {
    std::string id;
    std::string name;
    std::string host;
  };

  [[nodiscard]] auto locate(const UserId& user, const BackendId& backend,
                            const MachineId& machine)
      -> Result<std::optional<Machine>>;
  [[nodiscard]] auto retry(const TaskMessage& msg, std::chrono::seconds delay,
                           const std::error_code& error) -> Result<void>;
  auto report_exhausted(const TaskMessage& msg, const std::error_code& error)
      -> void;

  ICloudGateway& gateway_;
  IRemoteShell& shell_;
  INotifier& notifier_;
  ITaskQueue& queue_;
  DeployConfig config_;
  std::string default_ssh_user_;
};

// Runs one command over SSH and tells the user when it fails.
//
// args:   [backend_id, machine_id, host, command]
// kwargs: username, port, key_path
class SshCommandJob final : public Job {
public:
  SshCommandJob(IRemoteShell& shell, INotifier& notifier,
                std::string default_ssh_user = "root");

  [[nodiscard]] auto name() const -> std::string_view override {
    return "ssh_command";
  }
  auto run(const TaskMessage& msg) -> Result<void> override;

private:
  IRemoteShell& shell_;
  INotifier& notifier_;
  std::string default_ssh_user_;
};

[[nodiscard]] auto register_deploy_jobs(TaskRegistry& registry,
                                        ICloudGateway& gateway,
                                        IRemoteShell& shell,
                                        INotifier& notifier, ITaskQueue& queue,
                                        const DeployConfig& config,
                                        const std::string& default_ssh_user)
    -> Result<void>;

}  // namespace taskchain
