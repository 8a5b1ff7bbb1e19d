#include "taskchain/tasks/deploy_jobs.hpp"

#include "taskchain/util/log.hpp"

#include <format>
#include <memory>

namespace taskchain {

namespace {

auto arg_string(const nlohmann::json& args, std::size_t i) -> std::string {
  if (!args.is_array() || args.size() <= i || !args[i].is_string()) {
    return {};
  }
  return args[i].get<std::string>();
}

auto make_target(const std::string& host, const nlohmann::json& kwargs,
                 const std::string& default_user) -> SshTarget {
  SshTarget target;
  target.host = host;
  target.username = kwargs.value("username", default_user);
  target.port = kwargs.value("port", std::uint16_t{22});
  target.key_path = kwargs.value("key_path", std::string{});
  return target;
}

auto first_ipv4(const nlohmann::json& machine) -> std::string {
  auto it = machine.find("public_ips");
  if (it == machine.end() || !it->is_array()) {
    return {};
  }
  for (const auto& ip : *it) {
    if (ip.is_string() &&
        ip.get_ref<const std::string&>().find(':') == std::string::npos) {
      return ip.get<std::string>();
    }
  }
  return {};
}

auto format_report(const std::string& command,
                   const RemoteCommandResult& result) -> std::string {
  return std::format(
      "\nCommand: {}\nReturn value: {}\nDuration: {:.2f} seconds\nOutput:\n{}",
      command, result.exit_code,
      static_cast<double>(result.duration.count()) / 1000.0, result.output);
}

}  // namespace

PostDeployJob::PostDeployJob(ICloudGateway& gateway, IRemoteShell& shell,
                             INotifier& notifier, ITaskQueue& queue,
                             DeployConfig config, std::string default_ssh_user)
    : gateway_(gateway),
      shell_(shell),
      notifier_(notifier),
      queue_(queue),
      config_(config),
      default_ssh_user_(std::move(default_ssh_user)) {
}

auto PostDeployJob::locate(const UserId& user, const BackendId& backend,
                           const MachineId& machine)
    -> Result<std::optional<Machine>> {
  auto machines = gateway_.list_machines(user, backend);
  if (!machines) {
    return std::unexpected(machines.error());
  }
  for (const auto& m : *machines) {
    if (!m.is_object() || m.value("id", std::string{}) != machine.str()) {
      continue;
    }
    auto host = first_ipv4(m);
    if (host.empty()) {
      return std::optional<Machine>{};
    }
    return std::optional<Machine>{
        Machine{machine.str(), m.value("name", machine.str()), host}};
  }
  return std::optional<Machine>{};
}

auto PostDeployJob::retry(const TaskMessage& msg, std::chrono::seconds delay,
                          const std::error_code& error) -> Result<void> {
  auto retries = msg.kwargs.value(kRetriesField, 0);
  if (retries >= config_.max_retries) {
    report_exhausted(msg, error);
    return ok();
  }

  TaskMessage next = msg;
  next.kwargs[kRetriesField] = retries + 1;
  log::info("{}: {}, retry {}/{} in {} secs", msg.describe(), error.message(),
            retries + 1, config_.max_retries, delay.count());
  if (auto r = queue_.submit(std::move(next), delay); !r) {
    log::error("{}: could not schedule retry: {}", msg.describe(),
               r.error().message());
    report_exhausted(msg, error);
    return r;
  }
  return ok();
}

auto PostDeployJob::report_exhausted(const TaskMessage& msg,
                                     const std::error_code& error) -> void {
  auto backend = arg_string(msg.args, 0);
  auto machine = arg_string(msg.args, 1);
  auto retries = msg.kwargs.value(kRetriesField, 0);
  log::error("Deployment script failed for machine {} in backend {} by user "
             "{} after {} retries: {}",
             machine, backend, msg.user, retries, error.message());
  notifier_.notify_user(
      msg.user,
      std::format("Deployment script failed for machine {} after {} retries",
                  machine, retries),
      error.message());
  notifier_.notify_admin(
      std::format("Deployment script failed for machine {} in backend {} by "
                  "user {} after {} retries",
                  machine, backend, msg.user, retries),
      error.message());
}

auto PostDeployJob::run(const TaskMessage& msg) -> Result<void> {
  BackendId backend{arg_string(msg.args, 0)};
  MachineId machine_id{arg_string(msg.args, 1)};
  auto command = arg_string(msg.args, 2);
  if (backend.empty() || machine_id.empty() || command.empty() ||
      !msg.kwargs.is_object()) {
    log::error("{}: expected [backend_id, machine_id, command]",
               msg.describe());
    return fail(Error::InvalidArgument);
  }

  auto located = locate(msg.user, backend, machine_id);
  if (!located) {
    if (is_transient(located.error())) {
      return retry(msg, std::chrono::seconds(config_.retry_delay),
                   located.error());
    }
    report_exhausted(msg, located.error());
    return ok();
  }
  if (!*located) {
    return retry(msg, std::chrono::seconds(config_.locate_delay),
                 make_error_code(Error::HostUnreachable));
  }
  const auto& machine = **located;

  if (msg.kwargs.value("monitoring", false)) {
    auto hook = gateway_.enable_monitoring(msg.user, backend, machine_id);
    if (hook) {
      command = *hook + ";" + command;
    } else {
      notifier_.notify_user(
          msg.user,
          std::format("Enable monitoring failed for machine {} ({})",
                      machine.name, machine.id),
          hook.error().message());
      notifier_.notify_admin(
          std::format("Enable monitoring on creation failed for user {} "
                      "machine {}: {}",
                      msg.user, machine.name, hook.error().message()),
          "");
    }
  }

  auto target = make_target(machine.host, msg.kwargs, default_ssh_user_);
  log::info("Running deployment script on machine {} ({}) at {}",
            machine.name, machine.id, machine.host);
  auto result = shell_.run(msg.user, target, command);
  if (!result) {
    if (is_transient(result.error())) {
      return retry(msg, std::chrono::seconds(config_.retry_delay),
                   result.error());
    }
    report_exhausted(msg, result.error());
    return ok();
  }

  auto report = format_report(command, *result);
  auto verdict = result->exit_code == 0 ? "succeeded" : "failed";
  auto subject = std::format("Deployment script {} for machine {} ({})",
                             verdict, machine.name, machine.id);
  if (result->exit_code == 0) {
    log::info("{} for user {}", subject, msg.user);
  } else {
    log::warn("{} for user {}", subject, msg.user);
  }
  notifier_.notify_user(msg.user, subject, report);
  notifier_.notify_admin(std::format("{} of user {}", subject, msg.user),
                         report);
  return ok();
}

SshCommandJob::SshCommandJob(IRemoteShell& shell, INotifier& notifier,
                             std::string default_ssh_user)
    : shell_(shell),
      notifier_(notifier),
      default_ssh_user_(std::move(default_ssh_user)) {
}

auto SshCommandJob::run(const TaskMessage& msg) -> Result<void> {
  auto machine = arg_string(msg.args, 1);
  auto host = arg_string(msg.args, 2);
  auto command = arg_string(msg.args, 3);
  if (host.empty() || command.empty() || !msg.kwargs.is_object()) {
    log::error("{}: expected [backend_id, machine_id, host, command]",
               msg.describe());
    return fail(Error::InvalidArgument);
  }

  auto subject =
      std::format("Async command failed for machine {} ({})", machine, host);
  auto result =
      shell_.run(msg.user, make_target(host, msg.kwargs, default_ssh_user_),
                 command);
  if (!result) {
    notifier_.notify_user(msg.user, subject, result.error().message());
    return std::unexpected(result.error());
  }
  if (result->exit_code != 0) {
    notifier_.notify_user(msg.user, subject, result->output);
  }
  return ok();
}

auto register_deploy_jobs(TaskRegistry& registry, ICloudGateway& gateway,
                          IRemoteShell& shell, INotifier& notifier,
                          ITaskQueue& queue, const DeployConfig& config,
                          const std::string& default_ssh_user)
    -> Result<void> {
  if (auto r = registry.add(std::make_unique<PostDeployJob>(
          gateway, shell, notifier, queue, config, default_ssh_user));
      !r) {
    return r;
  }
  return registry.add(
      std::make_unique<SshCommandJob>(shell, notifier, default_ssh_user));
}

}  // namespace taskchain
