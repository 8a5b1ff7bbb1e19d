#include "taskchain/gateway/ssh_shell.hpp"

#include "taskchain/gateway/command_runner.hpp"
#include "taskchain/util/log.hpp"

namespace taskchain {

SshShell::SshShell(std::vector<std::string> ssh_options,
                   std::chrono::seconds timeout)
    : ssh_options_(std::move(ssh_options)), timeout_(timeout) {
}

auto SshShell::run(const UserId& user, const SshTarget& target,
                   const std::string& command)
    -> Result<RemoteCommandResult> {
  if (!is_valid_host(target.host) || command.empty()) {
    return fail(Error::InvalidArgument);
  }

  std::vector<std::string> argv{"ssh"};
  argv.insert(argv.end(), ssh_options_.begin(), ssh_options_.end());
  if (!target.key_path.empty()) {
    argv.insert(argv.end(), {"-i", target.key_path});
  }
  argv.insert(argv.end(), {"-p", std::to_string(target.port)});
  if (!target.username.empty()) {
    argv.insert(argv.end(), {"-l", target.username});
  }
  argv.insert(argv.end(), {"--", target.host});
  argv.push_back(command);

  log::debug("{}: ssh {}@{}:{}", user, target.username, target.host,
             target.port);

  CommandOptions options;
  options.timeout = timeout_;
  auto result = run_command(argv, options);
  if (!result) {
    return std::unexpected(result.error());
  }
  if (result->timed_out) {
    log::warn("{}: ssh to {} timed out after {}s", user, target.host,
              timeout_.count());
    return fail(Error::Timeout);
  }
  if (result->exit_code == 255) {
    log::warn("{}: ssh to {} failed: {}", user, target.host, result->output);
    return fail(Error::ConnectionFailed);
  }
  return ok(RemoteCommandResult{result->exit_code, std::move(result->output),
                                result->duration});
}

}  // namespace taskchain
