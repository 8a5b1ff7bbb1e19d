#include "taskchain/gateway/command_gateway.hpp"

#include "taskchain/util/log.hpp"

#include <charconv>
#include <regex>

namespace taskchain {

namespace {

auto to_double(const std::string& s) -> double {
  double value = 0.0;
  std::from_chars(s.data(), s.data() + s.size(), value);
  return value;
}

auto to_int(const std::string& s) -> int {
  int value = 0;
  std::from_chars(s.data(), s.data() + s.size(), value);
  return value;
}

auto tail(std::string_view output, std::size_t max = 512) -> std::string_view {
  return output.size() > max ? output.substr(output.size() - max) : output;
}

}  // namespace

auto parse_ping_output(std::string_view output) -> Result<nlohmann::json> {
  static const std::regex packets_re(
      R"((\d+) packets transmitted, (\d+) (?:packets )?received.*?([\d.]+)% packet loss)");
  static const std::regex rtt_re(
      R"((?:rtt|round-trip) min/avg/max/(?:mdev|stddev) = ([\d.]+)/([\d.]+)/([\d.]+)/([\d.]+))");

  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(output.begin(), output.end(), match, packets_re)) {
    return fail(Error::ParseError);
  }

  nlohmann::json result{{"packets_tx", to_int(match[1].str())},
                        {"packets_rx", to_int(match[2].str())},
                        {"packets_loss", to_double(match[3].str())}};

  if (std::regex_search(output.begin(), output.end(), match, rtt_re)) {
    result["rtt_min"] = to_double(match[1].str());
    result["rtt_avg"] = to_double(match[2].str());
    result["rtt_max"] = to_double(match[3].str());
    result["rtt_std"] = to_double(match[4].str());
  }
  return ok(std::move(result));
}

auto parse_uptime_output(std::string_view output) -> Result<nlohmann::json> {
  static const std::regex load_re(
      R"(load averages?:\s*([\d.]+),?\s+([\d.]+),?\s+([\d.]+))");
  static const std::regex up_re(R"(up\s+(.*?),\s+(\d+)\s+users?)");

  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(output.begin(), output.end(), match, load_re)) {
    return fail(Error::ParseError);
  }

  nlohmann::json result{{"loadavg",
                         {to_double(match[1].str()), to_double(match[2].str()),
                          to_double(match[3].str())}}};

  if (std::regex_search(output.begin(), output.end(), match, up_re)) {
    result["uptime"] = match[1].str();
    result["users"] = to_int(match[2].str());
  }
  return ok(std::move(result));
}

CommandCloudGateway::CommandCloudGateway(GatewayConfig config)
    : config_(std::move(config)) {
}

auto CommandCloudGateway::is_disabled(const UserId& user,
                                      const BackendId& backend) const -> bool {
  std::lock_guard lock(mu_);
  return disabled_.contains({user.str(), backend.str()});
}

auto CommandCloudGateway::run_backend_command(
    const UserId& user, const BackendId& backend, const MachineId& machine,
    std::string BackendCommands::* which, std::string_view what)
    -> Result<std::string> {
  if (is_disabled(user, backend)) {
    log::debug("Backend {} is disabled for {}", backend, user);
    return fail(Error::NotFound);
  }

  auto it = config_.backends.find(backend.str());
  if (it == config_.backends.end()) {
    log::warn("Unknown backend {}", backend);
    return fail(Error::NotFound);
  }
  const auto& command = it->second.*which;
  if (command.empty()) {
    log::warn("Backend {} has no {} command", backend, what);
    return fail(Error::NotFound);
  }

  CommandOptions options;
  options.timeout = std::chrono::seconds(config_.command_timeout);
  options.env = {{"TASKCHAIN_USER", user.str()},
                 {"TASKCHAIN_BACKEND", backend.str()},
                 {"TASKCHAIN_MACHINE", machine.str()}};

  auto result = run_shell(command, options);
  if (!result) {
    return std::unexpected(result.error());
  }
  if (result->timed_out) {
    log::warn("{} for backend {} timed out", what, backend);
    return fail(Error::Timeout);
  }
  if (result->exit_code != 0) {
    log::warn("{} for backend {} exited with {}: {}", what, backend,
              result->exit_code, tail(result->output));
    return fail(Error::ProviderError);
  }
  return ok(std::move(result->output));
}

auto CommandCloudGateway::list(const UserId& user, const BackendId& backend,
                               std::string BackendCommands::* which,
                               std::string_view what)
    -> Result<nlohmann::json> {
  auto output = run_backend_command(user, backend, MachineId{}, which, what);
  if (!output) {
    return std::unexpected(output.error());
  }
  auto parsed = nlohmann::json::parse(*output, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    log::warn("{} for backend {} did not print a JSON array", what, backend);
    return fail(Error::ProviderError);
  }
  return ok(std::move(parsed));
}

auto CommandCloudGateway::list_machines(const UserId& user,
                                        const BackendId& backend)
    -> Result<nlohmann::json> {
  return list(user, backend, &BackendCommands::list_machines, "list_machines");
}

auto CommandCloudGateway::list_images(const UserId& user,
                                      const BackendId& backend)
    -> Result<nlohmann::json> {
  return list(user, backend, &BackendCommands::list_images, "list_images");
}

auto CommandCloudGateway::list_sizes(const UserId& user,
                                     const BackendId& backend)
    -> Result<nlohmann::json> {
  return list(user, backend, &BackendCommands::list_sizes, "list_sizes");
}

auto CommandCloudGateway::list_locations(const UserId& user,
                                         const BackendId& backend)
    -> Result<nlohmann::json> {
  return list(user, backend, &BackendCommands::list_locations,
              "list_locations");
}

auto CommandCloudGateway::probe(const UserId& user, const BackendId& backend,
                                const MachineId& machine,
                                const std::string& host)
    -> Result<nlohmann::json> {
  if (!is_valid_host(host)) {
    return fail(Error::InvalidArgument);
  }

  std::vector<std::string> argv{"ssh"};
  argv.insert(argv.end(), config_.ssh_options.begin(),
              config_.ssh_options.end());
  argv.insert(argv.end(), {"-p", std::to_string(config_.ssh_port), "-l",
                           config_.ssh_user, "--", host, "uptime"});

  CommandOptions options;
  options.timeout = std::chrono::seconds(config_.command_timeout);
  auto result = run_command(argv, options);
  if (!result) {
    return std::unexpected(result.error());
  }
  if (result->timed_out) {
    return fail(Error::Timeout);
  }
  if (result->exit_code == 255) {
    log::debug("probe {}/{} ({}) for {}: ssh connection failed", backend,
               machine, host, user);
    return fail(Error::ConnectionFailed);
  }
  if (result->exit_code != 0) {
    return fail(Error::CommandFailed);
  }
  return parse_uptime_output(result->output);
}

auto CommandCloudGateway::ping(const std::string& host)
    -> Result<nlohmann::json> {
  if (!is_valid_host(host)) {
    return fail(Error::InvalidArgument);
  }

  CommandOptions options;
  options.timeout = std::chrono::seconds(config_.command_timeout);
  auto result = run_command(
      {"ping", "-c", std::to_string(config_.ping_count), "-n", "-q", host},
      options);
  if (!result) {
    return std::unexpected(result.error());
  }
  if (result->timed_out) {
    return fail(Error::Timeout);
  }

  // ping exits 1 when no reply arrived; the summary is still meaningful.
  auto parsed = parse_ping_output(result->output);
  if (!parsed) {
    log::debug("ping {} exited with {}: {}", host, result->exit_code,
               tail(result->output));
    return fail(Error::HostUnreachable);
  }
  return parsed;
}

auto CommandCloudGateway::disable_backend(const UserId& user,
                                          const BackendId& backend)
    -> Result<void> {
  std::lock_guard lock(mu_);
  if (disabled_.emplace(user.str(), backend.str()).second) {
    log::warn("Disabled backend {} for {}", backend, user);
  }
  return ok();
}

auto CommandCloudGateway::enable_monitoring(const UserId& user,
                                            const BackendId& backend,
                                            const MachineId& machine)
    -> Result<std::string> {
  auto snippet = run_backend_command(user, backend, machine,
                                     &BackendCommands::enable_monitoring,
                                     "enable_monitoring");
  if (!snippet) {
    return snippet;
  }
  auto end = snippet->find_last_not_of(" \t\r\n");
  snippet->erase(end == std::string::npos ? 0 : end + 1);
  return snippet;
}

}  // namespace taskchain
