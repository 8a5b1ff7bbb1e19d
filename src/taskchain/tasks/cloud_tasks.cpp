#include "taskchain/tasks/cloud_tasks.hpp"

#include "taskchain/util/log.hpp"

#include <memory>

namespace taskchain {

namespace {

using namespace std::chrono_literals;

constexpr auto kHour = std::chrono::seconds(std::chrono::hours(1));
constexpr auto kDay = std::chrono::seconds(std::chrono::days(1));
constexpr auto kWeek = std::chrono::seconds(std::chrono::weeks(1));

struct MachineArgs {
  BackendId backend;
  MachineId machine;
  std::string host;
};

auto string_at(const nlohmann::json& args, std::size_t i)
    -> Result<std::string> {
  if (!args.is_array() || args.size() <= i || !args[i].is_string() ||
      args[i].get_ref<const std::string&>().empty()) {
    return fail(Error::InvalidArgument);
  }
  return args[i].get<std::string>();
}

auto backend_arg(const nlohmann::json& args) -> Result<BackendId> {
  return string_at(args, 0).transform(
      [](std::string s) { return BackendId{std::move(s)}; });
}

auto machine_args(const nlohmann::json& args) -> Result<MachineArgs> {
  auto backend = string_at(args, 0);
  auto machine = string_at(args, 1);
  auto host = string_at(args, 2);
  if (!backend || !machine || !host) {
    return fail(Error::InvalidArgument);
  }
  return MachineArgs{BackendId{std::move(*backend)},
                     MachineId{std::move(*machine)}, std::move(*host)};
}

template <auto Method>
auto run_listing(ICloudGateway& gateway, const UserId& user,
                 const nlohmann::json& args, const char* field)
    -> Result<nlohmann::json> {
  auto backend = backend_arg(args);
  if (!backend) {
    return std::unexpected(backend.error());
  }
  auto items = (gateway.*Method)(user, *backend);
  if (!items) {
    return std::unexpected(items.error());
  }
  return nlohmann::json{{"backend_id", backend->str()},
                        {field, std::move(*items)}};
}

auto machine_payload(const MachineArgs& a, nlohmann::json result)
    -> nlohmann::json {
  return {{"backend_id", a.backend.str()},
          {"machine_id", a.machine.str()},
          {"host", a.host},
          {"result", std::move(result)}};
}

}  // namespace

ListSizes::ListSizes(ICloudGateway& gateway)
    : Task({"list_sizes", kHour, kWeek, false}), gateway_(gateway) {
}

auto ListSizes::execute(const UserId& user, const nlohmann::json& args)
    -> Result<nlohmann::json> {
  return run_listing<&ICloudGateway::list_sizes>(gateway_, user, args,
                                                 "sizes");
}

ListLocations::ListLocations(ICloudGateway& gateway)
    : Task({"list_locations", kHour, kWeek, false}), gateway_(gateway) {
}

auto ListLocations::execute(const UserId& user, const nlohmann::json& args)
    -> Result<nlohmann::json> {
  return run_listing<&ICloudGateway::list_locations>(gateway_, user, args,
                                                     "locations");
}

ListImages::ListImages(ICloudGateway& gateway)
    : Task({"list_images", kHour, kWeek, false}), gateway_(gateway) {
}

auto ListImages::execute(const UserId& user, const nlohmann::json& args)
    -> Result<nlohmann::json> {
  return run_listing<&ICloudGateway::list_images>(gateway_, user, args,
                                                  "images");
}

ListMachines::ListMachines(ICloudGateway& gateway)
    : Task({"list_machines", 10s, kDay, true}), gateway_(gateway) {
}

auto ListMachines::execute(const UserId& user, const nlohmann::json& args)
    -> Result<nlohmann::json> {
  log::debug("Running list machines for user {} backend {}", user,
             args.dump());
  return run_listing<&ICloudGateway::list_machines>(gateway_, user, args,
                                                    "machines");
}

auto ListMachines::backoff(const std::error_code& error,
                           FailureOffsets failures, const UserId& user,
                           const nlohmann::json& args, const nlohmann::json&)
    -> BackoffDecision {
  if (failures.size() <= kMaxRetries) {
    return spec().result_fresh;
  }

  auto backend = backend_arg(args);
  if (!backend) {
    return std::nullopt;
  }
  log::warn("list_machines failed {} times for {} on backend {} ({}), "
            "disabling",
            failures.size(), user, *backend, error.message());
  if (auto r = gateway_.disable_backend(user, *backend); !r) {
    log::error("Failed to disable backend {} for {}: {}", *backend, user,
               r.error().message());
  }
  return std::nullopt;
}

ProbeSsh::ProbeSsh(ICloudGateway& gateway)
    : Task({"probe", 120s, 2 * kHour, true}), gateway_(gateway) {
}

auto ProbeSsh::execute(const UserId& user, const nlohmann::json& args)
    -> Result<nlohmann::json> {
  auto a = machine_args(args);
  if (!a) {
    return std::unexpected(a.error());
  }
  auto res = gateway_.probe(user, a->backend, a->machine, a->host);
  if (!res) {
    return std::unexpected(res.error());
  }
  return machine_payload(*a, std::move(*res));
}

auto ProbeSsh::backoff(const std::error_code&, FailureOffsets failures,
                       const UserId&, const nlohmann::json&,
                       const nlohmann::json&) -> BackoffDecision {
  return exponential_backoff(failures, kBaseDelay, kMaxDelay);
}

Ping::Ping(ICloudGateway& gateway)
    : Task({"ping", 15min, 2 * kHour, true}), gateway_(gateway) {
}

auto Ping::execute(const UserId&, const nlohmann::json& args)
    -> Result<nlohmann::json> {
  auto a = machine_args(args);
  if (!a) {
    return std::unexpected(a.error());
  }
  auto res = gateway_.ping(a->host);
  if (!res) {
    return std::unexpected(res.error());
  }
  return machine_payload(*a, std::move(*res));
}

auto Ping::backoff(const std::error_code&, FailureOffsets failures,
                   const UserId&, const nlohmann::json&, const nlohmann::json&)
    -> BackoffDecision {
  return constant_backoff(failures, spec().result_fresh);
}

auto register_cloud_tasks(TaskRegistry& registry, ICloudGateway& gateway)
    -> Result<void> {
  std::unique_ptr<Task> tasks[] = {
      std::make_unique<ListSizes>(gateway),
      std::make_unique<ListLocations>(gateway),
      std::make_unique<ListImages>(gateway),
      std::make_unique<ListMachines>(gateway),
      std::make_unique<ProbeSsh>(gateway),
      std::make_unique<Ping>(gateway),
  };
  for (auto& task : tasks) {
    if (auto r = registry.add(std::move(task)); !r) {
      return r;
    }
  }
  return ok();
}

}  // namespace taskchain
