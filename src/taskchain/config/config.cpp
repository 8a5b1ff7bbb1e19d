#include "taskchain/config/config.hpp"

#include "taskchain/config/yaml_utils.hpp"
#include "taskchain/task/task.hpp"
#include "taskchain/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskchain::StorageConfig> {
  static bool decode(const Node& node, taskchain::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.backend = taskchain::string_to_storage_backend(
        taskchain::yaml_get_or<std::string>(node, "backend", "sqlite"));
    s.db_file =
        taskchain::yaml_get_or<std::string>(node, "db_file", "taskchain.db");
    return true;
  }
};

template <>
struct convert<taskchain::SchedulerConfig> {
  static bool decode(const Node& node, taskchain::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = taskchain::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = taskchain::yaml_get_or<std::string>(node, "log_file", "");
    s.workers = taskchain::yaml_get_or(node, "workers", 4);
    s.queue_capacity = taskchain::yaml_get_or(node, "queue_capacity", 4096);
    return true;
  }
};

template <>
struct convert<taskchain::TaskOverride> {
  static bool decode(const Node& node, taskchain::TaskOverride& t) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto fresh = node["result_fresh"]) {
      t.result_fresh = std::chrono::seconds(fresh.as<long long>());
    }
    if (auto expires = node["result_expires"]) {
      t.result_expires = std::chrono::seconds(expires.as<long long>());
    }
    if (auto polling = node["polling"]) {
      t.polling = polling.as<bool>();
    }
    return true;
  }
};

template <>
struct convert<taskchain::BackendCommands> {
  static bool decode(const Node& node, taskchain::BackendCommands& b) {
    if (!node.IsMap()) {
      return false;
    }
    b.list_machines =
        taskchain::yaml_get_or<std::string>(node, "list_machines", "");
    b.list_images = taskchain::yaml_get_or<std::string>(node, "list_images", "");
    b.list_sizes = taskchain::yaml_get_or<std::string>(node, "list_sizes", "");
    b.list_locations =
        taskchain::yaml_get_or<std::string>(node, "list_locations", "");
    b.enable_monitoring =
        taskchain::yaml_get_or<std::string>(node, "enable_monitoring", "");
    return true;
  }
};

template <>
struct convert<taskchain::GatewayConfig> {
  static bool decode(const Node& node, taskchain::GatewayConfig& g) {
    if (!node.IsMap()) {
      return false;
    }
    taskchain::GatewayConfig defaults;
    g.command_timeout = taskchain::yaml_get_or(node, "command_timeout", 60);
    g.ping_count = taskchain::yaml_get_or(node, "ping_count", 3);
    g.ssh_user = taskchain::yaml_get_or<std::string>(node, "ssh_user", "root");
    g.ssh_port = taskchain::yaml_get_or<std::uint16_t>(node, "ssh_port", 22);
    g.ssh_options = taskchain::yaml_get_or(node, "ssh_options",
                                           std::move(defaults.ssh_options));
    if (auto backends = node["backends"]) {
      g.backends =
          backends.as<std::map<std::string, taskchain::BackendCommands>>();
    }
    return true;
  }
};

template <>
struct convert<taskchain::DeployConfig> {
  static bool decode(const Node& node, taskchain::DeployConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.max_retries = taskchain::yaml_get_or(node, "max_retries", 5);
    d.retry_delay = taskchain::yaml_get_or(node, "retry_delay", 60);
    d.locate_delay = taskchain::yaml_get_or(node, "locate_delay", 120);
    return true;
  }
};

template <>
struct convert<taskchain::ListenConfig> {
  static bool decode(const Node& node, taskchain::ListenConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.user = taskchain::yaml_get_or<std::string>(node, "user", "");
    return true;
  }
};

template <>
struct convert<taskchain::TriggerConfig> {
  static bool decode(const Node& node, taskchain::TriggerConfig& t) {
    if (!node.IsMap() || !node["task"]) {
      return false;
    }
    t.task = node["task"].as<std::string>();
    if (auto args = node["args"]) {
      if (!args.IsSequence()) {
        return false;
      }
      t.args = taskchain::yaml_to_json(args);
    }
    return true;
  }
};

template <>
struct convert<taskchain::SystemConfig> {
  static bool decode(const Node& node, taskchain::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<taskchain::StorageConfig>();
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<taskchain::SchedulerConfig>();
    }
    if (auto tasks = node["tasks"]) {
      c.tasks = tasks.as<std::map<std::string, taskchain::TaskOverride>>();
    }
    if (auto gateway = node["gateway"]) {
      c.gateway = gateway.as<taskchain::GatewayConfig>();
    }
    if (auto deploy = node["deploy"]) {
      c.deploy = deploy.as<taskchain::DeployConfig>();
    }
    if (auto listen = node["listen"]) {
      c.listen = listen.as<taskchain::ListenConfig>();
    }
    if (auto triggers = node["triggers"]) {
      c.triggers = triggers.as<std::vector<taskchain::TriggerConfig>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskchain {

namespace {

auto within_limit(long long seconds) -> bool {
  return seconds >= 0 && seconds <= kMaxConfiguredDuration.count();
}

auto validate(const SystemConfig& config) -> Result<void> {
  if (config.scheduler.workers < 1) {
    log::error("scheduler.workers must be at least 1, got {}",
               config.scheduler.workers);
    return fail(Error::InvalidArgument);
  }
  if (config.scheduler.queue_capacity < 1) {
    log::error("scheduler.queue_capacity must be at least 1, got {}",
               config.scheduler.queue_capacity);
    return fail(Error::InvalidArgument);
  }
  if (config.gateway.command_timeout < 1 ||
      !within_limit(config.gateway.command_timeout)) {
    log::error("gateway.command_timeout must be between 1 and {}s",
               kMaxConfiguredDuration.count());
    return fail(Error::InvalidArgument);
  }
  if (config.deploy.max_retries < 0 ||
      !within_limit(config.deploy.retry_delay) ||
      !within_limit(config.deploy.locate_delay)) {
    log::error("deploy delays must be between 0 and {}s",
               kMaxConfiguredDuration.count());
    return fail(Error::InvalidArgument);
  }
  for (const auto& [name, o] : config.tasks) {
    if ((o.result_fresh && !within_limit(o.result_fresh->count())) ||
        (o.result_expires && !within_limit(o.result_expires->count()))) {
      log::error("tasks.{}: durations must be between 0 and {}s", name,
                 kMaxConfiguredDuration.count());
      return fail(Error::InvalidArgument);
    }
    // A polling task reruns every result_fresh; zero would spin a worker.
    if (o.result_fresh && o.result_fresh->count() < 1 &&
        o.polling.value_or(false)) {
      log::error("tasks.{}: result_fresh must be at least 1s for a polling "
                 "task", name);
      return fail(Error::InvalidArgument);
    }
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return std::unexpected(r.error());
  }
  return ok(std::move(config));
}

}  // namespace taskchain
