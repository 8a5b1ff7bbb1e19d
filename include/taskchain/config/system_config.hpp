#pragma once

#include "taskchain/task/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace taskchain {

enum class StorageBackend { Memory, Sqlite };

[[nodiscard]] constexpr auto storage_backend_to_string(
    StorageBackend backend) noexcept -> std::string_view {
  switch (backend) {
    case StorageBackend::Memory: return "memory";
    case StorageBackend::Sqlite: return "sqlite";
  }
  return "sqlite";
}

[[nodiscard]] inline auto string_to_storage_backend(
    std::string_view str) noexcept -> StorageBackend {
  if (str == "memory") return StorageBackend::Memory;
  return StorageBackend::Sqlite;
}

struct StorageConfig {
  StorageBackend backend{StorageBackend::Sqlite};
  std::string db_file{"taskchain.db"};
};

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
  int workers{4};
  int queue_capacity{4096};
};

// Commands printing a JSON document on stdout. TASKCHAIN_USER,
// TASKCHAIN_BACKEND and TASKCHAIN_MACHINE are set in their environment.
struct BackendCommands {
  std::string list_machines;
  std::string list_images;
  std::string list_sizes;
  std::string list_locations;
  // Optional. Prints the shell snippet to prepend to a deployment script.
  std::string enable_monitoring;
};

struct GatewayConfig {
  int command_timeout{60};
  int ping_count{3};
  std::string ssh_user{"root"};
  std::uint16_t ssh_port{22};
  std::vector<std::string> ssh_options{"-o", "BatchMode=yes", "-o",
                                       "StrictHostKeyChecking=no"};
  std::map<std::string, BackendCommands> backends;
};

struct DeployConfig {
  int max_retries{5};
  int retry_delay{60};
  int locate_delay{120};
};

struct ListenConfig {
  std::string user;
};

struct TriggerConfig {
  std::string task;
  nlohmann::json args = nlohmann::json::array();
};

struct SystemConfig {
  StorageConfig storage;
  SchedulerConfig scheduler;
  std::map<std::string, TaskOverride> tasks;
  GatewayConfig gateway;
  DeployConfig deploy;
  ListenConfig listen;
  std::vector<TriggerConfig> triggers;
};

}  // namespace taskchain
