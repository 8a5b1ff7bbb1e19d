#pragma once

#include "taskchain/gateway/gateway.hpp"
#include "taskchain/task/task.hpp"
#include "taskchain/task/task_registry.hpp"

namespace taskchain {

// Inventory listings take [backend_id] and return
// {"backend_id": ..., "<kind>": [...]}.
class ListSizes final : public Task {
public:
  explicit ListSizes(ICloudGateway& gateway);
  auto execute(const UserId& user, const nlohmann::json& args)
      -> Result<nlohmann::json> override;

private:
  ICloudGateway& gateway_;
};

class ListLocations final : public Task {
public:
  explicit ListLocations(ICloudGateway& gateway);
  auto execute(const UserId& user, const nlohmann::json& args)
      -> Result<nlohmann::json> override;

private:
  ICloudGateway& gateway_;
};

class ListImages final : public Task {
public:
  explicit ListImages(ICloudGateway& gateway);
  auto execute(const UserId& user, const nlohmann::json& args)
      -> Result<nlohmann::json> override;

private:
  ICloudGateway& gateway_;
};

// Polls the machine list. After kMaxRetries consecutive failures the
// backend is disabled for the user and the chain gives up.
class ListMachines final : public Task {
public:
  static constexpr std::size_t kMaxRetries = 6;

  explicit ListMachines(ICloudGateway& gateway);
  auto execute(const UserId& user, const nlohmann::json& args)
      -> Result<nlohmann::json> override;
  auto backoff(const std::error_code& error, FailureOffsets failures,
               const UserId& user, const nlohmann::json& args,
               const nlohmann::json& kwargs) -> BackoffDecision override;

private:
  ICloudGateway& gateway_;
};

// Machine tasks take [backend_id, machine_id, host] and return
// {"backend_id", "machine_id", "host", "result": {...}}.
class ProbeSsh final : public Task {
public:
  static constexpr Delay kBaseDelay{120};
  static constexpr Delay kMaxDelay{32 * 60};

  explicit ProbeSsh(ICloudGateway& gateway);
  auto execute(const UserId& user, const nlohmann::json& args)
      -> Result<nlohmann::json> override;
  auto backoff(const std::error_code& error, FailureOffsets failures,
               const UserId& user, const nlohmann::json& args,
               const nlohmann::json& kwargs) -> BackoffDecision override;

private:
  ICloudGateway& gateway_;
};

class Ping final : public Task {
public:
  explicit Ping(ICloudGateway& gateway);
  auto execute(const UserId& user, const nlohmann::json& args)
      -> Result<nlohmann::json> override;
  auto backoff(const std::error_code& error, FailureOffsets failures,
               const UserId& user, const nlohmann::json& args,
               const nlohmann::json& kwargs) -> BackoffDecision override;

private:
  ICloudGateway& gateway_;
};

[[nodiscard]] auto register_cloud_tasks(TaskRegistry& registry,
                                        ICloudGateway& gateway)
    -> Result<void>;

}  // namespace taskchain
