#pragma once

#include "taskchain/channel/local_channel.hpp"
#include "taskchain/config/config.hpp"
#include "taskchain/core/error.hpp"
#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string_view>

namespace taskchain {

class CommandCloudGateway;
class DelayQueue;
class ICacheStore;
class LogNotifier;
class SshShell;
class TaskClient;
class TaskDispatcher;
class TaskRegistry;
class TaskRunner;

// Worker process facade: owns the cache store, the channel, the gateway,
// the task catalogue and the queue, and wires them together.
class Application {
public:
  Application();
  explicit Application(Config config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Configuration
  [[nodiscard]] auto load_config(std::string_view path) -> Result<void>;
  [[nodiscard]] auto load_config_string(std::string_view yaml)
      -> Result<void>;
  [[nodiscard]] auto config() const noexcept -> const Config&;
  [[nodiscard]] auto config() noexcept -> Config&;

  // Builds every component from the current config. Called by start() when
  // not done explicitly.
  [[nodiscard]] auto init() -> Result<void>;

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Submits the configured triggers on behalf of the listen user.
  [[nodiscard]] auto submit_triggers() -> Result<void>;
  [[nodiscard]] auto trigger(std::string_view task, const UserId& user,
                             nlohmann::json args) -> Result<void>;

  // Prints each published payload for `user` as one JSON line on stdout.
  [[nodiscard]] auto listen_stdout(const UserId& user)
      -> LocalChannel::Subscription;

  // Component access
  [[nodiscard]] auto channel() -> LocalChannel&;
  [[nodiscard]] auto client() -> TaskClient&;
  [[nodiscard]] auto registry() const -> const TaskRegistry&;
  [[nodiscard]] auto queue() -> DelayQueue&;

  auto list_tasks() const -> void;

private:
  [[nodiscard]] auto make_cache_store() -> Result<void>;

  std::atomic<bool> running_{false};
  bool initialized_{false};
  Config config_;

  std::unique_ptr<ICacheStore> cache_;
  LocalChannel channel_;
  std::unique_ptr<LogNotifier> notifier_;
  std::unique_ptr<CommandCloudGateway> gateway_;
  std::unique_ptr<SshShell> shell_;
  std::unique_ptr<TaskRegistry> registry_;

  // Construction order matters: the queue dispatches into the dispatcher,
  // which calls the runner, which submits back into the queue.
  std::unique_ptr<DelayQueue> queue_;
  std::unique_ptr<TaskRunner> runner_;
  std::unique_ptr<TaskDispatcher> dispatcher_;
  std::unique_ptr<TaskClient> client_;
};

}  // namespace taskchain
