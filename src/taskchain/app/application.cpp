#include "taskchain/app/application.hpp"

#include "taskchain/cache/memory_cache_store.hpp"
#include "taskchain/cache/sqlite_cache_store.hpp"
#include "taskchain/channel/log_notifier.hpp"
#include "taskchain/gateway/command_gateway.hpp"
#include "taskchain/gateway/ssh_shell.hpp"
#include "taskchain/scheduler/delay_queue.hpp"
#include "taskchain/task/dispatcher.hpp"
#include "taskchain/task/task_client.hpp"
#include "taskchain/task/task_registry.hpp"
#include "taskchain/task/task_runner.hpp"
#include "taskchain/tasks/cloud_tasks.hpp"
#include "taskchain/tasks/deploy_jobs.hpp"
#include "taskchain/util/log.hpp"

#include <cstdio>
#include <print>

namespace taskchain {

Application::Application() = default;

Application::Application(Config config) : config_(std::move(config)) {
}

Application::~Application() {
  stop();
}

auto Application::load_config(std::string_view path) -> Result<void> {
  auto cfg = ConfigLoader::load_from_file(path);
  if (!cfg) {
    return std::unexpected(cfg.error());
  }
  config_ = std::move(*cfg);
  return ok();
}

auto Application::load_config_string(std::string_view yaml) -> Result<void> {
  auto cfg = ConfigLoader::load_from_string(yaml);
  if (!cfg) {
    return std::unexpected(cfg.error());
  }
  config_ = std::move(*cfg);
  return ok();
}

auto Application::config() const noexcept -> const Config& {
  return config_;
}

auto Application::config() noexcept -> Config& {
  return config_;
}

auto Application::make_cache_store() -> Result<void> {
  if (config_.storage.backend == StorageBackend::Memory) {
    cache_ = std::make_unique<MemoryCacheStore>();
    log::info("Using in-memory cache store");
    return ok();
  }

  auto store = std::make_unique<SqliteCacheStore>(config_.storage.db_file);
  if (auto r = store->open(); !r) {
    log::error("Failed to open cache database {}: {}", config_.storage.db_file,
               r.error().message());
    return r;
  }
  cache_ = std::move(store);
  return ok();
}

auto Application::init() -> Result<void> {
  if (initialized_) {
    return ok();
  }

  if (auto r = make_cache_store(); !r) {
    return r;
  }

  notifier_ = std::make_unique<LogNotifier>();
  gateway_ = std::make_unique<CommandCloudGateway>(config_.gateway);
  shell_ = std::make_unique<SshShell>(
      config_.gateway.ssh_options,
      std::chrono::seconds(config_.gateway.command_timeout));

  DelayQueue::Options options;
  options.workers = static_cast<std::size_t>(config_.scheduler.workers);
  options.capacity = static_cast<std::size_t>(config_.scheduler.queue_capacity);
  queue_ = std::make_unique<DelayQueue>(
      options, [this](TaskMessage msg) { dispatcher_->dispatch(std::move(msg)); });

  registry_ = std::make_unique<TaskRegistry>();
  if (auto r = register_cloud_tasks(*registry_, *gateway_); !r) {
    return r;
  }
  if (auto r = register_deploy_jobs(*registry_, *gateway_, *shell_,
                                    *notifier_, *queue_, config_.deploy,
                                    config_.gateway.ssh_user);
      !r) {
    return r;
  }
  if (auto r = registry_->apply_overrides(config_.tasks); !r) {
    return r;
  }

  runner_ = std::make_unique<TaskRunner>(*cache_, *queue_, channel_, channel_);
  dispatcher_ = std::make_unique<TaskDispatcher>(*registry_, *runner_);
  client_ = std::make_unique<TaskClient>(*registry_, *cache_, *queue_);

  initialized_ = true;
  return ok();
}

auto Application::start() -> Result<void> {
  if (running_.load(std::memory_order_acquire)) {
    return ok();
  }
  if (auto r = init(); !r) {
    return r;
  }
  queue_->start();
  running_.store(true, std::memory_order_release);
  log::info("Started with {} workers, {} tasks, {} jobs",
            config_.scheduler.workers, registry_->task_names().size(),
            registry_->job_names().size());
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  queue_->stop();
  log::info("Stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Application::submit_triggers() -> Result<void> {
  if (config_.triggers.empty()) {
    return ok();
  }
  if (config_.listen.user.empty()) {
    log::warn("Ignoring {} configured triggers: listen.user is not set",
              config_.triggers.size());
    return ok();
  }
  UserId user{config_.listen.user};
  for (const auto& t : config_.triggers) {
    if (auto r = trigger(t.task, user, t.args); !r) {
      return r;
    }
  }
  return ok();
}

auto Application::trigger(std::string_view task, const UserId& user,
                          nlohmann::json args) -> Result<void> {
  if (auto r = init(); !r) {
    return r;
  }
  if (auto r = client_->trigger(task, user, std::move(args)); !r) {
    log::error("Failed to trigger {}: {}", task, r.error().message());
    return r;
  }
  log::info("Triggered {} for {}", task, user);
  return ok();
}

auto Application::listen_stdout(const UserId& user)
    -> LocalChannel::Subscription {
  return channel_.subscribe(
      user, [](std::string_view routing_key, const nlohmann::json& payload) {
        nlohmann::json line{{"task", routing_key}, {"payload", payload}};
        std::println("{}", line.dump());
        std::fflush(stdout);
      });
}

auto Application::channel() -> LocalChannel& {
  return channel_;
}

auto Application::client() -> TaskClient& {
  return *client_;
}

auto Application::registry() const -> const TaskRegistry& {
  return *registry_;
}

auto Application::queue() -> DelayQueue& {
  return *queue_;
}

auto Application::list_tasks() const -> void {
  if (!registry_) {
    return;
  }
  std::println("Tasks:");
  for (const auto& name : registry_->task_names()) {
    const auto& spec = registry_->find_task(name)->spec();
    std::println("  {:<16} fresh={}s expires={}s polling={}", name,
                 spec.result_fresh.count(), spec.result_expires.count(),
                 spec.polling);
  }
  std::println("Jobs:");
  for (const auto& name : registry_->job_names()) {
    std::println("  {}", name);
  }
}

}  // namespace taskchain
