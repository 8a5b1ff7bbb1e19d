#include "taskchain/app/application.hpp"
#include "taskchain/util/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("taskchain - cached, self-rescheduling task worker");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  -w, --workers <n>     Worker threads (overrides config)");
  std::println("  --log-level <level>   trace|debug|info|warn|error");
  std::println("  -t, --trigger <task>  Submit a task at start-up");
  std::println("  --args <json>         Positional arguments for --trigger");
  std::println("  --user <user>         User to listen and trigger for");
  std::println("  -l, --list            List tasks and jobs and exit");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} -c taskchain.yaml", prog);
  std::println(
      "  {} -c taskchain.yaml --user ops -t ping --args "
      "'[\"ec2\",\"i-1\",\"10.0.0.5\"]'",
      prog);
}

void print_version() {
  std::println("taskchain v0.1.0");
}

auto setup_logging(const taskchain::Config& config) -> void {
  taskchain::log::set_level(config.scheduler.log_level);
  if (!config.scheduler.log_file.empty() &&
      !taskchain::log::set_file(config.scheduler.log_file)) {
    std::println(stderr, "Warning: cannot open log file {}, using stdout",
                 config.scheduler.log_file);
  }
  taskchain::log::start();
}

struct Options {
  std::string config_file;
  std::optional<int> workers;
  std::string log_level;
  std::string trigger_task;
  std::string trigger_args = "[]";
  std::string user;
  bool list_tasks = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> const char* {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "-w" || arg == "--workers") {
      std::string value = require_value(i, argc, argv, arg);
      try {
        opts.workers = std::stoi(value);
      } catch (const std::exception&) {
        std::println(stderr, "Error: invalid worker count: {}", value);
        std::exit(1);
      }
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else if (arg == "-t" || arg == "--trigger") {
      opts.trigger_task = require_value(i, argc, argv, arg);
    } else if (arg == "--args") {
      opts.trigger_args = require_value(i, argc, argv, arg);
    } else if (arg == "--user") {
      opts.user = require_value(i, argc, argv, arg);
    } else if (arg == "-l" || arg == "--list") {
      opts.list_tasks = true;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto run(const Options& opts) -> int {
  taskchain::Application app;

  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      std::println(stderr, "Error: Config file not found: {}",
                   opts.config_file);
      return 1;
    }
    if (auto r = app.load_config(opts.config_file); !r) {
      std::println(stderr, "Error: Failed to load config: {}",
                   r.error().message());
      return 1;
    }
  }

  auto& config = app.config();
  if (opts.workers) {
    if (*opts.workers < 1) {
      std::println(stderr, "Error: --workers must be at least 1");
      return 1;
    }
    config.scheduler.workers = *opts.workers;
  }
  if (!opts.log_level.empty()) {
    config.scheduler.log_level = opts.log_level;
  }
  if (!opts.user.empty()) {
    config.listen.user = opts.user;
  }

  auto trigger_args = nlohmann::json::parse(opts.trigger_args, nullptr, false);
  if (trigger_args.is_discarded() || !trigger_args.is_array()) {
    std::println(stderr, "Error: --args must be a JSON array");
    return 1;
  }

  setup_logging(config);

  if (auto r = app.init(); !r) {
    taskchain::log::error("Initialization failed: {}", r.error().message());
    taskchain::log::stop();
    return 1;
  }

  if (opts.list_tasks) {
    app.list_tasks();
    taskchain::log::stop();
    return 0;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  // The listener must exist before anything runs, or the first invocation
  // sees nobody listening and ends its chain.
  std::optional<taskchain::LocalChannel::Subscription> listener;
  if (!config.listen.user.empty()) {
    listener = app.listen_stdout(taskchain::UserId{config.listen.user});
    taskchain::log::info("Listening for results of {}", config.listen.user);
  }

  if (auto r = app.start(); !r) {
    taskchain::log::error("Failed to start: {}", r.error().message());
    taskchain::log::stop();
    return 1;
  }

  auto submitted = app.submit_triggers();
  if (submitted && !opts.trigger_task.empty()) {
    if (config.listen.user.empty()) {
      taskchain::log::error("--trigger needs --user or listen.user");
      submitted = std::unexpected(
          taskchain::make_error_code(taskchain::Error::InvalidArgument));
    } else {
      submitted = app.trigger(opts.trigger_task,
                              taskchain::UserId{config.listen.user},
                              std::move(trigger_args));
    }
  }
  if (!submitted) {
    app.stop();
    taskchain::log::stop();
    return 1;
  }

  while (app.is_running() &&
         !g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_shutdown_requested.load(std::memory_order_acquire)) {
    taskchain::log::info("Received shutdown signal, stopping...");
  }

  app.stop();
  listener.reset();
  taskchain::log::info("taskchain stopped.");
  taskchain::log::stop();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  return run(parse_args(argc, argv));
}
