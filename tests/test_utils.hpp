#pragma once

#include "taskchain/cache/memory_cache_store.hpp"
#include "taskchain/channel/channel.hpp"
#include "taskchain/gateway/gateway.hpp"
#include "taskchain/scheduler/task_queue.hpp"
#include "taskchain/task/task.hpp"
#include "taskchain/util/clock.hpp"
#include "taskchain/util/id.hpp"

#include <chrono>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace taskchain::test {

[[nodiscard]] inline auto user(std::string s) -> UserId {
  return UserId{std::move(s)};
}

[[nodiscard]] inline auto seq(std::string s) -> SeqId {
  return SeqId{std::move(s)};
}

[[nodiscard]] inline auto make_message(std::string task, std::string who,
                                       nlohmann::json args = nlohmann::json::array(),
                                       nlohmann::json kwargs = nlohmann::json::object())
    -> TaskMessage {
  TaskMessage msg;
  msg.task = std::move(task);
  msg.user = UserId{std::move(who)};
  msg.args = std::move(args);
  msg.kwargs = std::move(kwargs);
  return msg;
}

// Unique path under /tmp; the file itself is not created.
[[nodiscard]] inline auto temp_path(std::string_view prefix,
                                    std::string_view suffix) -> std::string {
  std::string pattern = std::string("/tmp/") + std::string(prefix) + "_XXXXXX";
  int fd = ::mkstemp(pattern.data());
  if (fd >= 0) {
    ::close(fd);
    std::filesystem::remove(pattern);
  }
  return pattern + std::string(suffix);
}

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

class ManualClock final : public IClock {
public:
  ManualClock() : now_(TimePoint(std::chrono::seconds(1'700'000'000))) {}

  [[nodiscard]] auto now() const -> TimePoint override {
    std::lock_guard lock(mu_);
    return now_;
  }

  void advance(std::chrono::milliseconds d) {
    std::lock_guard lock(mu_);
    now_ += d;
  }

  void set(TimePoint tp) {
    std::lock_guard lock(mu_);
    now_ = tp;
  }

private:
  mutable std::mutex mu_;
  TimePoint now_;
};

struct Submission {
  TaskMessage msg;
  std::chrono::milliseconds delay;
};

// Records submissions instead of running them.
class RecordingQueue final : public ITaskQueue {
public:
  auto submit(TaskMessage msg, std::chrono::milliseconds delay)
      -> Result<void> override {
    std::lock_guard lock(mu_);
    if (fail_with) {
      return fail(*fail_with);
    }
    submissions.push_back({std::move(msg), delay});
    return ok();
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mu_);
    return submissions.size();
  }

  [[nodiscard]] auto pop_front() -> Submission {
    std::lock_guard lock(mu_);
    auto s = std::move(submissions.front());
    submissions.erase(submissions.begin());
    return s;
  }

  std::optional<Error> fail_with;
  std::vector<Submission> submissions;

private:
  mutable std::mutex mu_;
};

struct Published {
  UserId user;
  std::string routing_key;
  nlohmann::json payload;
};

class FakeChannel final : public IPresenceOracle, public IResultPublisher {
public:
  auto is_listening(const UserId& u) -> bool override {
    std::lock_guard lock(mu_);
    ++presence_checks;
    return listening.contains(u);
  }

  auto publish(const UserId& u, std::string_view routing_key,
               const nlohmann::json& payload) -> bool override {
    std::lock_guard lock(mu_);
    if (!publish_ok) {
      return false;
    }
    published.push_back({u, std::string(routing_key), payload});
    return true;
  }

  std::set<UserId> listening;
  bool publish_ok{true};
  int presence_checks{0};
  std::vector<Published> published;

private:
  std::mutex mu_;
};

// Task whose execute() returns queued results, then `fallback`.
class ScriptedTask final : public Task {
public:
  using BackoffFn = std::function<BackoffDecision(FailureOffsets)>;

  explicit ScriptedTask(TaskSpec spec) : Task(std::move(spec)) {}

  auto execute(const UserId& u, const nlohmann::json& args)
      -> Result<nlohmann::json> override {
    std::lock_guard lock(mu_);
    ++calls;
    last_user = u;
    last_args = args;
    if (on_execute) {
      on_execute();
    }
    if (script.empty()) {
      return fallback;
    }
    auto r = std::move(script.front());
    script.pop_front();
    return r;
  }

  auto backoff(const std::error_code& error, FailureOffsets failures,
               const UserId& u, const nlohmann::json& args,
               const nlohmann::json& kwargs) -> BackoffDecision override {
    std::lock_guard lock(mu_);
    failure_history.emplace_back(failures.begin(), failures.end());
    backoff_kwargs = kwargs;
    if (backoff_fn) {
      return backoff_fn(failures);
    }
    return Task::backoff(error, failures, u, args, kwargs);
  }

  void push_success(nlohmann::json payload) { script.emplace_back(std::move(payload)); }
  void push_failure(Error e) { script.emplace_back(std::unexpected(make_error_code(e))); }

  std::deque<Result<nlohmann::json>> script;
  Result<nlohmann::json> fallback{nlohmann::json{{"ok", true}}};
  BackoffFn backoff_fn;
  std::function<void()> on_execute;

  int calls{0};
  UserId last_user;
  nlohmann::json last_args;
  std::vector<std::vector<std::chrono::milliseconds>> failure_history;
  nlohmann::json backoff_kwargs;

private:
  std::recursive_mutex mu_;
};

// Memory store that can be told to fail.
class FlakyCacheStore final : public ICacheStore {
public:
  auto get(std::string_view key) -> Result<std::optional<nlohmann::json>> override {
    if (fail_get) return fail(Error::DatabaseQueryFailed);
    return inner.get(key);
  }
  auto set(std::string_view key, const nlohmann::json& value) -> Result<void> override {
    if (fail_set) return fail(Error::DatabaseQueryFailed);
    return inner.set(key, value);
  }
  auto remove(std::string_view key) -> Result<void> override {
    if (fail_set) return fail(Error::DatabaseQueryFailed);
    return inner.remove(key);
  }

  MemoryCacheStore inner;
  bool fail_get{false};
  bool fail_set{false};
};

class FakeGateway final : public ICloudGateway {
public:
  auto list_machines(const UserId&, const BackendId& backend)
      -> Result<nlohmann::json> override {
    std::lock_guard lock(mu_);
    ++list_machines_calls;
    if (disabled.contains(backend.str())) return fail(Error::NotFound);
    if (!machines_script.empty()) {
      auto r = std::move(machines_script.front());
      machines_script.pop_front();
      return r;
    }
    return machines;
  }
  auto list_images(const UserId&, const BackendId&) -> Result<nlohmann::json> override {
    return images;
  }
  auto list_sizes(const UserId&, const BackendId&) -> Result<nlohmann::json> override {
    return sizes;
  }
  auto list_locations(const UserId&, const BackendId&) -> Result<nlohmann::json> override {
    return locations;
  }
  auto probe(const UserId&, const BackendId&, const MachineId& machine,
             const std::string& host) -> Result<nlohmann::json> override {
    std::lock_guard lock(mu_);
    probed.push_back(machine.str() + "@" + host);
    return probe_result;
  }
  auto ping(const std::string& host) -> Result<nlohmann::json> override {
    std::lock_guard lock(mu_);
    pinged.push_back(host);
    return ping_result;
  }
  auto disable_backend(const UserId&, const BackendId& backend) -> Result<void> override {
    std::lock_guard lock(mu_);
    disabled.insert(backend.str());
    return ok();
  }
  auto enable_monitoring(const UserId&, const BackendId&, const MachineId&)
      -> Result<std::string> override {
    return monitoring;
  }

  Result<nlohmann::json> machines{nlohmann::json::array()};
  std::deque<Result<nlohmann::json>> machines_script;
  Result<nlohmann::json> images{nlohmann::json::array({"img-1"})};
  Result<nlohmann::json> sizes{nlohmann::json::array({"small", "large"})};
  Result<nlohmann::json> locations{nlohmann::json::array({"eu-1"})};
  Result<nlohmann::json> probe_result{nlohmann::json{{"loadavg", {0.1, 0.2, 0.3}}}};
  Result<nlohmann::json> ping_result{nlohmann::json{{"packets_loss", 0.0}}};
  Result<std::string> monitoring{std::string("install-agent")};

  int list_machines_calls{0};
  std::vector<std::string> probed;
  std::vector<std::string> pinged;
  std::set<std::string> disabled;

private:
  std::mutex mu_;
};

struct ShellCall {
  SshTarget target;
  std::string command;
};

class FakeShell final : public IRemoteShell {
public:
  auto run(const UserId&, const SshTarget& target, const std::string& command)
      -> Result<RemoteCommandResult> override {
    calls.push_back({target, command});
    if (!script.empty()) {
      auto r = std::move(script.front());
      script.pop_front();
      return r;
    }
    return RemoteCommandResult{0, "done", std::chrono::milliseconds(1500)};
  }

  std::deque<Result<RemoteCommandResult>> script;
  std::vector<ShellCall> calls;
};

struct Notice {
  std::string to;
  std::string subject;
  std::string body;
};

class FakeNotifier final : public INotifier {
public:
  auto notify_user(const UserId& u, std::string_view subject,
                   std::string_view body) -> void override {
    user_notices.push_back({u.str(), std::string(subject), std::string(body)});
  }
  auto notify_admin(std::string_view subject, std::string_view body)
      -> void override {
    admin_notices.push_back({"admin", std::string(subject), std::string(body)});
  }

  std::vector<Notice> user_notices;
  std::vector<Notice> admin_notices;
};

}  // namespace taskchain::test
