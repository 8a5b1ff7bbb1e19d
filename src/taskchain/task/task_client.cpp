#include "taskchain/task/task_client.hpp"

#include "taskchain/cache/cache_key.hpp"
#include "taskchain/cache/records.hpp"
#include "taskchain/util/log.hpp"

namespace taskchain {

TaskClient::TaskClient(const TaskRegistry& registry, ICacheStore& cache,
                       ITaskQueue& queue, const IClock& clock)
    : registry_(registry), cache_(cache), queue_(queue), clock_(clock) {
}

auto TaskClient::make_message(std::string_view task, const UserId& user,
                              nlohmann::json args,
                              nlohmann::json kwargs) const -> TaskMessage {
  TaskMessage msg;
  msg.task = std::string(task);
  msg.user = user;
  msg.args = args.is_array() ? std::move(args) : nlohmann::json::array();
  msg.kwargs = kwargs.is_object() ? std::move(kwargs) : nlohmann::json::object();
  msg.kwargs.erase(kSeqIdField);
  return msg;
}

auto TaskClient::trigger(std::string_view task, const UserId& user,
                         nlohmann::json args, nlohmann::json kwargs)
    -> Result<void> {
  if (!registry_.find_task(task) && !registry_.find_job(task)) {
    log::warn("Trigger for unknown task {}", task);
    return fail(Error::NotFound);
  }
  return queue_.submit(
      make_message(task, user, std::move(args), std::move(kwargs)));
}

auto TaskClient::smart_delay(std::string_view task, const UserId& user,
                             nlohmann::json args, nlohmann::json kwargs)
    -> Result<std::optional<nlohmann::json>> {
  auto* def = registry_.find_task(task);
  if (!def) {
    log::warn("smart_delay for unknown task {}", task);
    return fail(Error::NotFound);
  }

  auto msg = make_message(task, user, std::move(args), std::move(kwargs));
  auto identity = TaskIdentity::of(msg);
  auto id = identity.canonical();

  auto cached = load_result_record(cache_, make_cache_key(identity));
  if (!cached) {
    return std::unexpected(cached.error());
  }
  if (!*cached) {
    if (auto r = queue_.submit(std::move(msg)); !r) {
      return std::unexpected(r.error());
    }
    return std::optional<nlohmann::json>{};
  }

  auto age = (*cached)->age(clock_.now());
  if (age > def->spec().result_fresh) {
    log::info("{}: scheduling task", id);
    if (auto r = queue_.submit(std::move(msg)); !r) {
      return std::unexpected(r.error());
    }
  }
  if (age < def->spec().result_expires) {
    log::info("{}: smart delay cache hit", id);
    return std::optional<nlohmann::json>{std::move((*cached)->payload)};
  }
  return std::optional<nlohmann::json>{};
}

auto TaskClient::clear_cache(std::string_view task, const UserId& user,
                             nlohmann::json args, nlohmann::json kwargs)
    -> Result<void> {
  auto msg = make_message(task, user, std::move(args), std::move(kwargs));
  auto identity = TaskIdentity::of(msg);
  log::info("Clearing cache for '{}'", identity.canonical());
  return cache_.remove(make_cache_key(identity));
}

}  // namespace taskchain
