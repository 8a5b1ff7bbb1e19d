#include "taskchain/task/task_runner.hpp"

#include "taskchain/util/log.hpp"

#include <optional>

namespace taskchain {

TaskRunner::TaskRunner(ICacheStore& cache, ITaskQueue& queue,
                       IPresenceOracle& presence, IResultPublisher& publisher,
                       const IClock& clock)
    : cache_(cache),
      queue_(queue),
      presence_(presence),
      publisher_(publisher),
      clock_(clock) {
}

auto TaskRunner::run(Task& task, TaskMessage msg) -> Result<RunOutcome> {
  auto identity = TaskIdentity::of(msg);
  auto inbound = msg.seq_id();
  Chain chain{task, std::move(msg), derive_keys(identity),
              identity.canonical(), SeqId{}, std::nullopt};
  const auto& id = chain.id_str;

  // At-least-once delivery can hand the same rerun to two workers.
  std::optional<Claim> claimed;
  if (!inbound.empty()) {
    auto token = chain.keys.result + inbound.str();
    if (!claim(token)) {
      log::warn("{}: [{}] already running, dropping duplicate delivery", id,
                inbound);
      return RunOutcome::DuplicateDelivery;
    }
    claimed.emplace(*this, std::move(token));
  }

  auto errors = load_error_record(cache_, chain.keys.error);
  if (!errors) {
    return std::unexpected(errors.error());
  }
  chain.errors = std::move(*errors);

  if (!presence_.is_listening(chain.msg.user)) {
    // Nobody waits for the result: stop, and forget the failure history.
    if (chain.errors) {
      if (auto r = cache_.remove(chain.keys.error); !r) {
        return std::unexpected(r.error());
      }
    }
    log::debug("{}: nobody listening, stopping [{}]", id, inbound);
    return RunOutcome::PresenceLost;
  }

  auto cached = load_result_record(cache_, chain.keys.result);
  if (!cached) {
    return std::unexpected(cached.error());
  }
  if (*cached) {
    const auto& record = **cached;
    if (!inbound.empty() && inbound != record.seq_id) {
      log::info("{}: found new cached seq_id [{}], stopping iteration of [{}]",
                id, record.seq_id, inbound);
      return RunOutcome::Superseded;
    }
    if (inbound.empty() &&
        record.age(clock_.now()) < task.spec().result_fresh) {
      log::info("{}: fresh task submitted with fresh cached result, dropping",
                id);
      return RunOutcome::FreshCacheHit;
    }
  }

  if (inbound.empty()) {
    chain.seq = generate_seq_id();
    log::info("{}: fresh task submitted [{}]", id, chain.seq);
  } else {
    chain.seq = inbound;
  }

  auto step = attempt(chain);
  return std::visit([&](auto& s) { return finish(chain, s); }, step);
}

auto TaskRunner::attempt(Chain& chain) -> StepResult {
  auto result = chain.task.execute(chain.msg.user, chain.msg.args);
  if (result) {
    return StepSuccess{std::move(*result)};
  }

  if (!chain.errors) {
    chain.errors = ErrorRecord{chain.seq, {}};
  }
  chain.errors->record_failure(clock_.now());
  auto offsets = chain.errors->offsets();

  auto decision = chain.task.backoff(result.error(), offsets, chain.msg.user,
                                     chain.msg.args,
                                     chain.msg.identity_kwargs());
  if (decision) {
    return StepRetry{*decision, result.error()};
  }
  return StepGiveUp{result.error()};
}

auto TaskRunner::finish(Chain& chain, StepSuccess& step)
    -> Result<RunOutcome> {
  const auto& id = chain.id_str;
  const auto& spec = chain.task.spec();

  if (chain.errors) {
    if (auto r = cache_.remove(chain.keys.error); !r) {
      return std::unexpected(r.error());
    }
    log::info("{}: recovered after {} failures", id,
              chain.errors->timestamps.size());
  }

  ResultRecord record{clock_.now(), std::move(step.payload), chain.seq};
  if (!publisher_.publish(chain.msg.user, chain.task.name(), record.payload)) {
    log::info("{}: exchange closed", id);
    return RunOutcome::PublishFailed;
  }

  if (auto r = store_result_record(cache_, chain.keys.result, record); !r) {
    return std::unexpected(r.error());
  }

  if (!spec.polling) {
    return RunOutcome::Completed;
  }

  log::info("{}: will rerun in {} secs [{}]", id, spec.result_fresh.count(),
            chain.seq);
  if (auto r = resubmit(chain, spec.result_fresh); !r) {
    return std::unexpected(r.error());
  }
  return RunOutcome::Rescheduled;
}

auto TaskRunner::finish(Chain& chain, StepRetry& step) -> Result<RunOutcome> {
  log::warn("{}: error {}, rerun in {} secs", chain.id_str,
            step.error.message(), step.delay.count());

  if (auto r = store_error_record(cache_, chain.keys.error, *chain.errors);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = resubmit(chain, step.delay); !r) {
    return std::unexpected(r.error());
  }
  return RunOutcome::RetryScheduled;
}

auto TaskRunner::finish(Chain& chain, StepGiveUp& step) -> Result<RunOutcome> {
  log::warn("{}: error {}, giving up after {} failures", chain.id_str,
            step.error.message(), chain.errors->timestamps.size());

  if (auto r = cache_.remove(chain.keys.error); !r) {
    return std::unexpected(r.error());
  }
  return RunOutcome::GaveUp;
}

auto TaskRunner::resubmit(const Chain& chain, std::chrono::milliseconds delay)
    -> Result<void> {
  TaskMessage next = chain.msg;
  next.set_seq_id(chain.seq);
  if (auto r = queue_.submit(std::move(next), delay); !r) {
    log::error("{}: failed to resubmit [{}]: {}", chain.id_str, chain.seq,
               r.error().message());
    return r;
  }
  return ok();
}

auto TaskRunner::claim(const std::string& token) -> bool {
  std::lock_guard lock(in_flight_mu_);
  return in_flight_.insert(token).second;
}

auto TaskRunner::release(const std::string& token) -> void {
  std::lock_guard lock(in_flight_mu_);
  in_flight_.erase(token);
}

}  // namespace taskchain
