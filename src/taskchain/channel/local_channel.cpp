#include "taskchain/channel/local_channel.hpp"

#include "taskchain/util/log.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <unordered_map>
#include <utility>
#include <vector>

namespace taskchain {

struct LocalChannel::Impl {
  struct Entry {
    UserId user;
    std::shared_ptr<Listener> listener;
  };

  mutable std::mutex mu;
  std::uint64_t next_id{1};
  std::unordered_map<std::uint64_t, Entry> entries;
};

LocalChannel::Subscription::~Subscription() {
  reset();
}

LocalChannel::Subscription::Subscription(Subscription&& other) noexcept
    : channel_(std::exchange(other.channel_, nullptr)),
      id_(std::exchange(other.id_, 0)) {
}

auto LocalChannel::Subscription::operator=(Subscription&& other) noexcept
    -> Subscription& {
  if (this != &other) {
    reset();
    channel_ = std::exchange(other.channel_, nullptr);
    id_ = std::exchange(other.id_, 0);
  }
  return *this;
}

auto LocalChannel::Subscription::reset() -> void {
  if (channel_) {
    channel_->unsubscribe(id_);
    channel_ = nullptr;
    id_ = 0;
  }
}

LocalChannel::LocalChannel() : impl_(std::make_unique<Impl>()) {
}

LocalChannel::~LocalChannel() = default;

auto LocalChannel::subscribe(const UserId& user, Listener listener)
    -> Subscription {
  std::lock_guard lock(impl_->mu);
  auto id = impl_->next_id++;
  impl_->entries.emplace(
      id, Impl::Entry{user, std::make_shared<Listener>(std::move(listener))});
  log::debug("Listener {} subscribed for user {}", id, user);
  return Subscription{this, id};
}

auto LocalChannel::unsubscribe(std::uint64_t id) -> void {
  std::lock_guard lock(impl_->mu);
  impl_->entries.erase(id);
  log::debug("Listener {} unsubscribed", id);
}

auto LocalChannel::is_listening(const UserId& user) -> bool {
  return listener_count(user) > 0;
}

auto LocalChannel::publish(const UserId& user, std::string_view routing_key,
                           const nlohmann::json& payload) -> bool {
  std::vector<std::shared_ptr<Listener>> targets;
  {
    std::lock_guard lock(impl_->mu);
    for (const auto& entry : impl_->entries | std::views::values) {
      if (entry.user == user) {
        targets.push_back(entry.listener);
      }
    }
  }
  if (targets.empty()) {
    return false;
  }

  // Listeners run outside the lock so they may subscribe or unsubscribe.
  for (const auto& listener : targets) {
    (*listener)(routing_key, payload);
  }
  return true;
}

auto LocalChannel::listener_count(const UserId& user) const -> std::size_t {
  std::lock_guard lock(impl_->mu);
  return static_cast<std::size_t>(
      std::ranges::count_if(impl_->entries | std::views::values,
                            [&](const auto& e) { return e.user == user; }));
}

}  // namespace taskchain
