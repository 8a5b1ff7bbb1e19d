#pragma once

#include "taskchain/channel/channel.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace taskchain {

// In-process pub/sub hub. A user is "listening" while at least one
// subscription for them is alive.
class LocalChannel final : public IPresenceOracle, public IResultPublisher {
public:
  using Listener = std::function<void(std::string_view routing_key,
                                      const nlohmann::json& payload)>;

  // Unsubscribes on destruction.
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    auto operator=(Subscription&& other) noexcept -> Subscription&;
    Subscription(const Subscription&) = delete;
    auto operator=(const Subscription&) -> Subscription& = delete;

    auto reset() -> void;
    [[nodiscard]] auto active() const noexcept -> bool {
      return channel_ != nullptr;
    }

  private:
    friend class LocalChannel;
    Subscription(LocalChannel* channel, std::uint64_t id)
        : channel_(channel), id_(id) {
    }

    LocalChannel* channel_{nullptr};
    std::uint64_t id_{0};
  };

  LocalChannel();
  ~LocalChannel() override;

  LocalChannel(const LocalChannel&) = delete;
  auto operator=(const LocalChannel&) -> LocalChannel& = delete;

  [[nodiscard]] auto subscribe(const UserId& user, Listener listener)
      -> Subscription;

  [[nodiscard]] auto is_listening(const UserId& user) -> bool override;
  [[nodiscard]] auto publish(const UserId& user, std::string_view routing_key,
                             const nlohmann::json& payload) -> bool override;

  [[nodiscard]] auto listener_count(const UserId& user) const -> std::size_t;

private:
  auto unsubscribe(std::uint64_t id) -> void;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace taskchain
