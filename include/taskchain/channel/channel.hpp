#pragma once

#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace taskchain {

// "Is any client still waiting for results for this user?"
class IPresenceOracle {
public:
  virtual ~IPresenceOracle() = default;
  [[nodiscard]] virtual auto is_listening(const UserId& user) -> bool = 0;
};

// Delivers a payload to every listener of a user under a routing key (the
// task name). Returns false when no delivery channel is open.
class IResultPublisher {
public:
  virtual ~IResultPublisher() = default;
  [[nodiscard]] virtual auto publish(const UserId& user,
                                     std::string_view routing_key,
                                     const nlohmann::json& payload) -> bool = 0;
};

// Out-of-band alerting. Fire and forget.
class INotifier {
public:
  virtual ~INotifier() = default;
  virtual auto notify_user(const UserId& user, std::string_view subject,
                           std::string_view body) -> void = 0;
  virtual auto notify_admin(std::string_view subject, std::string_view body)
      -> void = 0;
};

}  // namespace taskchain
