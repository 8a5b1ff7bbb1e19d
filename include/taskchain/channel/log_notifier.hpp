#pragma once

#include "taskchain/channel/channel.hpp"

namespace taskchain {

// Writes user and operator notifications to the process log.
class LogNotifier final : public INotifier {
public:
  auto notify_user(const UserId& user, std::string_view subject,
                   std::string_view body) -> void override;
  auto notify_admin(std::string_view subject, std::string_view body)
      -> void override;
};

}  // namespace taskchain
