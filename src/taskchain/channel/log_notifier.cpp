#include "taskchain/channel/log_notifier.hpp"

#include "taskchain/util/log.hpp"

namespace taskchain {

auto LogNotifier::notify_user(const UserId& user, std::string_view subject,
                              std::string_view body) -> void {
  if (body.empty()) {
    log::warn("[notify {}] {}", user, subject);
  } else {
    log::warn("[notify {}] {}\n{}", user, subject, body);
  }
}

auto LogNotifier::notify_admin(std::string_view subject,
                               std::string_view body) -> void {
  if (body.empty()) {
    log::warn("[admin] {}", subject);
  } else {
    log::warn("[admin] {}\n{}", subject, body);
  }
}

}  // namespace taskchain
