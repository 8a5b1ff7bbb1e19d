#pragma once

#include <chrono>
#include <cstdint>

namespace taskchain {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Wall-clock source. Record ages are computed against it, so tests swap in a
// manual implementation.
class IClock {
public:
  virtual ~IClock() = default;
  [[nodiscard]] virtual auto now() const -> TimePoint = 0;
};

class SystemClock final : public IClock {
public:
  [[nodiscard]] auto now() const -> TimePoint override {
    return Clock::now();
  }
};

[[nodiscard]] inline auto system_clock() -> const IClock& {
  static const SystemClock instance;
  return instance;
}

[[nodiscard]] inline auto to_timestamp(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_timestamp(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

}  // namespace taskchain
