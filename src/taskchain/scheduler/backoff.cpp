#include "taskchain/scheduler/backoff.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace taskchain {

namespace {

constexpr std::array kDefaultSchedule = {Delay{30}, Delay{120}, Delay{600}};

// 2^31 seconds is far beyond any cap in use.
constexpr std::size_t kMaxShift = 31;

}  // namespace

auto default_backoff(FailureOffsets failures) -> BackoffDecision {
  if (failures.empty() || failures.size() > kDefaultSchedule.size()) {
    return std::nullopt;
  }
  return kDefaultSchedule[failures.size() - 1];
}

auto exponential_backoff(FailureOffsets failures, Delay base, Delay cap)
    -> BackoffDecision {
  auto shift = failures.empty() ? std::size_t{0} : failures.size() - 1;
  shift = std::min(shift, kMaxShift);
  auto delay = base * (std::int64_t{1} << shift);
  return std::min(delay, cap);
}

}  // namespace taskchain
