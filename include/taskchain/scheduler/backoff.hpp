#pragma once

#include <chrono>
#include <optional>
#include <span>

namespace taskchain {

using Delay = std::chrono::seconds;

// Offsets of every consecutive failure of a chain relative to the first
// one. The first element is always zero; size() is the failure count.
using FailureOffsets = std::span<const std::chrono::milliseconds>;

// A retry delay, or std::nullopt to give up.
using BackoffDecision = std::optional<Delay>;

// 30 s after the first failure, 120 s after the second, 600 s after the
// third, give up from the fourth on.
[[nodiscard]] auto default_backoff(FailureOffsets failures) -> BackoffDecision;

// base, 2*base, 4*base, ... capped at `cap`. Never gives up.
[[nodiscard]] auto exponential_backoff(FailureOffsets failures, Delay base,
                                       Delay cap) -> BackoffDecision;

[[nodiscard]] constexpr auto constant_backoff(FailureOffsets, Delay delay)
    -> BackoffDecision {
  return delay;
}

}  // namespace taskchain
