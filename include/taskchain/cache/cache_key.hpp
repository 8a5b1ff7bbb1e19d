#pragma once

#include "taskchain/scheduler/task_message.hpp"
#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace taskchain {

inline constexpr std::string_view kErrorKeySuffix = "error";

// (task name, user, positional args, keyword args minus seq_id).
struct TaskIdentity {
  std::string task;
  UserId user;
  nlohmann::json args = nlohmann::json::array();
  nlohmann::json kwargs = nlohmann::json::object();

  [[nodiscard]] static auto of(const TaskMessage& msg) -> TaskIdentity;

  // Compact JSON of [task, user, args, kwargs]. Object keys are emitted in
  // sorted order, so structurally equal identities encode identically.
  [[nodiscard]] auto canonical() const -> std::string;
};

struct CacheKeys {
  std::string result;
  std::string error;
};

// 64 hex characters: SHA-256 of the canonical encoding.
[[nodiscard]] auto make_cache_key(const TaskIdentity& identity) -> std::string;

[[nodiscard]] auto make_error_key(std::string_view cache_key) -> std::string;

[[nodiscard]] auto derive_keys(const TaskIdentity& identity) -> CacheKeys;

}  // namespace taskchain
