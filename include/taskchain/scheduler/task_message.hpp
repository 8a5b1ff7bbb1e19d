#pragma once

#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace taskchain {

// Reserved keyword argument carrying the chain token between reruns.
inline constexpr const char* kSeqIdField = "seq_id";

// One queued invocation: which task, for whom, with what arguments.
struct TaskMessage {
  std::string task;
  UserId user;
  nlohmann::json args = nlohmann::json::array();
  nlohmann::json kwargs = nlohmann::json::object();

  // Empty for an external trigger.
  [[nodiscard]] auto seq_id() const -> SeqId;
  auto set_seq_id(const SeqId& seq) -> void;

  // kwargs without the reserved seq_id field.
  [[nodiscard]] auto identity_kwargs() const -> nlohmann::json;

  // Human readable identity used in log lines.
  [[nodiscard]] auto describe() const -> std::string;
};

auto to_json(nlohmann::json& j, const TaskMessage& msg) -> void;
auto from_json(const nlohmann::json& j, TaskMessage& msg) -> void;

}  // namespace taskchain
