#include "taskchain/scheduler/task_message.hpp"

namespace taskchain {

auto TaskMessage::seq_id() const -> SeqId {
  if (!kwargs.is_object()) {
    return SeqId{};
  }
  auto it = kwargs.find(kSeqIdField);
  if (it == kwargs.end() || !it->is_string()) {
    return SeqId{};
  }
  return SeqId{it->get<std::string>()};
}

auto TaskMessage::set_seq_id(const SeqId& seq) -> void {
  if (!kwargs.is_object()) {
    kwargs = nlohmann::json::object();
  }
  kwargs[kSeqIdField] = seq.str();
}

auto TaskMessage::identity_kwargs() const -> nlohmann::json {
  if (!kwargs.is_object()) {
    return nlohmann::json::object();
  }
  auto stripped = kwargs;
  stripped.erase(kSeqIdField);
  return stripped;
}

auto TaskMessage::describe() const -> std::string {
  return nlohmann::json::array({task, user.str(), args, identity_kwargs()})
      .dump();
}

auto to_json(nlohmann::json& j, const TaskMessage& msg) -> void {
  j = nlohmann::json{{"task", msg.task},
                     {"user", msg.user.str()},
                     {"args", msg.args},
                     {"kwargs", msg.kwargs}};
}

auto from_json(const nlohmann::json& j, TaskMessage& msg) -> void {
  msg.task = j.at("task").get<std::string>();
  msg.user = UserId{j.at("user").get<std::string>()};
  msg.args = j.value("args", nlohmann::json::array());
  msg.kwargs = j.value("kwargs", nlohmann::json::object());
}

}  // namespace taskchain
