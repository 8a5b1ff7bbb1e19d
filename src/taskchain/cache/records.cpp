#include "taskchain/cache/records.hpp"

#include "taskchain/util/log.hpp"

#include <ranges>

namespace taskchain {

namespace {

template <typename Record>
auto load_record(ICacheStore& store, std::string_view key)
    -> Result<std::optional<Record>> {
  auto raw = store.get(key);
  if (!raw) {
    if (raw.error() == Error::CorruptRecord) {
      return std::optional<Record>{};
    }
    return std::unexpected(raw.error());
  }
  if (!raw->has_value()) {
    return std::optional<Record>{};
  }
  try {
    return std::optional<Record>{(*raw)->template get<Record>()};
  } catch (const nlohmann::json::exception& e) {
    log::warn("Discarding undecodable cache record {}: {}", key, e.what());
    return std::optional<Record>{};
  }
}

}  // namespace

auto ErrorRecord::record_failure(TimePoint when) -> void {
  // Clock steps backwards must not break the non-decreasing order.
  if (!timestamps.empty() && when < timestamps.back()) {
    when = timestamps.back();
  }
  timestamps.push_back(when);
}

auto ErrorRecord::offsets() const -> std::vector<std::chrono::milliseconds> {
  if (timestamps.empty()) {
    return {};
  }
  auto first = timestamps.front();
  return timestamps | std::views::transform([first](TimePoint tp) {
           return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp - first);
         }) |
         std::ranges::to<std::vector>();
}

auto to_json(nlohmann::json& j, const ResultRecord& record) -> void {
  j = nlohmann::json{{"timestamp", to_timestamp(record.timestamp)},
                     {"payload", record.payload},
                     {"seq_id", record.seq_id.str()}};
}

auto from_json(const nlohmann::json& j, ResultRecord& record) -> void {
  record.timestamp = from_timestamp(j.at("timestamp").get<std::int64_t>());
  record.payload = j.at("payload");
  record.seq_id = SeqId{j.value("seq_id", std::string{})};
}

auto to_json(nlohmann::json& j, const ErrorRecord& record) -> void {
  auto stamps = nlohmann::json::array();
  for (auto tp : record.timestamps) {
    stamps.push_back(to_timestamp(tp));
  }
  j = nlohmann::json{{"seq_id", record.seq_id.str()},
                     {"timestamps", std::move(stamps)}};
}

auto from_json(const nlohmann::json& j, ErrorRecord& record) -> void {
  record.seq_id = SeqId{j.value("seq_id", std::string{})};
  record.timestamps.clear();
  for (const auto& ts : j.at("timestamps")) {
    record.timestamps.push_back(from_timestamp(ts.get<std::int64_t>()));
  }
}

auto load_result_record(ICacheStore& store, std::string_view key)
    -> Result<std::optional<ResultRecord>> {
  return load_record<ResultRecord>(store, key);
}

auto load_error_record(ICacheStore& store, std::string_view key)
    -> Result<std::optional<ErrorRecord>> {
  return load_record<ErrorRecord>(store, key);
}

auto store_result_record(ICacheStore& store, std::string_view key,
                         const ResultRecord& record) -> Result<void> {
  return store.set(key, nlohmann::json(record));
}

auto store_error_record(ICacheStore& store, std::string_view key,
                        const ErrorRecord& record) -> Result<void> {
  return store.set(key, nlohmann::json(record));
}

}  // namespace taskchain
