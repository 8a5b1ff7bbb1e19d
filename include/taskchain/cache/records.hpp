#pragma once

#include "taskchain/cache/cache_store.hpp"
#include "taskchain/core/error.hpp"
#include "taskchain/util/clock.hpp"
#include "taskchain/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

namespace taskchain {

// Last successful, published result for one identity.
struct ResultRecord {
  TimePoint timestamp{};
  nlohmann::json payload;
  SeqId seq_id;

  [[nodiscard]] auto age(TimePoint now) const -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now -
                                                                 timestamp);
  }
};

// Consecutive failures of one chain since its last success.
struct ErrorRecord {
  SeqId seq_id;
  std::vector<TimePoint> timestamps;

  auto record_failure(TimePoint when) -> void;

  // Failure instants relative to the first one; the first offset is zero.
  [[nodiscard]] auto offsets() const -> std::vector<std::chrono::milliseconds>;
};

auto to_json(nlohmann::json& j, const ResultRecord& record) -> void;
auto from_json(const nlohmann::json& j, ResultRecord& record) -> void;
auto to_json(nlohmann::json& j, const ErrorRecord& record) -> void;
auto from_json(const nlohmann::json& j, ErrorRecord& record) -> void;

// Typed accessors over ICacheStore. A stored value that does not decode is
// logged and reported as absent so the next write replaces it.
[[nodiscard]] auto load_result_record(ICacheStore& store, std::string_view key)
    -> Result<std::optional<ResultRecord>>;
[[nodiscard]] auto load_error_record(ICacheStore& store, std::string_view key)
    -> Result<std::optional<ErrorRecord>>;
[[nodiscard]] auto store_result_record(ICacheStore& store,
                                       std::string_view key,
                                       const ResultRecord& record)
    -> Result<void>;
[[nodiscard]] auto store_error_record(ICacheStore& store, std::string_view key,
                                      const ErrorRecord& record)
    -> Result<void>;

}  // namespace taskchain
