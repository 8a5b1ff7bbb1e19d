#pragma once

#include "taskchain/cache/cache_store.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace taskchain {

// Process-local store. Suitable for a single worker process and for tests.
class MemoryCacheStore final : public ICacheStore {
public:
  [[nodiscard]] auto get(std::string_view key)
      -> Result<std::optional<nlohmann::json>> override;
  [[nodiscard]] auto set(std::string_view key, const nlohmann::json& value)
      -> Result<void> override;
  [[nodiscard]] auto remove(std::string_view key) -> Result<void> override;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto contains(std::string_view key) const -> bool;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, nlohmann::json, StringHash, StringEqual>
      entries_;
};

}  // namespace taskchain
