#pragma once

#include "taskchain/core/error.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace taskchain {

// Shared key/value store for result and error records. Keys are opaque
// strings, values self-describing JSON documents. No TTLs and no
// transactions across keys.
class ICacheStore {
public:
  virtual ~ICacheStore() = default;

  [[nodiscard]] virtual auto get(std::string_view key)
      -> Result<std::optional<nlohmann::json>> = 0;
  [[nodiscard]] virtual auto set(std::string_view key,
                                 const nlohmann::json& value)
      -> Result<void> = 0;
  // Removing an absent key succeeds.
  [[nodiscard]] virtual auto remove(std::string_view key) -> Result<void> = 0;
};

}  // namespace taskchain
