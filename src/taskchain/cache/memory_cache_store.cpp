#include "taskchain/cache/memory_cache_store.hpp"

namespace taskchain {

auto MemoryCacheStore::get(std::string_view key)
    -> Result<std::optional<nlohmann::json>> {
  std::lock_guard lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::optional<nlohmann::json>{};
  }
  return std::optional<nlohmann::json>{it->second};
}

auto MemoryCacheStore::set(std::string_view key, const nlohmann::json& value)
    -> Result<void> {
  std::lock_guard lock(mu_);
  if (auto it = entries_.find(key); it != entries_.end()) {
    it->second = value;
  } else {
    entries_.emplace(std::string(key), value);
  }
  return ok();
}

auto MemoryCacheStore::remove(std::string_view key) -> Result<void> {
  std::lock_guard lock(mu_);
  if (auto it = entries_.find(key); it != entries_.end()) {
    entries_.erase(it);
  }
  return ok();
}

auto MemoryCacheStore::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return entries_.size();
}

auto MemoryCacheStore::contains(std::string_view key) const -> bool {
  std::lock_guard lock(mu_);
  return entries_.find(key) != entries_.end();
}

}  // namespace taskchain
