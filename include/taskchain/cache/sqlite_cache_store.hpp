#pragma once

#include "taskchain/cache/cache_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace taskchain {

// Cache store backed by a single SQLite table. Several worker processes may
// share one database file; WAL mode keeps readers from blocking the writer.
class SqliteCacheStore final : public ICacheStore {
public:
  explicit SqliteCacheStore(std::string_view db_path);
  ~SqliteCacheStore() override;

  SqliteCacheStore(const SqliteCacheStore&) = delete;
  SqliteCacheStore& operator=(const SqliteCacheStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto get(std::string_view key)
      -> Result<std::optional<nlohmann::json>> override;
  [[nodiscard]] auto set(std::string_view key, const nlohmann::json& value)
      -> Result<void> override;
  [[nodiscard]] auto remove(std::string_view key) -> Result<void> override;

  [[nodiscard]] auto count() -> Result<std::size_t>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  // One connection shared by all workers of this process.
  std::mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace taskchain
