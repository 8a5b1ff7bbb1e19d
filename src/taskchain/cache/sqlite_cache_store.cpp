#include "taskchain/cache/sqlite_cache_store.hpp"

#include "taskchain/util/clock.hpp"
#include "taskchain/util/log.hpp"

#include <sqlite3.h>

namespace taskchain {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

}  // namespace

auto SqliteCacheStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteCacheStore::Statement::~Statement() {
  reset();
}

auto SqliteCacheStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteCacheStore::SqliteCacheStore(std::string_view db_path)
    : db_path_(db_path) {
}

SqliteCacheStore::~SqliteCacheStore() {
  close();
}

auto SqliteCacheStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    return fail(Error::DatabaseQueryFailed);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto SqliteCacheStore::execute(std::string_view sql) -> Result<void> {
  std::string sql_str{sql};
  char* err = nullptr;
  if (sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err) !=
      SQLITE_OK) {
    log::error("SQL error: {}", err ? err : "unknown");
    sqlite3_free(err);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteCacheStore::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(
      db_path_.c_str(), &raw_db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open cache database: {}",
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 5000);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Cache database opened: {}", db_path_);
  return ok();
}

auto SqliteCacheStore::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto SqliteCacheStore::create_tables() -> Result<void> {
  return execute(R"(
    CREATE TABLE IF NOT EXISTS cache (
      key TEXT PRIMARY KEY,
      value TEXT NOT NULL,
      updated_at INTEGER NOT NULL
    );
  )");
}

auto SqliteCacheStore::get(std::string_view key)
    -> Result<std::optional<nlohmann::json>> {
  std::lock_guard lock(mu_);
  auto result = prepare("SELECT value FROM cache WHERE key = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::string key_str(key);
  sqlite3_bind_text(stmt.get(), 1, key_str.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return std::optional<nlohmann::json>{};
  }
  if (rc != SQLITE_ROW) {
    log::error("Cache read failed for {}: {}", key, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  auto text = col_text(stmt.get(), 0);
  auto value = nlohmann::json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    log::warn("Cache value for {} is not valid JSON", key);
    return fail(Error::CorruptRecord);
  }
  return std::optional<nlohmann::json>{std::move(value)};
}

auto SqliteCacheStore::set(std::string_view key, const nlohmann::json& value)
    -> Result<void> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    INSERT INTO cache (key, value, updated_at) VALUES (?, ?, ?)
    ON CONFLICT(key) DO UPDATE SET
      value = excluded.value,
      updated_at = excluded.updated_at;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::string key_str(key);
  std::string text = value.dump();
  sqlite3_bind_text(stmt.get(), 1, key_str.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 3, to_timestamp(Clock::now()));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Cache write failed for {}: {}", key,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteCacheStore::remove(std::string_view key) -> Result<void> {
  std::lock_guard lock(mu_);
  auto result = prepare("DELETE FROM cache WHERE key = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::string key_str(key);
  sqlite3_bind_text(stmt.get(), 1, key_str.c_str(), -1, SQLITE_TRANSIENT);

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto SqliteCacheStore::count() -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto result = prepare("SELECT COUNT(*) FROM cache;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace taskchain
