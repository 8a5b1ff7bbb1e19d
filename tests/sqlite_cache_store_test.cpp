#include "taskchain/cache/records.hpp"
#include "taskchain/cache/sqlite_cache_store.hpp"

#include "test_utils.hpp"

#include <filesystem>

#include "gtest/gtest.h"
#include <sqlite3.h>

using namespace taskchain;
using namespace taskchain::test;

class SqliteCacheStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_path_ = temp_path("taskchain_cache", ".db");
    store_ = std::make_unique<SqliteCacheStore>(db_path_);
  }

  void TearDown() override {
    store_.reset();
    std::filesystem::remove(db_path_);
    std::filesystem::remove(db_path_ + "-wal");
    std::filesystem::remove(db_path_ + "-shm");
  }

  std::string db_path_;
  std::unique_ptr<SqliteCacheStore> store_;
};

class OpenSqliteCacheStoreTest : public SqliteCacheStoreTest {
protected:
  void SetUp() override {
    SqliteCacheStoreTest::SetUp();
    ASSERT_TRUE(store_->open().has_value());
  }
};

TEST_F(SqliteCacheStoreTest, InitialState_IsNotOpen) {
  EXPECT_FALSE(store_->is_open());
}

TEST_F(SqliteCacheStoreTest, Get_BeforeOpen_Fails) {
  auto value = store_->get("k");

  ASSERT_FALSE(value.has_value());
  EXPECT_EQ(value.error(), make_error_code(Error::DatabaseQueryFailed));
}

TEST_F(SqliteCacheStoreTest, Open_InMissingDirectory_Fails) {
  SqliteCacheStore store("/nonexistent-dir/for/sure/cache.db");

  auto r = store.open();

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::DatabaseOpenFailed));
}

TEST_F(OpenSqliteCacheStoreTest, SetGetRemove) {
  ASSERT_TRUE(store_->set("k", nlohmann::json{{"payload", {1, 2, 3}}}));

  auto value = store_->get("k");
  ASSERT_TRUE(value.has_value());
  ASSERT_TRUE(value->has_value());
  EXPECT_EQ((**value)["payload"][2], 3);

  ASSERT_TRUE(store_->remove("k"));
  auto gone = store_->get("k");
  ASSERT_TRUE(gone.has_value());
  EXPECT_FALSE(gone->has_value());
}

TEST_F(OpenSqliteCacheStoreTest, Set_UpsertsExistingKey) {
  ASSERT_TRUE(store_->set("k", 1));
  ASSERT_TRUE(store_->set("k", 2));

  EXPECT_EQ(**store_->get("k"), 2);
  auto n = store_->count();
  ASSERT_TRUE(n.has_value());
  EXPECT_EQ(*n, 1u);
}

TEST_F(OpenSqliteCacheStoreTest, Records_SurviveReopen) {
  ResultRecord record{from_timestamp(1'700'000'000'000),
                      nlohmann::json{{"ok", true}}, seq("s1")};
  ASSERT_TRUE(store_result_record(*store_, "key", record));

  store_->close();
  ASSERT_TRUE(store_->open());

  auto loaded = load_result_record(*store_, "key");
  ASSERT_TRUE(loaded.has_value());
  ASSERT_TRUE(loaded->has_value());
  EXPECT_EQ((*loaded)->seq_id, seq("s1"));
  EXPECT_EQ((*loaded)->timestamp, record.timestamp);
}

TEST_F(OpenSqliteCacheStoreTest, InvalidJson_IsCorruptAndLoadsAsAbsent) {
  sqlite3* db = nullptr;
  ASSERT_EQ(sqlite3_open(db_path_.c_str(), &db), SQLITE_OK);
  ASSERT_EQ(sqlite3_exec(db,
                         "INSERT INTO cache (key, value, updated_at) "
                         "VALUES ('bad', '{not json', 0);",
                         nullptr, nullptr, nullptr),
            SQLITE_OK);
  sqlite3_close(db);

  auto raw = store_->get("bad");
  ASSERT_FALSE(raw.has_value());
  EXPECT_EQ(raw.error(), make_error_code(Error::CorruptRecord));

  auto loaded = load_result_record(*store_, "bad");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_FALSE(loaded->has_value());
}

TEST_F(OpenSqliteCacheStoreTest, TwoConnections_ShareData) {
  SqliteCacheStore other(db_path_);
  ASSERT_TRUE(other.open());

  ASSERT_TRUE(store_->set("shared", "v"));

  auto value = other.get("shared");
  ASSERT_TRUE(value.has_value());
  ASSERT_TRUE(value->has_value());
  EXPECT_EQ(**value, "v");
}
