#include "taskchain/cache/cache_key.hpp"
#include "taskchain/cache/records.hpp"
#include "taskchain/task/task_client.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace taskchain;
using namespace taskchain::test;
using namespace std::chrono_literals;

class TaskClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(registry_.add(std::make_unique<ScriptedTask>(
        TaskSpec{"list_sizes", 3600s, 7 * 24h, false})));
  }

  void seed(std::chrono::seconds age) {
    auto msg = make_message("list_sizes", "alice", {"ec2"});
    ResultRecord record{clock_.now() - age, nlohmann::json{{"sizes", {"s"}}},
                        seq("s1")};
    ASSERT_TRUE(store_result_record(
        cache_, make_cache_key(TaskIdentity::of(msg)), record));
  }

  TaskRegistry registry_;
  MemoryCacheStore cache_;
  RecordingQueue queue_;
  ManualClock clock_;
  TaskClient client_{registry_, cache_, queue_, clock_};
};

TEST_F(TaskClientTest, SmartDelay_NothingCached_SubmitsAndReturnsNothing) {
  auto r = client_.smart_delay("list_sizes", user("alice"), {"ec2"});

  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_value());
  ASSERT_EQ(queue_.size(), 1u);
  EXPECT_EQ(queue_.submissions[0].delay, 0ms);
  EXPECT_TRUE(queue_.submissions[0].msg.seq_id().empty());
}

TEST_F(TaskClientTest, SmartDelay_FreshCache_ReturnsPayloadWithoutSubmit) {
  seed(60s);

  auto r = client_.smart_delay("list_sizes", user("alice"), {"ec2"});

  ASSERT_TRUE(r.has_value());
  ASSERT_TRUE(r->has_value());
  EXPECT_EQ((**r)["sizes"][0], "s");
  EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(TaskClientTest, SmartDelay_StaleButUnexpired_ReturnsPayloadAndRefreshes) {
  seed(2h);

  auto r = client_.smart_delay("list_sizes", user("alice"), {"ec2"});

  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->has_value());
  EXPECT_EQ(queue_.size(), 1u);
}

TEST_F(TaskClientTest, SmartDelay_Expired_OnlyRefreshes) {
  seed(8 * 24h);

  auto r = client_.smart_delay("list_sizes", user("alice"), {"ec2"});

  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_value());
  EXPECT_EQ(queue_.size(), 1u);
}

TEST_F(TaskClientTest, SmartDelay_UnknownTask_IsNotFound) {
  auto r = client_.smart_delay("nope", user("alice"), {"ec2"});

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskClientTest, Trigger_StripsSeqId) {
  ASSERT_TRUE(client_.trigger("list_sizes", user("alice"), {"ec2"},
                              {{"seq_id", "forged"}, {"extra", 1}}));

  ASSERT_EQ(queue_.size(), 1u);
  const auto& msg = queue_.submissions[0].msg;
  EXPECT_TRUE(msg.seq_id().empty());
  EXPECT_EQ(msg.kwargs["extra"], 1);
  EXPECT_EQ(msg.user, user("alice"));
}

TEST_F(TaskClientTest, Trigger_UnknownTask_IsNotFound) {
  auto r = client_.trigger("nope", user("alice"), {"ec2"});

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::NotFound));
  EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(TaskClientTest, ClearCache_RemovesResult) {
  seed(60s);

  ASSERT_TRUE(client_.clear_cache("list_sizes", user("alice"), {"ec2"}));

  auto r = client_.smart_delay("list_sizes", user("alice"), {"ec2"});
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->has_value());
}
