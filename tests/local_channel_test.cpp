#include "taskchain/channel/local_channel.hpp"

#include "test_utils.hpp"

#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace taskchain;
using namespace taskchain::test;

TEST(LocalChannelTest, NoSubscription_NotListeningAndPublishFails) {
  LocalChannel channel;

  EXPECT_FALSE(channel.is_listening(user("alice")));
  EXPECT_FALSE(channel.publish(user("alice"), "ping", nlohmann::json::object()));
}

TEST(LocalChannelTest, Subscription_DeliversOnlyToItsUser) {
  LocalChannel channel;
  std::vector<std::string> alice_keys;
  std::vector<std::string> bob_keys;
  auto a = channel.subscribe(user("alice"),
                             [&](std::string_view key, const nlohmann::json&) {
                               alice_keys.emplace_back(key);
                             });
  auto b = channel.subscribe(user("bob"),
                             [&](std::string_view key, const nlohmann::json&) {
                               bob_keys.emplace_back(key);
                             });

  EXPECT_TRUE(channel.publish(user("alice"), "ping", {{"x", 1}}));

  EXPECT_EQ(alice_keys, std::vector<std::string>{"ping"});
  EXPECT_TRUE(bob_keys.empty());
}

TEST(LocalChannelTest, DestroyedSubscription_StopsListening) {
  LocalChannel channel;
  {
    auto sub = channel.subscribe(user("alice"),
                                 [](std::string_view, const nlohmann::json&) {});
    EXPECT_TRUE(channel.is_listening(user("alice")));
  }

  EXPECT_FALSE(channel.is_listening(user("alice")));
}

TEST(LocalChannelTest, MovedSubscription_StaysActive) {
  LocalChannel channel;
  LocalChannel::Subscription kept;
  {
    auto sub = channel.subscribe(user("alice"),
                                 [](std::string_view, const nlohmann::json&) {});
    kept = std::move(sub);
    EXPECT_FALSE(sub.active());
  }

  EXPECT_TRUE(kept.active());
  EXPECT_EQ(channel.listener_count(user("alice")), 1u);
  kept.reset();
  EXPECT_EQ(channel.listener_count(user("alice")), 0u);
}

TEST(LocalChannelTest, Listener_MayUnsubscribeItself) {
  LocalChannel channel;
  LocalChannel::Subscription sub;
  int calls = 0;
  sub = channel.subscribe(user("alice"),
                          [&](std::string_view, const nlohmann::json&) {
                            ++calls;
                            sub.reset();
                          });

  EXPECT_TRUE(channel.publish(user("alice"), "ping", 1));
  EXPECT_FALSE(channel.publish(user("alice"), "ping", 2));
  EXPECT_EQ(calls, 1);
}
