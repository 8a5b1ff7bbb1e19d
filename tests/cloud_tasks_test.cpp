#include "taskchain/tasks/cloud_tasks.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <vector>

using namespace taskchain;
using namespace taskchain::test;
using namespace std::chrono_literals;

namespace {

auto offsets(std::size_t n) -> std::vector<std::chrono::milliseconds> {
  std::vector<std::chrono::milliseconds> v;
  for (std::size_t i = 0; i < n; ++i) {
    v.push_back(std::chrono::milliseconds(static_cast<long long>(i) * 10'000));
  }
  return v;
}

const auto kProviderError = make_error_code(Error::ProviderError);
const auto kNoKwargs = nlohmann::json::object();

}  // namespace

class CloudTasksTest : public ::testing::Test {
protected:
  FakeGateway gateway_;
  UserId alice_ = user("alice");
};

TEST_F(CloudTasksTest, Specs) {
  ListSizes sizes(gateway_);
  ListMachines machines(gateway_);
  ProbeSsh probe(gateway_);
  Ping ping(gateway_);

  EXPECT_EQ(sizes.spec().result_fresh, 3600s);
  EXPECT_EQ(sizes.spec().result_expires, std::chrono::seconds(7 * 24 * 3600));
  EXPECT_FALSE(sizes.spec().polling);

  EXPECT_EQ(machines.spec().result_fresh, 10s);
  EXPECT_EQ(machines.spec().result_expires, std::chrono::seconds(24 * 3600));
  EXPECT_TRUE(machines.spec().polling);

  EXPECT_EQ(probe.spec().result_fresh, 120s);
  EXPECT_EQ(probe.spec().result_expires, 7200s);
  EXPECT_TRUE(probe.spec().polling);

  EXPECT_EQ(ping.spec().result_fresh, 900s);
  EXPECT_TRUE(ping.spec().polling);
}

TEST_F(CloudTasksTest, Listing_WrapsItemsWithBackend) {
  ListSizes sizes(gateway_);
  ListImages images(gateway_);
  ListLocations locations(gateway_);

  auto s = sizes.execute(alice_, {"ec2"});
  auto i = images.execute(alice_, {"ec2"});
  auto l = locations.execute(alice_, {"ec2"});

  ASSERT_TRUE(s.has_value());
  EXPECT_EQ((*s)["backend_id"], "ec2");
  EXPECT_EQ((*s)["sizes"], nlohmann::json::array({"small", "large"}));
  ASSERT_TRUE(i.has_value());
  EXPECT_EQ((*i)["images"], nlohmann::json::array({"img-1"}));
  ASSERT_TRUE(l.has_value());
  EXPECT_EQ((*l)["locations"], nlohmann::json::array({"eu-1"}));
}

TEST_F(CloudTasksTest, Listing_GatewayError_Propagates) {
  gateway_.sizes = std::unexpected(kProviderError);
  ListSizes sizes(gateway_);

  auto r = sizes.execute(alice_, {"ec2"});

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), kProviderError);
}

TEST_F(CloudTasksTest, Listing_BadArgs_AreInvalid) {
  ListMachines machines(gateway_);

  auto empty = machines.execute(alice_, nlohmann::json::array());
  auto number = machines.execute(alice_, {42});
  auto blank = machines.execute(alice_, {""});

  EXPECT_EQ(empty.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(number.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(blank.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(gateway_.list_machines_calls, 0);
}

TEST_F(CloudTasksTest, ListMachines_RetriesAtFreshIntervalThenDisables) {
  ListMachines machines(gateway_);
  nlohmann::json args = {"ec2"};

  for (std::size_t n = 1; n <= ListMachines::kMaxRetries; ++n) {
    auto o = offsets(n);
    auto d = machines.backoff(kProviderError, o, alice_, args, kNoKwargs);
    ASSERT_TRUE(d.has_value()) << n;
    EXPECT_EQ(*d, 10s);
  }
  EXPECT_TRUE(gateway_.disabled.empty());

  auto o = offsets(ListMachines::kMaxRetries + 1);
  EXPECT_FALSE(
      machines.backoff(kProviderError, o, alice_, args, kNoKwargs).has_value());
  EXPECT_TRUE(gateway_.disabled.contains("ec2"));
}

TEST_F(CloudTasksTest, ListMachines_InvalidArgument_RetriesLikeAnyError) {
  ListMachines machines(gateway_);
  auto invalid = make_error_code(Error::InvalidArgument);
  nlohmann::json args = {"ec2"};

  for (std::size_t n = 1; n <= ListMachines::kMaxRetries; ++n) {
    auto o = offsets(n);
    EXPECT_EQ(machines.backoff(invalid, o, alice_, args, kNoKwargs), 10s) << n;
  }
  EXPECT_TRUE(gateway_.disabled.empty());
}

TEST_F(CloudTasksTest, ProbeAndPing_InvalidArgument_KeepRetrying) {
  ProbeSsh probe(gateway_);
  Ping ping(gateway_);
  auto invalid = make_error_code(Error::InvalidArgument);
  nlohmann::json args = {"ec2", "m-1", "10.0.0.5"};

  for (std::size_t n : {1u, 2u, 10u, 40u}) {
    auto o = offsets(n);
    EXPECT_TRUE(probe.backoff(invalid, o, alice_, args, kNoKwargs).has_value())
        << n;
    EXPECT_EQ(ping.backoff(invalid, o, alice_, args, kNoKwargs), 900s) << n;
  }
}

TEST_F(CloudTasksTest, Probe_PayloadAndExponentialBackoff) {
  ProbeSsh probe(gateway_);

  auto r = probe.execute(alice_, {"ec2", "m-1", "10.0.0.5"});

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((*r)["backend_id"], "ec2");
  EXPECT_EQ((*r)["machine_id"], "m-1");
  EXPECT_EQ((*r)["host"], "10.0.0.5");
  EXPECT_EQ((*r)["result"]["loadavg"].size(), 3u);
  EXPECT_EQ(gateway_.probed, std::vector<std::string>{"m-1@10.0.0.5"});

  nlohmann::json args = {"ec2", "m-1", "10.0.0.5"};
  std::vector<Delay> expected = {120s, 240s, 480s, 960s, 1920s, 1920s};
  for (std::size_t n = 1; n <= expected.size(); ++n) {
    auto o = offsets(n);
    EXPECT_EQ(probe.backoff(kProviderError, o, alice_, args, kNoKwargs), expected[n - 1])
        << n;
  }
}

TEST_F(CloudTasksTest, Probe_MissingHost_IsInvalid) {
  ProbeSsh probe(gateway_);

  auto r = probe.execute(alice_, {"ec2", "m-1"});

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_TRUE(gateway_.probed.empty());
}

TEST_F(CloudTasksTest, Ping_PayloadAndConstantBackoff) {
  Ping ping(gateway_);

  auto r = ping.execute(alice_, {"ec2", "m-1", "10.0.0.5"});

  ASSERT_TRUE(r.has_value());
  EXPECT_EQ((*r)["result"]["packets_loss"], 0.0);
  EXPECT_EQ(gateway_.pinged, std::vector<std::string>{"10.0.0.5"});

  nlohmann::json args = {"ec2", "m-1", "10.0.0.5"};
  for (std::size_t n : {1u, 5u, 50u}) {
    auto o = offsets(n);
    EXPECT_EQ(ping.backoff(make_error_code(Error::HostUnreachable), o, alice_,
                           args, kNoKwargs),
              900s);
  }
}

TEST_F(CloudTasksTest, Register_AddsAllTasks) {
  TaskRegistry registry;

  ASSERT_TRUE(register_cloud_tasks(registry, gateway_));

  EXPECT_EQ(registry.task_names(),
            (std::vector<std::string>{"list_images", "list_locations",
                                      "list_machines", "list_sizes", "ping",
                                      "probe"}));
  EXPECT_FALSE(register_cloud_tasks(registry, gateway_).has_value());
}
