#include "taskchain/tasks/deploy_jobs.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace taskchain;
using namespace taskchain::test;
using namespace std::chrono_literals;

namespace {

auto has(const std::string& haystack, std::string_view needle) -> bool {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

class PostDeployJobTest : public ::testing::Test {
protected:
  void SetUp() override {
    gateway_.machines = nlohmann::json::parse(R"([
      {"id": "m-0", "name": "db", "public_ips": ["5.6.7.8"]},
      {"id": "m-1", "name": "web", "public_ips": ["fe80::1", "1.2.3.4"]},
      {"id": "m-2", "name": "new", "public_ips": ["fe80::2"]}
    ])");
  }

  auto deploy(std::string machine,
              nlohmann::json kwargs = nlohmann::json::object())
      -> TaskMessage {
    return make_message("post_deploy_steps", "alice",
                        {"ec2", std::move(machine), "echo hi"},
                        std::move(kwargs));
  }

  FakeGateway gateway_;
  FakeShell shell_;
  FakeNotifier notifier_;
  RecordingQueue queue_;
  PostDeployJob job_{gateway_, shell_, notifier_, queue_, DeployConfig{}};
};

TEST_F(PostDeployJobTest, Success_ReportsToUserAndAdmin) {
  ASSERT_TRUE(job_.run(deploy("m-1")));

  ASSERT_EQ(shell_.calls.size(), 1u);
  EXPECT_EQ(shell_.calls[0].target.host, "1.2.3.4");
  EXPECT_EQ(shell_.calls[0].target.username, "root");
  EXPECT_EQ(shell_.calls[0].target.port, 22);
  EXPECT_EQ(shell_.calls[0].command, "echo hi");

  ASSERT_EQ(notifier_.user_notices.size(), 1u);
  const auto& notice = notifier_.user_notices[0];
  EXPECT_EQ(notice.to, "alice");
  EXPECT_EQ(notice.subject, "Deployment script succeeded for machine web (m-1)");
  EXPECT_TRUE(has(notice.body, "Command: echo hi"));
  EXPECT_TRUE(has(notice.body, "Return value: 0"));
  EXPECT_TRUE(has(notice.body, "Duration: 1.50 seconds"));
  EXPECT_TRUE(has(notice.body, "Output:\ndone"));

  ASSERT_EQ(notifier_.admin_notices.size(), 1u);
  EXPECT_TRUE(has(notifier_.admin_notices[0].subject, "of user alice"));
  EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(PostDeployJobTest, NonZeroExit_IsReportedAsFailed) {
  shell_.script.push_back(RemoteCommandResult{3, "boom", 200ms});

  ASSERT_TRUE(job_.run(deploy("m-1")));

  ASSERT_EQ(notifier_.user_notices.size(), 1u);
  EXPECT_EQ(notifier_.user_notices[0].subject,
            "Deployment script failed for machine web (m-1)");
  EXPECT_TRUE(has(notifier_.user_notices[0].body, "Return value: 3"));
  EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(PostDeployJobTest, TransientShellError_Retries) {
  shell_.script.push_back(std::unexpected(make_error_code(Error::ConnectionFailed)));

  ASSERT_TRUE(job_.run(deploy("m-1")));

  ASSERT_EQ(queue_.size(), 1u);
  auto next = queue_.pop_front();
  EXPECT_EQ(next.delay, 60s);
  EXPECT_EQ(next.msg.kwargs[kRetriesField], 1);
  EXPECT_EQ(next.msg.args[2], "echo hi");
  EXPECT_TRUE(notifier_.user_notices.empty());
}

TEST_F(PostDeployJobTest, RetryCounter_Increments) {
  shell_.script.push_back(std::unexpected(make_error_code(Error::ServiceUnavailable)));

  ASSERT_TRUE(job_.run(deploy("m-1", {{kRetriesField, 3}})));

  ASSERT_EQ(queue_.size(), 1u);
  EXPECT_EQ(queue_.submissions[0].msg.kwargs[kRetriesField], 4);
}

TEST_F(PostDeployJobTest, NoPublicIpv4_WaitsForMachine) {
  ASSERT_TRUE(job_.run(deploy("m-2")));

  EXPECT_TRUE(shell_.calls.empty());
  ASSERT_EQ(queue_.size(), 1u);
  EXPECT_EQ(queue_.submissions[0].delay, 120s);
  EXPECT_EQ(queue_.submissions[0].msg.kwargs[kRetriesField], 1);
}

TEST_F(PostDeployJobTest, UnlistedMachine_WaitsForMachine) {
  ASSERT_TRUE(job_.run(deploy("m-9")));

  EXPECT_TRUE(shell_.calls.empty());
  ASSERT_EQ(queue_.size(), 1u);
  EXPECT_EQ(queue_.submissions[0].delay, 120s);
}

TEST_F(PostDeployJobTest, RetriesExhausted_NotifiesUserAndAdmin) {
  shell_.script.push_back(std::unexpected(make_error_code(Error::ConnectionFailed)));

  ASSERT_TRUE(job_.run(deploy("m-1", {{kRetriesField, 5}})));

  EXPECT_EQ(queue_.size(), 0u);
  ASSERT_EQ(notifier_.user_notices.size(), 1u);
  EXPECT_EQ(notifier_.user_notices[0].subject,
            "Deployment script failed for machine m-1 after 5 retries");
  ASSERT_EQ(notifier_.admin_notices.size(), 1u);
  EXPECT_TRUE(has(notifier_.admin_notices[0].subject, "by user alice"));
}

TEST_F(PostDeployJobTest, RetryNotScheduled_NotifiesUserAndAdmin) {
  shell_.script.push_back(std::unexpected(make_error_code(Error::ConnectionFailed)));
  queue_.fail_with = Error::QueueFull;

  auto r = job_.run(deploy("m-1", {{kRetriesField, 2}}));

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::QueueFull));
  EXPECT_EQ(queue_.size(), 0u);
  ASSERT_EQ(notifier_.user_notices.size(), 1u);
  EXPECT_EQ(notifier_.user_notices[0].subject,
            "Deployment script failed for machine m-1 after 2 retries");
  ASSERT_EQ(notifier_.admin_notices.size(), 1u);
  EXPECT_TRUE(has(notifier_.admin_notices[0].subject, "by user alice"));
}

TEST_F(PostDeployJobTest, PermanentShellError_ReportsWithoutRetry) {
  shell_.script.push_back(std::unexpected(make_error_code(Error::Timeout)));

  ASSERT_TRUE(job_.run(deploy("m-1")));

  EXPECT_EQ(queue_.size(), 0u);
  EXPECT_EQ(notifier_.user_notices.size(), 1u);
  EXPECT_EQ(notifier_.admin_notices.size(), 1u);
}

TEST_F(PostDeployJobTest, ListingErrors) {
  gateway_.machines = std::unexpected(make_error_code(Error::ServiceUnavailable));
  ASSERT_TRUE(job_.run(deploy("m-1")));
  ASSERT_EQ(queue_.size(), 1u);
  EXPECT_EQ(queue_.submissions[0].delay, 60s);

  gateway_.machines = std::unexpected(make_error_code(Error::ProviderError));
  ASSERT_TRUE(job_.run(deploy("m-1")));
  EXPECT_EQ(queue_.size(), 1u);
  EXPECT_EQ(notifier_.user_notices.size(), 1u);
  EXPECT_TRUE(shell_.calls.empty());
}

TEST_F(PostDeployJobTest, Monitoring_PrependsHook) {
  ASSERT_TRUE(job_.run(deploy("m-1", {{"monitoring", true}})));

  ASSERT_EQ(shell_.calls.size(), 1u);
  EXPECT_EQ(shell_.calls[0].command, "install-agent;echo hi");
  EXPECT_TRUE(has(notifier_.user_notices[0].body,
                  "Command: install-agent;echo hi"));
}

TEST_F(PostDeployJobTest, MonitoringFailure_NotifiesAndStillDeploys) {
  gateway_.monitoring = std::unexpected(make_error_code(Error::NotFound));

  ASSERT_TRUE(job_.run(deploy("m-1", {{"monitoring", true}})));

  ASSERT_EQ(shell_.calls.size(), 1u);
  EXPECT_EQ(shell_.calls[0].command, "echo hi");
  ASSERT_EQ(notifier_.user_notices.size(), 2u);
  EXPECT_EQ(notifier_.user_notices[0].subject,
            "Enable monitoring failed for machine web (m-1)");
  EXPECT_EQ(notifier_.admin_notices.size(), 2u);
}

TEST_F(PostDeployJobTest, SshKwargs_ReachTarget) {
  ASSERT_TRUE(job_.run(deploy(
      "m-1", {{"username", "ubuntu"}, {"port", 2222}, {"key_path", "/k"}})));

  ASSERT_EQ(shell_.calls.size(), 1u);
  EXPECT_EQ(shell_.calls[0].target.username, "ubuntu");
  EXPECT_EQ(shell_.calls[0].target.port, 2222);
  EXPECT_EQ(shell_.calls[0].target.key_path, "/k");
}

TEST_F(PostDeployJobTest, BadArgs_AreInvalid) {
  auto r = job_.run(make_message("post_deploy_steps", "alice", {"ec2", "m-1"}));

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(gateway_.list_machines_calls, 0);
}

class SshCommandJobTest : public ::testing::Test {
protected:
  auto command() -> TaskMessage {
    return make_message("ssh_command", "alice",
                        {"ec2", "m-1", "1.2.3.4", "uptime"});
  }

  FakeShell shell_;
  FakeNotifier notifier_;
  SshCommandJob job_{shell_, notifier_};
};

TEST_F(SshCommandJobTest, Success_IsSilent) {
  ASSERT_TRUE(job_.run(command()));

  ASSERT_EQ(shell_.calls.size(), 1u);
  EXPECT_EQ(shell_.calls[0].target.host, "1.2.3.4");
  EXPECT_EQ(shell_.calls[0].command, "uptime");
  EXPECT_TRUE(notifier_.user_notices.empty());
}

TEST_F(SshCommandJobTest, NonZeroExit_NotifiesUser) {
  shell_.script.push_back(RemoteCommandResult{127, "not found", 10ms});

  ASSERT_TRUE(job_.run(command()));

  ASSERT_EQ(notifier_.user_notices.size(), 1u);
  EXPECT_EQ(notifier_.user_notices[0].subject,
            "Async command failed for machine m-1 (1.2.3.4)");
  EXPECT_EQ(notifier_.user_notices[0].body, "not found");
}

TEST_F(SshCommandJobTest, ShellError_NotifiesAndFails) {
  shell_.script.push_back(std::unexpected(make_error_code(Error::ConnectionFailed)));

  auto r = job_.run(command());

  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::ConnectionFailed));
  EXPECT_EQ(notifier_.user_notices.size(), 1u);
}

TEST_F(SshCommandJobTest, MissingCommand_IsInvalid) {
  auto r = job_.run(make_message("ssh_command", "alice", {"ec2", "m-1", "h"}));

  ASSERT_FALSE(r.has_value());
  EXPECT_TRUE(shell_.calls.empty());
}

TEST(DeployJobsTest, Register_AddsBothJobs) {
  FakeGateway gateway;
  FakeShell shell;
  FakeNotifier notifier;
  RecordingQueue queue;
  TaskRegistry registry;

  ASSERT_TRUE(register_deploy_jobs(registry, gateway, shell, notifier, queue,
                                   DeployConfig{}, "root"));

  EXPECT_EQ(registry.job_names(),
            (std::vector<std::string>{"post_deploy_steps", "ssh_command"}));
}
