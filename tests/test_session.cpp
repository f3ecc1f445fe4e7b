#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include "fakes.hpp"

using namespace std::chrono_literals;

namespace {

struct SessionTest : ::testing::Test {
    ManualClock clock;
    RunLog log;
    std::shared_ptr<TransportStats> stats = std::make_shared<TransportStats>();

    std::unique_ptr<HostSession> make_session(FakeDevice device = {},
                                              const InterruptFlag* interrupt = nullptr) {
        auto transport = std::make_unique<FakeTransport>(std::move(device), clock, stats);
        return std::make_unique<HostSession>(std::move(transport), log, clock,
                                             HarvestPolicy{}, interrupt);
    }
};

} // namespace

// ── Connect ──

TEST_F(SessionTest, ConnectSucceeds) {
    auto s = make_session();
    Status st = s->connect("r1.example.net", "admin", "secret", 2222, 15);

    EXPECT_TRUE(st.is_ok());
    EXPECT_EQ(s->state(), SessionState::CONNECTED);
    EXPECT_EQ(stats->connects, 1);
    EXPECT_EQ(stats->last_params.port, 2222);
    EXPECT_EQ(stats->last_params.timeout, 15);
}

TEST_F(SessionTest, InvalidInputsNeverReachTransport) {
    auto s = make_session();

    EXPECT_EQ(s->connect("bad host", "admin", "pw", 22, 30).kind, ErrorKind::VALIDATION);
    EXPECT_EQ(s->connect("r1", "bad user", "pw", 22, 30).kind, ErrorKind::VALIDATION);
    EXPECT_EQ(s->connect("r1", "admin", "pw", 0, 30).kind, ErrorKind::VALIDATION);
    EXPECT_EQ(s->connect("r1", "admin", "pw", 22, 0).kind, ErrorKind::VALIDATION);
    EXPECT_EQ(s->connect("r1", "admin", "", 22, 30).kind, ErrorKind::VALIDATION);

    EXPECT_EQ(stats->connects, 0);
    EXPECT_EQ(s->state(), SessionState::DISCONNECTED);
}

TEST_F(SessionTest, TransportFailureKeepsItsKind) {
    FakeDevice device;
    device.connect_status = Status::Err(ErrorKind::AUTH, "Authentication failed for admin@r1");
    auto s = make_session(device);

    Status st = s->connect("r1", "admin", "wrong", 22, 30);

    EXPECT_EQ(st.kind, ErrorKind::AUTH);
    EXPECT_EQ(s->state(), SessionState::FAILED);
}

TEST_F(SessionTest, ConnectTwiceIsStateError) {
    auto s = make_session();
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    EXPECT_EQ(s->connect("r1", "admin", "pw", 22, 30).kind, ErrorKind::STATE);
    EXPECT_EQ(stats->connects, 1);
}

TEST_F(SessionTest, ConnectFromCredentials) {
    auto s = make_session();
    Credentials creds{"netops", "pw", 830, 45};

    ASSERT_TRUE(s->connect("10.1.1.1", creds).is_ok());
    EXPECT_EQ(stats->last_params.user, "netops");
    EXPECT_EQ(stats->last_params.port, 830);
}

// ── Direct mode ──

TEST_F(SessionTest, ExecuteWithoutConnectionFails) {
    auto s = make_session();
    auto r = s->execute("show ver", ExecMode::DIRECT);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::STATE);
    EXPECT_TRUE(stats->execs.empty());
}

TEST_F(SessionTest, ExecuteRejectsInvalidCommand) {
    auto s = make_session();
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    auto r = s->execute(std::string(1001, 'x'), ExecMode::DIRECT);
    EXPECT_EQ(r.error, ErrorKind::VALIDATION);
    EXPECT_EQ(s->state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, DirectExitStatusDecidesSuccess) {
    FakeDevice device;
    ExecOutcome bad;
    bad.stderr_data = "ls: cannot access 'x'\n";
    bad.exit_status = 2;
    device.exec_results["ls x"] = bad;
    auto s = make_session(device);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    auto ok = s->execute("uptime", ExecMode::DIRECT);
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.exit_status, 0);
    EXPECT_EQ(ok.get_output(), "ok\n");

    auto fail = s->execute("ls x", ExecMode::DIRECT);
    EXPECT_FALSE(fail.success);
    EXPECT_EQ(fail.exit_status, 2);
    EXPECT_EQ(fail.error, ErrorKind::NONE);
    EXPECT_EQ(fail.get_output(), "ls: cannot access 'x'\n");
}

TEST_F(SessionTest, DirectFallsBackWithoutPty) {
    FakeDevice device;
    device.reject_pty = true;
    auto s = make_session(device);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    auto r = s->execute("show ver", ExecMode::DIRECT);

    EXPECT_TRUE(r.success);
    ASSERT_EQ(stats->execs.size(), 2u);
    EXPECT_TRUE(stats->execs[0].second);
    EXPECT_FALSE(stats->execs[1].second);
}

TEST_F(SessionTest, DirectTimeoutIsNotRetried) {
    FakeDevice device;
    ExecOutcome slow;
    slow.status = Status::Err(ErrorKind::EXEC_TIMEOUT, "Command timed out after 30s");
    device.exec_results["sleep 100"] = slow;
    auto s = make_session(device);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    auto r = s->execute("sleep 100", ExecMode::DIRECT);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::EXEC_TIMEOUT);
    EXPECT_EQ(stats->execs.size(), 1u);
}

// ── Shell mode ──

TEST_F(SessionTest, ShellOpenedOnceAndReused) {
    FakeDevice device;
    device.shell_replies["show clock"] = "10:02:11 UTC";
    device.shell_replies["show users"] = "admin vty0";
    auto s = make_session(device);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    auto a = s->execute("show clock", ExecMode::SHELL);
    auto b = s->execute("show users", ExecMode::SHELL);

    EXPECT_TRUE(a.success);
    EXPECT_EQ(a.stdout_data, "10:02:11 UTC");
    EXPECT_EQ(a.exit_status, -1);
    EXPECT_TRUE(b.success);
    EXPECT_EQ(b.stdout_data, "admin vty0");
    EXPECT_EQ(stats->shells_opened, 1);
    EXPECT_TRUE(s->shell_open());
}

TEST_F(SessionTest, ShellErrorPhraseFailsCommand) {
    FakeDevice device;
    device.shell_replies["foo"] = "bash: foo: command not found";
    auto s = make_session(device);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    auto r = s->execute("foo", ExecMode::SHELL);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::NONE);
    EXPECT_TRUE(s->shell_open());
}

TEST_F(SessionTest, ShellOpenFailureReported) {
    FakeDevice device;
    device.shell_open_fails = true;
    auto s = make_session(device);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    auto r = s->execute("show ver", ExecMode::SHELL);

    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::CHANNEL);
    EXPECT_EQ(s->state(), SessionState::CONNECTED);
}

TEST_F(SessionTest, InterruptClosesShellAndNextCommandReopens) {
    InterruptFlag flag;
    FakeDevice device;
    device.shell_replies["show ver"] = "Version 1";
    auto s = make_session(device, &flag);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());

    flag.trigger();
    auto r = s->execute("show ver", ExecMode::SHELL);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::INTERRUPTED);
    EXPECT_NE(r.stdout_data.find("COMMAND INTERRUPTED BY USER"), std::string::npos);
    EXPECT_FALSE(s->shell_open());
    EXPECT_EQ(stats->shell->closes, 1);

    flag.reset();
    auto again = s->execute("show ver", ExecMode::SHELL);
    EXPECT_TRUE(again.success);
    EXPECT_EQ(stats->shells_opened, 2);
}

TEST_F(SessionTest, DisconnectClosesShellAndIsIdempotent) {
    FakeDevice device;
    device.shell_replies["show ver"] = "Version 1";
    auto s = make_session(device);
    ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());
    ASSERT_TRUE(s->execute("show ver", ExecMode::SHELL).success);

    s->disconnect();
    s->disconnect();

    EXPECT_EQ(s->state(), SessionState::CLOSED);
    EXPECT_EQ(stats->shell->closes, 1);
    EXPECT_EQ(stats->disconnects, 1);
    ASSERT_GE(stats->shell->sent.size(), 2u);
    EXPECT_NE(std::find(stats->shell->sent.begin(), stats->shell->sent.end(), "exit\n"),
              stats->shell->sent.end());

    auto r = s->execute("show ver", ExecMode::SHELL);
    EXPECT_EQ(r.error, ErrorKind::STATE);
}

TEST_F(SessionTest, DestructorDisconnects) {
    {
        auto s = make_session();
        ASSERT_TRUE(s->connect("r1", "admin", "pw", 22, 30).is_ok());
    }
    EXPECT_EQ(stats->disconnects, 1);
}

TEST(SessionStateName, Names) {
    EXPECT_STREQ(session_state_name(SessionState::CONNECTED), "connected");
    EXPECT_STREQ(session_state_name(SessionState::FAILED), "failed");
}
