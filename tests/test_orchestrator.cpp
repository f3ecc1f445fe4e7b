#include <gtest/gtest.h>
#include <managers/orchestrator.hpp>
#include <platform/platform.hpp>
#include "fakes.hpp"
#include <atomic>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class OrchestratorTest : public ::testing::Test {
protected:
    fs::path dir;
    RunLog log;
    std::atomic<int> transports{0};

    void SetUp() override {
        std::random_device rd;
        dir = platform::temp_dir() / ("netrun_orch_" + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    RunOptions options(std::vector<std::string> commands, ExecMode mode = ExecMode::DIRECT) {
        RunOptions o;
        o.credentials = Credentials{"admin", "secret", 22, 10};
        o.commands = std::move(commands);
        o.mode = mode;
        o.log_dir = dir;
        o.command_pacing = 0ms;
        return o;
    }

    TransportFactory fleet(FakeDevice device, Clock& clock = steady_clock()) {
        Clock* c = &clock;
        return [this, device, c]() -> std::unique_ptr<Transport> {
            transports++;
            return std::make_unique<FakeTransport>(device, *c);
        };
    }

    static void expect_consistent(const RunReport& r, int hosts) {
        EXPECT_EQ(r.total, hosts);
        EXPECT_EQ(r.successful + r.failed, r.total);
        EXPECT_EQ(static_cast<int>(r.successful_hosts.size()), r.successful);
        EXPECT_EQ(static_cast<int>(r.failed_hosts.size()), r.failed);
        for (const auto& h : r.successful_hosts) {
            EXPECT_EQ(r.failed_hosts.count(h), 0u) << h;
        }
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream f(p);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

} // namespace

TEST_F(OrchestratorTest, OneHostTimesOut) {
    FakeDevice device;
    device.connect_by_host["r2"] = Status::Err(ErrorKind::TIMEOUT,
                                               "Connection timeout to r2:22 after 10 seconds");
    HostOrchestrator orch(options({"show version"}), fleet(device), log);

    RunReport r = orch.run({"r1", "r2", "r3"});

    expect_consistent(r, 3);
    EXPECT_EQ(r.successful, 2);
    EXPECT_EQ(r.failed, 1);
    EXPECT_EQ(r.failed_hosts, std::set<std::string>{"r2"});
    EXPECT_NE(r.per_host["r2"].summary.find("timeout"), std::string::npos);
    EXPECT_EQ(r.per_host["r1"].summary, "Single command: show version");

    std::string summary = format_summary(r, dir);
    EXPECT_NE(summary.find("EXECUTION SUMMARY"), std::string::npos);
    EXPECT_NE(summary.find("Total hosts: 3"), std::string::npos);
    EXPECT_NE(summary.find("Successful hosts: r1, r3"), std::string::npos);
    EXPECT_NE(summary.find("Failed hosts: r2"), std::string::npos);
    EXPECT_NE(summary.find("r2: Connection failed (connection timeout)"), std::string::npos);
}

TEST_F(OrchestratorTest, CountsHoldForEveryOutcome) {
    const std::vector<std::string> hosts = {"a1", "a2", "a3", "a4"};

    HostOrchestrator ok(options({"uptime"}), fleet(FakeDevice{}), log);
    expect_consistent(ok.run(hosts), 4);

    FakeDevice denied;
    denied.connect_status = Status::Err(ErrorKind::AUTH, "Authentication failed");
    HostOrchestrator bad(options({"uptime"}), fleet(denied), log);
    RunReport r = bad.run(hosts);
    expect_consistent(r, 4);
    EXPECT_EQ(r.failed, 4);

    TransportFactory throwing = []() -> std::unique_ptr<Transport> {
        throw std::runtime_error("socket table full");
    };
    HostOrchestrator broken(options({"uptime"}), throwing, log);
    RunReport e = broken.run(hosts);
    expect_consistent(e, 4);
    EXPECT_EQ(e.failed, 4);
    EXPECT_EQ(e.per_host["a1"].summary, "Error: socket table full");
}

TEST_F(OrchestratorTest, WorkerCountBoundedByHosts) {
    RunOptions o = options({"uptime"});
    o.max_threads = 1000;
    HostOrchestrator orch(o, fleet(FakeDevice{}), log);

    RunReport r = orch.run({"h1", "h2", "h3", "h4", "h5"});

    EXPECT_EQ(orch.last_worker_count(), 5);
    EXPECT_EQ(r.successful, 5);
}

TEST_F(OrchestratorTest, DuplicateHostsRunOnce) {
    HostOrchestrator orch(options({"uptime"}), fleet(FakeDevice{}), log);

    RunReport r = orch.run({"r1", "r2", "r1", "r2", "r1"});

    expect_consistent(r, 2);
    EXPECT_EQ(transports.load(), 2);
}

TEST_F(OrchestratorTest, EmptyHostListGivesEmptyReport) {
    HostOrchestrator orch(options({"uptime"}), fleet(FakeDevice{}), log);

    RunReport r = orch.run({});

    expect_consistent(r, 0);
    EXPECT_EQ(transports.load(), 0);
}

TEST_F(OrchestratorTest, SingleHostRunsInline) {
    HostOrchestrator orch(options({"uptime", "df -h"}), fleet(FakeDevice{}), log);

    RunReport r = orch.run({"r1"});

    EXPECT_EQ(orch.last_worker_count(), 1);
    EXPECT_EQ(r.successful, 1);
    EXPECT_EQ(r.per_host["r1"].summary, "2 commands executed");
}

TEST_F(OrchestratorTest, AnyFailedCommandFailsHost) {
    FakeDevice device;
    ExecOutcome bad;
    bad.stderr_data = "No such file";
    bad.exit_status = 1;
    device.exec_results["cat /nope"] = bad;
    HostOrchestrator orch(options({"uptime", "cat /nope", "hostname"}), fleet(device), log);

    HostReport h = orch.run_host("r1");

    EXPECT_FALSE(h.success);
    EXPECT_EQ(h.summary, "3 commands executed");
}

TEST_F(OrchestratorTest, InterruptBeforeStartSkipsEveryHost) {
    InterruptFlag flag;
    flag.trigger();
    HostOrchestrator orch(options({"uptime", "df -h"}), fleet(FakeDevice{}), log,
                          steady_clock(), &flag);

    RunReport r = orch.run({"r1", "r2", "r3"});

    expect_consistent(r, 3);
    EXPECT_EQ(r.failed, 3);
    EXPECT_EQ(transports.load(), 0);
    EXPECT_EQ(r.per_host["r2"].summary, "Interrupted after command 0/2");
}

TEST_F(OrchestratorTest, WritesPerHostLog) {
    HostOrchestrator orch(options({"uptime"}), fleet(FakeDevice{}), log);

    orch.run({"10.0.0.1"});

    fs::path expected = dir / ("ssh_output_10.0.0.1_" + orch.run_stamp() + ".log");
    ASSERT_TRUE(fs::exists(expected));
    std::string text = read_file(expected);
    EXPECT_NE(text.find("SSH Session Log for Host: 10.0.0.1"), std::string::npos);
    EXPECT_NE(text.find("Command 1/1: uptime"), std::string::npos);
    EXPECT_NE(text.find("Exit status: 0"), std::string::npos);
    EXPECT_NE(text.find("Status: SUCCESS"), std::string::npos);
}

TEST_F(OrchestratorTest, ConnectFailureLoggedForHost) {
    FakeDevice device;
    device.connect_status = Status::Err(ErrorKind::DNS, "Failed to resolve host nowhere");
    HostOrchestrator orch(options({"uptime"}), fleet(device), log);

    orch.run({"nowhere"});

    std::string text = read_file(dir / ("ssh_output_nowhere_" + orch.run_stamp() + ".log"));
    EXPECT_NE(text.find("Connection failed (DNS resolution error)"), std::string::npos);
    EXPECT_NE(text.find("Status: FAILED"), std::string::npos);
}

TEST_F(OrchestratorTest, StatusCallbackReportsProgress) {
    HostOrchestrator orch(options({"uptime"}), fleet(FakeDevice{}), log);
    std::vector<std::string> lines;
    orch.set_status_callback([&](const std::string& msg) { lines.push_back(msg); });

    orch.run({"r1", "r2"});

    EXPECT_NE(std::find(lines.begin(), lines.end(), "[r1] Executing command: uptime"), lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), "[r2] Executing command: uptime"), lines.end());
}

TEST_F(OrchestratorTest, ShellModeAcrossHosts) {
    ManualClock clock;
    FakeDevice device;
    device.shell_replies["show clock"] = "10:02:11 UTC";
    device.shell_replies["show users"] = "admin vty0";
    RunOptions o = options({"show clock", "show users"}, ExecMode::SHELL);
    o.command_pacing = 500ms;
    HostOrchestrator orch(o, fleet(device, clock), log, clock);

    RunReport r = orch.run({"r1", "r2", "r3"});

    expect_consistent(r, 3);
    EXPECT_EQ(r.successful, 3);
}

TEST(ReportCollector, ReAddReplacesEntry) {
    ReportCollector c;
    c.add({"r1", false, "Connection failed"});
    c.add({"r2", true, "ok"});
    c.add({"r1", true, "Single command: uptime"});

    RunReport r = c.snapshot();
    EXPECT_EQ(r.total, 2);
    EXPECT_EQ(r.successful, 2);
    EXPECT_EQ(r.failed, 0);
    EXPECT_EQ(r.per_host["r1"].summary, "Single command: uptime");
}
