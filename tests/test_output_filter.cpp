#include <gtest/gtest.h>
#include <ssh/output_filter.hpp>

TEST(OutputFilter, StripAnsiRemovesControlSequences) {
    EXPECT_EQ(strip_ansi("\x1b[1;32mOK\x1b[0m\r"), "OK");
    EXPECT_EQ(strip_ansi("ab\bc"), "abc");
    EXPECT_EQ(strip_ansi("\x1b[?25lplain"), "plain");
}

TEST(OutputFilter, DropsEchoAndPrompt) {
    std::string raw =
        "show version\r\n"
        "Cisco IOS Software, Version 15.2\r\n"
        "uptime is 3 weeks\r\n"
        "router1#";
    EXPECT_EQ(clean_shell_output(raw, "show version"),
              "Cisco IOS Software, Version 15.2\nuptime is 3 weeks");
}

TEST(OutputFilter, OnlyFirstEchoIsDropped) {
    std::string raw = "echo hi\nhi echo hi\n";
    EXPECT_EQ(clean_shell_output(raw, "echo hi"), "hi echo hi");
}

TEST(OutputFilter, DropsUserAtHostPrompt) {
    std::string raw = "uptime\n 10:02:11 up 4 days\nadmin@box:~$ ";
    EXPECT_EQ(clean_shell_output(raw, "uptime"), "10:02:11 up 4 days");
}

TEST(OutputFilter, DropsLoginAndExitArtifacts) {
    std::string raw =
        "Last login: Mon Jan  6 10:00:00 2025 from 10.0.0.9\n"
        "Welcome to Ubuntu\n"
        "df -h\n"
        "Filesystem Size\n"
        "/dev/sda1 20G\n"
        "logout\n"
        "Connection to 10.0.0.1 closed.\n";
    EXPECT_EQ(clean_shell_output(raw, "df -h"), "Filesystem Size\n/dev/sda1 20G");
}

TEST(OutputFilter, DropsJuniperExitNoise) {
    std::string raw =
        "show chassis alarms\n"
        "No alarms currently active\n"
        "{master:0}\n"
        "Invalid command: [xit]\n";
    EXPECT_EQ(clean_shell_output(raw, "show chassis alarms"), "No alarms currently active");
}

TEST(OutputFilter, StripsTrailingColonAndBlankLines) {
    std::string raw = "ls\n\n\nfiles:\n\n  a.txt  \n";
    EXPECT_EQ(clean_shell_output(raw, "ls"), "files\na.txt");
}

TEST(OutputFilter, EmptyWhenOnlyNoise) {
    EXPECT_EQ(clean_shell_output("show ver\nrouter#\n", "show ver"), "");
}

// ── Verdict ──

TEST(OutputFilter, VerdictSuccessOnPlainOutput) {
    auto v = evaluate_output("Cisco IOS Software");
    EXPECT_TRUE(v.success);
    EXPECT_TRUE(v.error_pattern.empty());
}

TEST(OutputFilter, VerdictFailsOnEmptyOutput) {
    EXPECT_FALSE(evaluate_output("").success);
}

TEST(OutputFilter, VerdictFailsOnErrorPhrase) {
    auto v = evaluate_output("line one\nbash: foo: Command Not Found");
    EXPECT_FALSE(v.success);
    EXPECT_EQ(v.error_pattern, "command not found");
}

TEST(OutputFilter, VerdictIgnoresCleanupIndicatorLines) {
    auto v = evaluate_output("uptime 5 days\nConnection to 10.0.0.1 closed by remote host, connection refused");
    EXPECT_TRUE(v.success);
}

TEST(OutputFilter, VerdictErrorOnOtherLineStillFails) {
    auto v = evaluate_output("Connection to r1 closed\ncat: x: No such file or directory");
    EXPECT_FALSE(v.success);
    EXPECT_EQ(v.error_pattern, "no such file or directory");
}
