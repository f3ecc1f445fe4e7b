#include <gtest/gtest.h>
#include <cli/args.hpp>

static Result<CliArgs> parse(std::vector<std::string> args) {
    return parse_args(args);
}

TEST(Args, NoArguments) {
    auto r = parse({});
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.hostname.has_value());
    EXPECT_FALSE(r.value.command.has_value());
}

TEST(Args, HostUserCommandPositionals) {
    auto r = parse({"r1.example.net", "admin", "show version"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.hostname, "r1.example.net");
    EXPECT_EQ(r.value.username, "admin");
    EXPECT_EQ(r.value.command, "show version");
}

TEST(Args, SinglePositionalHostOrCommand) {
    EXPECT_EQ(parse({"10.0.0.1"}).value.hostname, "10.0.0.1");
    EXPECT_EQ(parse({"r1,r2"}).value.hostname, "r1,r2");

    auto cmd = parse({"show ip route"});
    EXPECT_FALSE(cmd.value.hostname.has_value());
    EXPECT_EQ(cmd.value.command, "show ip route");
}

TEST(Args, TooManyPositionals) {
    auto r = parse({"r1", "admin", "secret", "show ver"});
    EXPECT_TRUE(r.is_err());
}

TEST(Args, OptionsBothForms) {
    auto r = parse({"--port=2222", "-t", "60", "--max-threads", "10", "--no-shell",
                    "--log-level=Debug", "--config", "site.yaml", "--log-dir=/tmp/x",
                    "--commands-file", "cmds.csv", "--no-env", "-s", "-i", "-d"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const CliArgs& a = r.value;
    EXPECT_EQ(a.port, 2222);
    EXPECT_EQ(a.timeout, 60);
    EXPECT_EQ(a.max_threads, 10);
    EXPECT_EQ(a.mode, ExecMode::DIRECT);
    EXPECT_EQ(a.log_level, "debug");
    EXPECT_EQ(a.config_path, "site.yaml");
    EXPECT_EQ(a.log_dir, "/tmp/x");
    EXPECT_EQ(a.commands_file, "cmds.csv");
    EXPECT_TRUE(a.no_env);
    EXPECT_TRUE(a.secure);
    EXPECT_TRUE(a.interactive);
    EXPECT_TRUE(a.debug);
}

TEST(Args, RangeChecks) {
    EXPECT_TRUE(parse({"--port", "0"}).is_err());
    EXPECT_TRUE(parse({"--port", "65536"}).is_err());
    EXPECT_TRUE(parse({"--port", "22abc"}).is_err());
    EXPECT_TRUE(parse({"--timeout", "3601"}).is_err());
    EXPECT_TRUE(parse({"--max-threads", "0"}).is_err());
    EXPECT_TRUE(parse({"--max-threads", "101"}).is_err());
    EXPECT_TRUE(parse({"--log-level", "trace"}).is_err());
}

TEST(Args, PasswordOptionRejected) {
    auto r = parse({"--password", "hunter2"});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not accepted"), std::string::npos);
}

TEST(Args, UnknownAndIncompleteOptions) {
    EXPECT_TRUE(parse({"--frobnicate"}).is_err());
    EXPECT_TRUE(parse({"--port"}).is_err());
    EXPECT_TRUE(parse({"--shell=yes"}).is_err());
}

TEST(Args, DoubleDashEndsOptions) {
    auto r = parse({"r1", "admin", "--", "--help"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.command, "--help");
    EXPECT_FALSE(r.value.show_help);
}

TEST(Args, HelpAndVersion) {
    EXPECT_TRUE(parse({"--help"}).value.show_help);
    EXPECT_TRUE(parse({"-V"}).value.show_version);
    EXPECT_NE(usage_text().find("--no-shell"), std::string::npos);
}
