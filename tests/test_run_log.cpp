#include <gtest/gtest.h>
#include <core/run_log.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

class RunLogTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        std::random_device rd;
        dir = platform::temp_dir() / ("netrun_runlog_" + std::to_string(rd()));
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static std::string read(const fs::path& p) {
        std::ifstream f(p);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

} // namespace

TEST(LogLevel, ParseNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("verbose", LogLevel::ERROR), LogLevel::ERROR);
    EXPECT_STREQ(log_level_name(LogLevel::WARNING), "WARNING");
}

TEST(RunLogDefault, DiscardsEverything) {
    RunLog log;
    EXPECT_FALSE(log.file_ok());
    log.error("nowhere");
    EXPECT_FALSE(log.enabled(LogLevel::WARNING));
}

TEST_F(RunLogTest, FiltersBelowLevel) {
    fs::path file = dir / "netrun.log";
    {
        RunLog log(file, LogLevel::INFO, false);
        ASSERT_TRUE(log.file_ok());
        log.debug("hidden detail");
        log.info("Connected to r1");
        log.warn("slow device");
    }

    std::string text = read(file);
    EXPECT_EQ(text.find("hidden detail"), std::string::npos);
    EXPECT_NE(text.find(" INFO [t"), std::string::npos);
    EXPECT_NE(text.find("Connected to r1"), std::string::npos);
    EXPECT_NE(text.find(" WARNING [t"), std::string::npos);
}

TEST_F(RunLogTest, LineFormat) {
    fs::path file = dir / "netrun.log";
    {
        RunLog log(file, LogLevel::DEBUG, false);
        log.error("boom");
    }

    std::string text = read(file);
    ASSERT_FALSE(text.empty());
    // [YYYY-MM-DD HH:MM:SS.mmm] ERROR [tNNN] boom
    EXPECT_EQ(text[0], '[');
    EXPECT_EQ(text[24], ']');
    EXPECT_EQ(text.substr(25, 7), " ERROR ");
    EXPECT_EQ(text.substr(text.size() - 5), "boom\n");
}

TEST_F(RunLogTest, AppendsAcrossInstances) {
    fs::path file = dir / "netrun.log";
    { RunLog(file, LogLevel::INFO, false).info("first run"); }
    { RunLog(file, LogLevel::INFO, false).info("second run"); }

    std::string text = read(file);
    EXPECT_LT(text.find("first run"), text.find("second run"));
}

TEST_F(RunLogTest, RotatesAtSizeLimit) {
    fs::path file = dir / "netrun.log";
    {
        RunLog log(file, LogLevel::INFO, false);
        std::string chunk(64 * 1024, 'x');
        std::size_t lines = RUN_LOG_MAX_BYTES / chunk.size() + 2;
        for (std::size_t i = 0; i < lines; ++i) log.info(chunk);
    }

    EXPECT_TRUE(fs::exists(file.string() + ".1"));
    EXPECT_LE(fs::file_size(file), RUN_LOG_MAX_BYTES);
}

TEST_F(RunLogTest, ConcurrentWritersSurviveRotation) {
    fs::path file = dir / "netrun.log";
    const int threads = 4;
    const int per_thread = 48;
    {
        RunLog log(file, LogLevel::INFO, false);
        std::string chunk(64 * 1024, 'y');
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t) {
            workers.emplace_back([&] {
                for (int i = 0; i < per_thread; ++i) log.info(chunk);
            });
        }
        for (auto& w : workers) w.join();
        EXPECT_TRUE(log.file_ok());
    }

    ASSERT_TRUE(fs::exists(file.string() + ".1"));
    std::size_t lines = 0;
    for (int i = 0; i <= RUN_LOG_BACKUPS; ++i) {
        fs::path p = i == 0 ? file : fs::path(file.string() + "." + std::to_string(i));
        if (!fs::exists(p)) continue;
        std::string text = read(p);
        lines += static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    }
    EXPECT_EQ(lines, static_cast<std::size_t>(threads * per_thread));
}
