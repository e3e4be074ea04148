#include "cpupool/util/Logger.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <thread>

using namespace cpupool::util;
using namespace cpupool::test;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Points a private logger at a scratch file for the duration of a test.
struct FileLogger {
    TempDir dir;
    std::string path = (dir.path() / "log.txt").string();
    Logger log;

    FileLogger() { EXPECT_TRUE(log.setFile(path)); }
    std::string contents() { return slurp(path); }
};

} // namespace

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("Error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Warn), "WARN");
}

TEST(LoggerTest, TextLineWithFields) {
    FileLogger f;
    f.log.log(LogLevel::Info, "worker created", { {"worker", "worker_1"}, {"workers", "1"} });
    const auto out = f.contents();
    EXPECT_NE(out.find("INFO  worker created worker=worker_1 workers=1\n"), std::string::npos) << out;
    EXPECT_EQ(out.front(), '[');
}

TEST(LoggerTest, LevelFilters) {
    FileLogger f;
    f.log.setLevel(LogLevel::Warn);
    f.log.log(LogLevel::Info, "hidden");
    f.log.log(LogLevel::Error, "shown");
    const auto out = f.contents();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("shown"), std::string::npos);
    EXPECT_FALSE(f.log.enabled(LogLevel::Debug));
    EXPECT_TRUE(f.log.enabled(LogLevel::Error));
}

TEST(LoggerTest, JsonLineIsEscaped) {
    FileLogger f;
    f.log.setFormatJson(true);
    f.log.log(LogLevel::Warn, "task \"x\" failed", { {"error", "line1\nline2"} });
    const auto out = f.contents();
    EXPECT_NE(out.find("\"lvl\":\"WARN\""), std::string::npos) << out;
    EXPECT_NE(out.find("\"msg\":\"task \\\"x\\\" failed\""), std::string::npos) << out;
    EXPECT_NE(out.find("\"error\":\"line1\\nline2\""), std::string::npos) << out;
    EXPECT_EQ(out.back(), '\n');
}

TEST(LoggerTest, ScopedContextIsThreadLocalAndRestored) {
    FileLogger f;
    {
        Logger::Scoped outer(std::vector<Field>{ {"worker", "w1"} });
        {
            Logger::Scoped inner(std::vector<Field>{ {"worker", "w2"}, {"task", "t9"} });
            f.log.log(LogLevel::Info, "inner");
        }
        f.log.log(LogLevel::Info, "outer");

        std::thread other([&] { f.log.log(LogLevel::Info, "other"); });
        other.join();
    }
    f.log.log(LogLevel::Info, "bare");

    std::istringstream lines(f.contents());
    std::string l;
    std::vector<std::string> all;
    while (std::getline(lines, l)) all.push_back(l);
    ASSERT_EQ(all.size(), 4u);

    EXPECT_NE(all[0].find("inner task=t9 worker=w2"), std::string::npos) << all[0];
    EXPECT_NE(all[1].find("outer worker=w1"), std::string::npos) << all[1];
    EXPECT_EQ(all[1].find("task="), std::string::npos) << all[1];
    EXPECT_EQ(all[2].find("worker="), std::string::npos) << all[2];
    EXPECT_EQ(all[3].find("worker="), std::string::npos) << all[3];
}

TEST(LoggerTest, BadFileFallsBackToStdout) {
    Logger log;
    EXPECT_FALSE(log.setFile("/nonexistent/dir/log.txt"));
    log.log(LogLevel::Info, "still works");
    SUCCEED();
}
