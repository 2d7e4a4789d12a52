#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "../src/Logger.hh"

namespace
{
    string readAll(const string &path)
    {
        ifstream in(path);
        stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
}

TEST(LoggerTest, WriteLogToFile)
{
    const string testLogFile = "logger_test_output.txt";
    Logger &logger = Logger::instance();
    logger.start(testLogFile, true);
    Logger::log(LogLevel::Info, "LoggerTest", "OK", 123, 1);
    Logger::flush();

    string content = readAll(testLogFile);
    logger.stop();

    EXPECT_NE(content.find("LoggerTest"), string::npos);
    EXPECT_NE(content.find("OK"), string::npos);
    EXPECT_NE(content.find("123"), string::npos);
}

TEST(LoggerTest, EntriesAreJSONLines)
{
    const string testLogFile = "logger_json_test.txt";
    Logger &logger = Logger::instance();
    logger.start(testLogFile, true);
    Logger::log(LogLevel::Warn, "alice/StarRail/sign-in", "RateLimited", 40, 2);
    Logger::flush();
    logger.stop();

    ifstream in(testLogFile);
    ASSERT_TRUE(in.is_open());

    bool found = false;
    string line;
    while (getline(in, line))
    {
        if (line.empty() || line[0] != '{')
            continue;

        auto j = nlohmann::json::parse(line);
        if (j["event"] == "alice/StarRail/sign-in")
        {
            found = true;
            EXPECT_EQ(j["level"], "WARN");
            EXPECT_EQ(j["status"], "RateLimited");
            EXPECT_EQ(j["latency_ms"], 40);
            EXPECT_EQ(j["attempt"], 2);
            EXPECT_EQ(j["thread_id"].get<string>().rfind("thread#", 0), 0u);
        }
    }

    EXPECT_TRUE(found);
}

TEST(LoggerTest, DualSafeLogWritesBothPlaces)
{
    const string testLogFile = "logger_dual_test.txt";
    Logger &logger = Logger::instance();
    logger.start(testLogFile, true);
    Logger::dualSafeLog("Dual test message");
    Logger::flush();

    string content = readAll(testLogFile);
    logger.stop();

    EXPECT_NE(content.find("Dual test message"), string::npos);
}

TEST(LoggerTest, MinLevelFiltersAndCounts)
{
    Logger &logger = Logger::instance();
    logger.start("logger_level_test.txt", true);
    Logger::setMinLevel(LogLevel::Warn);

    Logger::log(LogLevel::Debug, "filtered", "x", 0, 0);
    Logger::log(LogLevel::Info, "filtered", "x", 0, 0);
    Logger::log(LogLevel::Error, "kept", "x", 0, 0);

    EXPECT_EQ(Logger::levelCount(LogLevel::Info), 0);
    EXPECT_EQ(Logger::levelCount(LogLevel::Error), 1);

    Logger::setMinLevel(LogLevel::Info);
    logger.stop();
}

TEST(LoggerTest, LevelNames)
{
    EXPECT_EQ(Logger::logLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::logLevelFromString("Debug"), LogLevel::Debug);
    EXPECT_FALSE(Logger::logLevelFromString("verbose").has_value());
    EXPECT_EQ(Logger::logLevelToString(LogLevel::Error), "ERROR");
}

TEST(LoggerTest, StartFailsOnUnwritablePath)
{
    EXPECT_THROW(Logger::instance().start("/nonexistent-dir/for/sure/log.txt"), runtime_error);
    EXPECT_FALSE(Logger::isRunning());
}
