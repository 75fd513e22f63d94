#include <gtest/gtest.h>
#include "support/test_support.hpp"

#include <thread>

using namespace resq;
using resq_test::LogCapture;

TEST(LoggingTests, Level_BelowThresholdDropped)
{
    LogCapture capture(LogLevel::Warn);
    log(LogLevel::Info, "dropped");
    log(LogLevel::Warn, "kept");
    log(LogLevel::Error, "kept too");

    EXPECT_EQ(capture.count(LogLevel::Info), 0u);
    EXPECT_EQ(capture.count(LogLevel::Warn), 1u);
    EXPECT_EQ(capture.count(LogLevel::Error), 1u);
}

TEST(LoggingTests, Level_OffSilencesEverything)
{
    LogCapture capture(LogLevel::Off);
    log(LogLevel::Error, "silent");
    EXPECT_TRUE(capture.lines().empty());
}

TEST(LoggingTests, Format_LineCarriesLevelTag)
{
    LogCapture capture;
    log(LogLevel::Warn, "capacity gap");
    auto lines = capture.lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[WARN] capacity gap"), std::string::npos);
}

TEST(LoggingTests, Sink_RestoredAfterCapture)
{
    {
        LogCapture capture(LogLevel::Error);
        EXPECT_EQ(get_log_level(), LogLevel::Error);
    }
    EXPECT_NE(get_log_level(), LogLevel::Error);
}

TEST(LoggingTests, Concurrency_AllLinesDelivered)
{
    LogCapture capture;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i)
            {
                log(LogLevel::Info, "thread " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads)
    {
        th.join();
    }
    EXPECT_EQ(capture.count(LogLevel::Info), 200u);
}
