#include <pushgw/logger.h>

#include <gtest/gtest.h>

#include <string>

using namespace pushgw;

class LoggerTest : public ::testing::Test
{
protected:
    LogLevel saved = Logger::instance().level();

    void TearDown() override { Logger::instance().set_level(saved); }

    static std::string capture(LogLevel threshold, void (*emit)())
    {
        Logger::instance().set_level(threshold);
        ::testing::internal::CaptureStdout();
        emit();
        return ::testing::internal::GetCapturedStdout();
    }
};

TEST_F(LoggerTest, DefaultLevelIsWarning)
{
    EXPECT_EQ(saved, LogLevel::Warning);
}

TEST_F(LoggerTest, MacrosCarryLevelPrefixes)
{
    auto out = capture(LogLevel::Debug, [] {
        PUSHGW_LOG_DEBUG("d {}", 1);
        PUSHGW_LOG_INFO("i {}", 2);
        PUSHGW_LOG_WARNING("w {}", 3);
        PUSHGW_LOG_ERROR("e {}", 4);
    });
    EXPECT_EQ(out, "[DEBUG] d 1\n[INFO] i 2\n[WARN] w 3\n[ERROR] e 4\n");
}

TEST_F(LoggerTest, MessagesBelowThresholdAreDropped)
{
    auto out = capture(LogLevel::Warning, [] {
        PUSHGW_LOG_DEBUG("hidden");
        PUSHGW_LOG_INFO("hidden");
        PUSHGW_LOG_WARNING("shown");
    });
    EXPECT_EQ(out, "[WARN] shown\n");

    out = capture(LogLevel::Error, [] { PUSHGW_LOG_WARNING("hidden"); });
    EXPECT_TRUE(out.empty());
}
