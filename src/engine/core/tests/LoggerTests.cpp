#include <gtest/gtest.h>
#include "../Logger.hpp"

#include <string>

namespace kineticEngine {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        _wasEnabled = Logger::isDebugEnabled();
    }

    void TearDown() override {
        Logger::setDebugEnabled(_wasEnabled);
    }

    bool _wasEnabled = false;
};

TEST_F(LoggerTest, InfoCarriesLevelAndMessage) {
    testing::internal::CaptureStdout();
    Logger::Info("[LoggerTest] hello");
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("[INFO ]"), std::string::npos);
    EXPECT_NE(output.find("[LoggerTest] hello"), std::string::npos);
}

TEST_F(LoggerTest, DebugIsGated) {
    Logger::setDebugEnabled(false);
    testing::internal::CaptureStdout();
    Logger::Debug("[LoggerTest] hidden");
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());

    Logger::setDebugEnabled(true);
    testing::internal::CaptureStdout();
    Logger::Debug("[LoggerTest] shown");
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_NE(output.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(output.find("[LoggerTest] shown"), std::string::npos);
}

TEST_F(LoggerTest, ErrorIsAlwaysPrinted) {
    Logger::setDebugEnabled(false);
    testing::internal::CaptureStdout();
    Logger::Error("[LoggerTest] failure");
    EXPECT_NE(testing::internal::GetCapturedStdout().find("[ERROR]"), std::string::npos);
}

TEST_F(LoggerTest, DebugOnceLogsASingleTime) {
    Logger::setDebugEnabled(true);
    testing::internal::CaptureStdout();
    Logger::DebugOnce("[LoggerTest] once");
    Logger::DebugOnce("[LoggerTest] once");
    Logger::DebugOnce("[LoggerTest] once");
    std::string output = testing::internal::GetCapturedStdout();

    std::size_t first = output.find("[LoggerTest] once");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(output.find("[LoggerTest] once", first + 1), std::string::npos);
}

} // namespace kineticEngine
