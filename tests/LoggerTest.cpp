#include <gtest/gtest.h>
#include <shared/utils/Logger.hpp>

using RegionComposite::Shared::Logger;
using RegionComposite::Shared::LogLevel;

namespace {

// Restores the quiet level used by the rest of the suite
class LoggerLevelGuard {
  public:
    LoggerLevelGuard() : saved_(Logger::getInstance().getLevel()) {}
    ~LoggerLevelGuard() {
        Logger::getInstance().setLevel(saved_);
        Logger::getInstance().setTimestampsEnabled(true);
    }

  private:
    LogLevel saved_;
};

}  // namespace

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("off"), LogLevel::OFF);
    EXPECT_EQ(Logger::parseLevel("verbose", LogLevel::WARN), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel(""), LogLevel::INFO);
}

TEST(LoggerTest, ErrorsGoToStderrWithLevelPrefix) {
    LoggerLevelGuard guard;
    Logger::getInstance().setLevel(LogLevel::WARN);
    Logger::getInstance().setTimestampsEnabled(false);

    ::testing::internal::CaptureStderr();
    LOG_ERROR("crop ", 128, "x", 192, " rejected");
    std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(output, "[ERROR] crop 128x192 rejected\n");
}

TEST(LoggerTest, MessagesBelowLevelAreDropped) {
    LoggerLevelGuard guard;
    Logger::getInstance().setLevel(LogLevel::ERROR);

    ::testing::internal::CaptureStderr();
    LOG_WARN("not shown");
    std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(output.empty());
}
