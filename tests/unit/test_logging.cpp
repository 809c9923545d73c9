#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "utils/logging.hpp"
#include <thread>
#include <vector>

using namespace voicegate::utils;
using ::testing::HasSubstr;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::setLevel(LogLevel::INFO);
    }
};

TEST_F(LoggingTest, InfoFormat) {
    Logger::initialize(LogLevel::INFO);

    testing::internal::CaptureStdout();
    Logger::info("Turn 1 complete");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[INFO] Turn 1 complete\n");
}

TEST_F(LoggingTest, ErrorGoesToStderr) {
    Logger::setLevel(LogLevel::INFO);

    testing::internal::CaptureStderr();
    Logger::error("boom");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[ERROR] boom\n");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::setLevel(LogLevel::WARN);

    testing::internal::CaptureStdout();
    Logger::debug("hidden debug");
    Logger::info("hidden info");
    Logger::warn("visible warning");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_THAT(out, ::testing::Not(HasSubstr("hidden")));
    EXPECT_THAT(out, HasSubstr("[WARN] visible warning"));
}

TEST_F(LoggingTest, OffSilencesEverything) {
    Logger::setLevel(LogLevel::OFF);

    EXPECT_FALSE(Logger::isEnabled(LogLevel::ERROR));
    EXPECT_FALSE(Logger::isEnabled(LogLevel::DEBUG));

    testing::internal::CaptureStderr();
    Logger::error("nothing");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}

TEST_F(LoggingTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("off"), LogLevel::OFF);
    EXPECT_EQ(Logger::parseLevel("verbose", LogLevel::WARN), LogLevel::WARN);
}

TEST_F(LoggingTest, LevelNames) {
    EXPECT_EQ(Logger::levelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::parseLevel(Logger::levelToString(LogLevel::ERROR)), LogLevel::ERROR);
}

TEST_F(LoggingTest, LevelChangesWhileOtherThreadsLog) {
    Logger::setLevel(LogLevel::OFF);

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([]() {
            for (int n = 0; n < 2000; ++n) {
                Logger::isEnabled(LogLevel::DEBUG);
                Logger::debug("suppressed");
            }
        });
    }
    std::thread writer([]() {
        for (int n = 0; n < 2000; ++n) {
            Logger::setLevel(n % 2 == 0 ? LogLevel::OFF : LogLevel::ERROR);
        }
    });

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(Logger::getLevel(), LogLevel::ERROR);
}
