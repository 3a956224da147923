#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"

namespace {

using regdesk::core::logging::Logger;
using regdesk::core::logging::LogLevel;
using regdesk::core::logging::parse_log_level;

// Captures log output for one test and restores the process defaults.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::get().set_sink(&captured_); }

    void TearDown() override {
        Logger::get().set_sink(nullptr);
        Logger::get().set_session_tag("");
        Logger::get().set_min_level(LogLevel::INFO);
    }

    std::ostringstream captured_;
};

TEST_F(LoggerTest, PrefixesLevelAndSessionTag) {
    Logger::get().set_min_level(LogLevel::DEBUG);
    Logger::get().set_session_tag("server-0001abcd");

    LOG_WARN("ledger is read-only");
    EXPECT_EQ(captured_.str(), "[WARN ] [server-0001abcd] ledger is read-only\n");
}

TEST_F(LoggerTest, OmitsTheTagWhenNoneIsSet) {
    Logger::get().set_session_tag("");
    LOG_ERROR("boom");
    EXPECT_EQ(captured_.str(), "[ERROR] boom\n");
}

TEST_F(LoggerTest, DropsMessagesBelowTheMinimumLevel) {
    Logger::get().set_min_level(LogLevel::WARN);

    LOG_DEBUG("hidden debug");
    LOG_INFO("hidden info");
    LOG_WARN("shown warn");

    const std::string output = captured_.str();
    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("shown warn"), std::string::npos);
}

TEST(LogLevelTest, ParsesCliSpellings) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("DEBUG").has_value());
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

}  // namespace
