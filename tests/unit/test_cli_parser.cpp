#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/options.hpp"
#include "core/errors/desk_errors.hpp"

namespace {

using regdesk::app::cli::parse_chat_args;
using regdesk::app::cli::parse_server_args;
using regdesk::core::config::ChatOptions;
using regdesk::core::config::ServerOptions;
using regdesk::core::config::SessionMode;
using regdesk::core::errors::ErrorCategory;
using regdesk::core::errors::get_error;
using regdesk::core::errors::get_value;
using regdesk::core::errors::is_error;
using regdesk::core::logging::LogLevel;

template <typename Parser>
auto parse_tokens(Parser parser, const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("regdesk");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parser(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, ServerDefaultsWithNoArguments) {
    auto result = parse_tokens(parse_server_args, {});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.ledger_path, std::filesystem::path("user_registrations.csv"));
    EXPECT_EQ(options.log_level, LogLevel::INFO);
}

TEST(CliParserTest, ServerAcceptsLedgerAndLogLevel) {
    auto result = parse_tokens(parse_server_args, {"--ledger", "ledger.csv", "--log-level", "debug"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).ledger_path, std::filesystem::path("ledger.csv"));
    EXPECT_EQ(get_value(result).log_level, LogLevel::DEBUG);
}

TEST(CliParserTest, ServerRejectsUnknownArgument) {
    auto result = parse_tokens(parse_server_args, {"--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "unknown_argument");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, ServerRejectsMissingValue) {
    auto result = parse_tokens(parse_server_args, {"--ledger"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, ServerRejectsLedgerInMissingDirectory) {
    auto result = parse_tokens(parse_server_args, {"--ledger", "__no_such_dir__/ledger.csv"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ServerRejectsUnknownLogLevel) {
    auto result = parse_tokens(parse_server_args, {"--log-level", "loud"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, ChatDefaults) {
    auto result = parse_tokens(parse_chat_args, {});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_FALSE(options.server_executable.has_value());
    EXPECT_FALSE(options.ledger_path.has_value());
    EXPECT_EQ(options.timeout_ms, 10000u);
    EXPECT_EQ(options.session_mode, SessionMode::OneShot);
    EXPECT_FALSE(options.list_tools);
}

TEST(CliParserTest, ChatParsesSessionTimeoutAndListTools) {
    auto result = parse_tokens(parse_chat_args,
                               {"--session", "persistent", "--timeout-ms", "2500", "--list-tools"});
    ASSERT_FALSE(is_error(result));

    const auto& options = get_value(result);
    EXPECT_EQ(options.session_mode, SessionMode::Persistent);
    EXPECT_EQ(options.timeout_ms, 2500u);
    EXPECT_TRUE(options.list_tools);
}

TEST(CliParserTest, ChatRejectsNonNumericTimeout) {
    auto result = parse_tokens(parse_chat_args, {"--timeout-ms", "ten"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, ChatRejectsTimeoutOutOfBounds) {
    auto zero = parse_tokens(parse_chat_args, {"--timeout-ms", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto huge = parse_tokens(parse_chat_args, {"--timeout-ms", "600001"});
    ASSERT_TRUE(is_error(huge));
    EXPECT_EQ(get_error(huge).code, "bounds_error");
}

TEST(CliParserTest, ChatRejectsUnknownSessionMode) {
    auto result = parse_tokens(parse_chat_args, {"--session", "pooled"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_session_mode");
}

TEST(CliParserTest, ChatRejectsMissingServerExecutable) {
    auto result = parse_tokens(parse_chat_args, {"--server", "__missing_server_binary__"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ChatRejectsServerCwdThatIsNotADirectory) {
    auto result = parse_tokens(parse_chat_args, {"--server-cwd", "__missing_dir__"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ChatPinsRelativePathsToTheCurrentDirectory) {
    auto result = parse_tokens(parse_chat_args, {"--server-cwd", ".", "--ledger", "ledger.csv"});
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& options = get_value(result);
    const auto cwd = std::filesystem::current_path();
    ASSERT_TRUE(options.server_working_directory.has_value());
    EXPECT_TRUE(options.server_working_directory->is_absolute());
    EXPECT_TRUE(std::filesystem::equivalent(*options.server_working_directory, cwd));
    ASSERT_TRUE(options.ledger_path.has_value());
    EXPECT_EQ(*options.ledger_path, (cwd / "ledger.csv").lexically_normal());
}

}  // namespace
