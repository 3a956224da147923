#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/chat_commands.hpp"
#include "app/cli_parser.hpp"
#include "client/tool_clients.hpp"
#include "core/config/options.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/desk_errors.hpp"

#ifndef REGDESK_SERVER_BINARY
#define REGDESK_SERVER_BINARY "regdesk_server"
#endif

namespace {

using regdesk::app::build_server_command;
using regdesk::app::expand_shortcut;
using regdesk::app::ledger_uri;
using regdesk::app::cli::parse_chat_args;
using regdesk::client::OneShotToolClient;
using regdesk::core::config::ChatOptions;
using regdesk::core::errors::get_error;
using regdesk::core::errors::get_value;
using regdesk::core::errors::is_error;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_chat_commands_" + regdesk::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    // Path of `relative` inside the workspace, spelled relative to the cwd.
    std::filesystem::path from_cwd(const std::filesystem::path& relative) const {
        return root_.filename() / relative;
    }

private:
    std::filesystem::path root_;
};

auto parse_chat_tokens(const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args{"regdesk_chat"};
    owned_args.insert(owned_args.end(), tokens.begin(), tokens.end());
    std::vector<char*> argv;
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }
    return parse_chat_args(static_cast<int>(argv.size()), argv.data());
}

TEST(ChatCommandsTest, ExpandsSidebarShortcuts) {
    EXPECT_EQ(expand_shortcut("/register"), "register");
    EXPECT_EQ(expand_shortcut("/view"), "show registrations");
    EXPECT_EQ(expand_shortcut("/stats"), "statistics");
    EXPECT_EQ(expand_shortcut("/search john"), "search john");
    EXPECT_EQ(expand_shortcut("/search   @gmail "), "search @gmail");
    EXPECT_EQ(expand_shortcut("/search"), "search ");
    EXPECT_EQ(expand_shortcut("John Smith"), "John Smith");
}

TEST(ChatCommandsTest, ShortcutMustMatchAWholeWord) {
    EXPECT_EQ(expand_shortcut("/searchfoo"), "/searchfoo");
    EXPECT_EQ(expand_shortcut("/registered"), "/registered");
    EXPECT_EQ(expand_shortcut("/stats now"), "/stats now");
}

TEST(ChatCommandsTest, CommandFallsBackAndForwardsTheLedger) {
    ChatOptions options;
    auto bare = build_server_command(options, "regdesk_server");
    EXPECT_EQ(bare.executable, std::filesystem::path("regdesk_server"));
    EXPECT_TRUE(bare.arguments.empty());
    EXPECT_FALSE(bare.working_directory.has_value());
    EXPECT_EQ(ledger_uri(options), "file://user_registrations.csv");

    options.server_executable = std::filesystem::path("/opt/regdesk/regdesk_server");
    options.ledger_path = std::filesystem::path("/var/lib/regdesk/members.csv");
    auto full = build_server_command(options, "regdesk_server");
    EXPECT_EQ(full.executable, std::filesystem::path("/opt/regdesk/regdesk_server"));
    EXPECT_EQ(full.arguments,
              (std::vector<std::string>{"--ledger", "/var/lib/regdesk/members.csv"}));
    EXPECT_EQ(ledger_uri(options), "file://members.csv");
}

TEST(ChatCommandsTest, RelativeCliPathsStillReachTheServer) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "bin");
    std::filesystem::create_directories(workspace.root() / "work");
    std::filesystem::create_directories(workspace.root() / "data");
    const auto server = workspace.root() / "bin" / "regdesk_server";
    std::filesystem::copy_file(REGDESK_SERVER_BINARY, server);
    std::filesystem::permissions(server, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::add);

    auto parsed = parse_chat_tokens({"--server", workspace.from_cwd("bin/regdesk_server").string(),
                                     "--server-cwd", workspace.from_cwd("work").string(),
                                     "--ledger", workspace.from_cwd("data/members.csv").string()});
    ASSERT_FALSE(is_error(parsed)) << get_error(parsed).message;

    OneShotToolClient client(build_server_command(get_value(parsed), "regdesk_server"),
                             std::chrono::milliseconds(10000));
    auto added = client.call_tool(
        "add_registration",
        {{"name", "John Smith"}, {"email", "john@example.com"}, {"dob", "1990-05-15"}});
    ASSERT_FALSE(is_error(added)) << get_error(added).message;

    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "data" / "members.csv"));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "work" / "members.csv"));
}

}  // namespace
