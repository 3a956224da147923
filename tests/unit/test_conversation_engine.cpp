#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "client/tool_clients.hpp"
#include "client/tool_invoker.hpp"
#include "conversation/conversation_engine.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/desk_errors.hpp"
#include "protocol/tool_contract.hpp"

#ifndef REGDESK_SERVER_BINARY
#define REGDESK_SERVER_BINARY "regdesk_server"
#endif

namespace {

using nlohmann::json;
using regdesk::conversation::ConversationEngine;
using regdesk::conversation::ConversationState;
using regdesk::conversation::ConversationStep;
using regdesk::core::errors::DeskError;
using regdesk::core::errors::ErrorCategory;
using regdesk::core::errors::Result;
using regdesk::protocol::ToolDescriptor;
using regdesk::protocol::ToolReply;
using regdesk::protocol::ToolStatus;

struct RecordedCall {
    std::string name;
    json arguments;
};

// Scripted stand-in for the tool server.
class FakeToolInvoker : public regdesk::client::ToolInvoker {
public:
    Result<ToolReply> call_tool(const std::string& name, const json& arguments) override {
        calls.push_back({name, arguments});
        const auto it = replies.find(name);
        if (it != replies.end()) {
            return it->second;
        }
        ToolReply reply;
        reply.content = "reply from " + name;
        reply.status = ToolStatus::Success;
        return reply;
    }

    Result<std::vector<ToolDescriptor>> list_tools() override {
        return std::vector<ToolDescriptor>{};
    }

    Result<std::string> read_resource(const std::string&) override { return std::string(); }

    void script(const std::string& name, Result<ToolReply> reply) {
        replies.erase(name);
        replies.emplace(name, std::move(reply));
    }

    std::vector<RecordedCall> calls;
    std::map<std::string, Result<ToolReply>> replies;
};

ToolReply make_reply(const std::string& content, ToolStatus status) {
    ToolReply reply;
    reply.content = content;
    reply.status = status;
    return reply;
}

// Walks the dialogue up to the confirmation step.
void fill_registration(ConversationEngine& engine, ConversationState& state) {
    engine.handle(state, "register");
    engine.handle(state, "Al");
    engine.handle(state, "al@example.com");
    engine.handle(state, "1990-05-15");
}

TEST(ConversationEngineTest, StartStepAnswersWithTheWelcome) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);
    ConversationState state;

    EXPECT_EQ(engine.handle(state, "hello"), ConversationEngine::welcome_message());
    EXPECT_EQ(state.step, ConversationStep::Start);
    EXPECT_TRUE(tools.calls.empty());
}

TEST(ConversationEngineTest, HelpIsAvailableEverywhere) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);
    ConversationState state;
    engine.handle(state, "register");

    EXPECT_EQ(engine.handle(state, "HELP"), ConversationEngine::help_message());
    EXPECT_EQ(engine.handle(state, "/help"), ConversationEngine::help_message());
    EXPECT_EQ(state.step, ConversationStep::Name);
}

TEST(ConversationEngineTest, RegisterStartsAFreshDialogue) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);
    ConversationState state;
    state.name = "Stale";
    state.step = ConversationStep::Dob;

    const auto reply = engine.handle(state, "  Sign Up ");
    EXPECT_NE(reply.find("What's your full name?"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Name);
    EXPECT_TRUE(state.name.empty());
}

TEST(ConversationEngineTest, StepsRejectMalformedInputWithoutAdvancing) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);
    ConversationState state;
    engine.handle(state, "register");

    EXPECT_NE(engine.handle(state, "A").find("at least 2 characters"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Name);

    engine.handle(state, "Al");
    EXPECT_EQ(state.step, ConversationStep::Email);
    EXPECT_NE(engine.handle(state, "not-an-email").find("valid email address"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Email);

    engine.handle(state, "al@example.com");
    EXPECT_EQ(state.step, ConversationStep::Dob);
    EXPECT_NE(engine.handle(state, "15/05/1990").find("YYYY-MM-DD"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Dob);
    EXPECT_TRUE(tools.calls.empty());
}

TEST(ConversationEngineTest, DateOfBirthTriggersServerValidation) {
    FakeToolInvoker tools;
    tools.script("validate_registration_data",
                 make_reply("**Overall Status:** Ready for registration!", ToolStatus::Success));
    ConversationEngine engine(tools);
    ConversationState state;

    fill_registration(engine, state);
    EXPECT_EQ(state.step, ConversationStep::Confirm);
    EXPECT_EQ(state.name, "Al");
    EXPECT_EQ(state.email, "al@example.com");
    EXPECT_EQ(state.dob, "1990-05-15");

    ASSERT_EQ(tools.calls.size(), 1u);
    EXPECT_EQ(tools.calls[0].name, "validate_registration_data");
    EXPECT_EQ(tools.calls[0].arguments,
              (json{{"name", "Al"}, {"email", "al@example.com"}, {"dob", "1990-05-15"}}));
}

TEST(ConversationEngineTest, FailedValidationAsksForRestart) {
    FakeToolInvoker tools;
    tools.script("validate_registration_data",
                 make_reply("**Email:** taken", ToolStatus::Duplicate));
    ConversationEngine engine(tools);
    ConversationState state;

    engine.handle(state, "register");
    engine.handle(state, "Al");
    engine.handle(state, "al@example.com");
    const auto reply = engine.handle(state, "1990-05-15");
    EXPECT_NE(reply.find("Please fix the issues above"), std::string::npos);
    EXPECT_NE(reply.find("**Email:** taken"), std::string::npos);
}

TEST(ConversationEngineTest, ProseOnlyValidationFallsBackToTheReadyMarker) {
    FakeToolInvoker tools;
    ToolReply prose;
    prose.content = "**Overall Status:** Ready for registration!";
    tools.script("validate_registration_data", prose);
    ConversationEngine engine(tools);
    ConversationState state;

    engine.handle(state, "register");
    engine.handle(state, "Al");
    engine.handle(state, "al@example.com");
    EXPECT_NE(engine.handle(state, "1990-05-15").find("Everything looks good"), std::string::npos);
}

TEST(ConversationEngineTest, ConfirmCommitsAndResets) {
    FakeToolInvoker tools;
    tools.script("add_registration",
                 make_reply("SUCCESS: Successfully registered Al", ToolStatus::Success));
    ConversationEngine engine(tools);
    ConversationState state;
    fill_registration(engine, state);

    const auto reply = engine.handle(state, "Yes");
    EXPECT_NE(reply.find("Registration Completed Successfully"), std::string::npos);
    EXPECT_NE(reply.find("SUCCESS: Successfully registered Al"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Start);
    EXPECT_TRUE(state.name.empty());
    EXPECT_TRUE(state.email.empty());
    EXPECT_TRUE(state.dob.empty());
    EXPECT_FALSE(state.completed);

    ASSERT_EQ(tools.calls.size(), 2u);
    EXPECT_EQ(tools.calls[1].name, "add_registration");
}

TEST(ConversationEngineTest, DomainFailureOnCommitKeepsTheConfirmStep) {
    FakeToolInvoker tools;
    tools.script("add_registration",
                 make_reply("ERROR: Registration failed: Email already registered",
                            ToolStatus::Duplicate));
    ConversationEngine engine(tools);
    ConversationState state;
    fill_registration(engine, state);

    const auto reply = engine.handle(state, "confirm");
    EXPECT_NE(reply.find("Registration Failed"), std::string::npos);
    EXPECT_NE(reply.find("Email already registered"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Confirm);
    EXPECT_EQ(state.email, "al@example.com");
}

TEST(ConversationEngineTest, TransportFailureOnCommitKeepsTheData) {
    FakeToolInvoker tools;
    tools.script("add_registration",
                 DeskError{ErrorCategory::ServerUnavailable, "Tool server exited", "server_exited"});
    ConversationEngine engine(tools);
    ConversationState state;
    fill_registration(engine, state);

    const auto reply = engine.handle(state, "confirm");
    EXPECT_NE(reply.find("Tool server exited"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Confirm);
    EXPECT_EQ(state.name, "Al");
    EXPECT_EQ(state.dob, "1990-05-15");
}

TEST(ConversationEngineTest, RestartSynonymsClearTheFields) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);

    for (const char* word : {"restart", "no", "N", "edit"}) {
        ConversationState state;
        fill_registration(engine, state);
        const auto reply = engine.handle(state, word);
        EXPECT_NE(reply.find("Let's start over!"), std::string::npos) << word;
        EXPECT_EQ(state.step, ConversationStep::Name) << word;
        EXPECT_TRUE(state.name.empty()) << word;
        EXPECT_TRUE(state.email.empty()) << word;
    }
}

TEST(ConversationEngineTest, UnrecognizedConfirmationInputRepeatsTheChoice) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);
    ConversationState state;
    fill_registration(engine, state);
    const auto calls_before = tools.calls.size();

    const auto reply = engine.handle(state, "maybe");
    EXPECT_NE(reply.find("Please confirm your registration"), std::string::npos);
    EXPECT_EQ(state.step, ConversationStep::Confirm);
    EXPECT_EQ(tools.calls.size(), calls_before);
}

TEST(ConversationEngineTest, DataCommandsDoNotDisturbTheDialogue) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);
    ConversationState state;
    engine.handle(state, "register");
    engine.handle(state, "Al");

    EXPECT_EQ(engine.handle(state, "Show Stats"), "reply from get_registration_statistics");
    EXPECT_EQ(engine.handle(state, "view all"), "reply from get_all_registrations");
    EXPECT_EQ(state.step, ConversationStep::Email);
    EXPECT_EQ(state.name, "Al");
}

TEST(ConversationEngineTest, SearchPassesTheQueryThrough) {
    FakeToolInvoker tools;
    ConversationEngine engine(tools);
    ConversationState state;

    engine.handle(state, "Search   John Smith ");
    ASSERT_EQ(tools.calls.size(), 1u);
    EXPECT_EQ(tools.calls[0].name, "search_registrations");
    EXPECT_EQ(tools.calls[0].arguments.at("query"), "John Smith");

    EXPECT_NE(engine.handle(state, "search").find("**Usage:** search [name or email]"),
              std::string::npos);
    EXPECT_EQ(tools.calls.size(), 1u);
}

TEST(ConversationEngineTest, DataCommandFailuresAreRenderedWithTheErrorMarker) {
    FakeToolInvoker tools;
    tools.script("get_registration_statistics",
                 DeskError{ErrorCategory::ProtocolViolation, "garbled reply", "invalid_json"});
    ConversationEngine engine(tools);
    ConversationState state;

    EXPECT_EQ(engine.handle(state, "statistics"),
              "\xE2\x9D\x8C **Statistics Error:** garbled reply");
}

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_conversation_" + regdesk::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TEST(ConversationEngineTest, CompleteRegistrationAgainstTheRealServer) {
    TempWorkspace workspace;
    regdesk::client::ServerCommand command;
    command.executable = REGDESK_SERVER_BINARY;
    command.working_directory = workspace.root();
    regdesk::client::OneShotToolClient tools(command, std::chrono::milliseconds(10000));
    ConversationEngine engine(tools);
    ConversationState state;

    engine.handle(state, "register");
    // A one-character name never leaves the name step.
    engine.handle(state, "A");
    EXPECT_EQ(state.step, ConversationStep::Name);

    engine.handle(state, "Al");
    engine.handle(state, "al@example.com");
    const auto confirmation = engine.handle(state, "1990-05-15");
    EXPECT_NE(confirmation.find("Ready for registration!"), std::string::npos) << confirmation;
    EXPECT_EQ(state.step, ConversationStep::Confirm);

    const auto committed = engine.handle(state, "confirm");
    EXPECT_NE(committed.find("SUCCESS: Successfully registered Al"), std::string::npos)
        << committed;
    EXPECT_EQ(state.step, ConversationStep::Start);

    const auto listing = engine.handle(state, "show registrations");
    EXPECT_NE(listing.find("**1. Al**"), std::string::npos) << listing;
    EXPECT_NE(listing.find("al@example.com"), std::string::npos);

    engine.handle(state, "register");
    engine.handle(state, "Al Again");
    engine.handle(state, "AL@example.com");
    engine.handle(state, "1991-01-01");
    const auto duplicate = engine.handle(state, "confirm");
    EXPECT_NE(duplicate.find("Email already registered"), std::string::npos) << duplicate;
    EXPECT_EQ(state.step, ConversationStep::Confirm);
}

}  // namespace
