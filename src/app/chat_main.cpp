#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include "app/chat_commands.hpp"
#include "app/cli_parser.hpp"
#include "client/tool_clients.hpp"
#include "conversation/conversation_engine.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/desk_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"
#include "validation/registration_validator.hpp"

namespace {

const char* const kServerExecutableName = "regdesk_server";

// The server is installed beside the chat binary; fall back to a PATH lookup.
std::filesystem::path default_server_executable() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        const auto sibling = self.parent_path() / kServerExecutableName;
        if (std::filesystem::exists(sibling, ec)) {
            return sibling;
        }
    }
    return kServerExecutableName;
}

int print_tool_catalog(regdesk::client::ToolInvoker& tools) {
    auto listed = tools.list_tools();
    if (regdesk::core::errors::is_error(listed)) {
        const auto& err = regdesk::core::errors::get_error(listed);
        LOG_ERROR("Tool listing failed [" + err.code + "]: " + err.message);
        return 4;
    }
    for (const auto& tool : regdesk::core::errors::get_value(listed)) {
        std::cout << tool.name << " - " << tool.description << "\n";
    }
    return 0;
}

void ping_server(regdesk::client::ToolInvoker& tools) {
    auto ping = tools.call_tool(regdesk::protocol::tool::kGetStatistics, nlohmann::json::object());
    if (regdesk::core::errors::is_error(ping)) {
        const auto& err = regdesk::core::errors::get_error(ping);
        LOG_WARN("Tool server unreachable [" + err.code + "]: " + err.message);
        return;
    }
    LOG_INFO("Tool server connected.");
}

}  // namespace

int main(int argc, char* argv[]) {
    regdesk::core::logging::Logger::get().set_session_tag(
        regdesk::core::config::generate_session_id("chat"));
    regdesk::core::logging::Logger::get().set_min_level(regdesk::core::logging::LogLevel::WARN);

    auto parsed = regdesk::app::cli::parse_chat_args(argc, argv);
    if (regdesk::core::errors::is_error(parsed)) {
        const auto& err = regdesk::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_ERROR("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = regdesk::core::errors::get_value(parsed);
    regdesk::core::logging::Logger::get().set_min_level(options.log_level);

    const auto command =
        regdesk::app::build_server_command(options, default_server_executable());
    const std::chrono::milliseconds timeout(options.timeout_ms);
    std::unique_ptr<regdesk::client::ToolInvoker> tools;
    if (options.session_mode == regdesk::core::config::SessionMode::Persistent) {
        tools = std::make_unique<regdesk::client::ToolSession>(command, timeout);
    } else {
        tools = std::make_unique<regdesk::client::OneShotToolClient>(command, timeout);
    }
    LOG_INFO("Using tool server: " + command.executable.string());

    if (options.list_tools) {
        return print_tool_catalog(*tools);
    }

    ping_server(*tools);

    regdesk::conversation::ConversationEngine engine(*tools);
    regdesk::conversation::ConversationState state;
    std::cout << regdesk::conversation::ConversationEngine::welcome_message() << "\n\n> "
              << std::flush;

    std::string line;
    while (std::getline(std::cin, line)) {
        const std::string input = regdesk::validation::trim(line);
        if (input == "/quit") {
            break;
        }

        std::string reply;
        if (input.empty()) {
            reply.clear();
        } else if (input == "/clear") {
            state.reset();
            reply = regdesk::conversation::ConversationEngine::welcome_message();
        } else if (input == "/ledger") {
            auto content = tools->read_resource(regdesk::app::ledger_uri(options));
            reply = regdesk::core::errors::is_error(content)
                        ? "Could not read the ledger: " +
                              regdesk::core::errors::get_error(content).message
                        : regdesk::core::errors::get_value(content);
        } else {
            reply = engine.handle(state, regdesk::app::expand_shortcut(input));
        }

        if (!reply.empty()) {
            std::cout << "\n" << reply << "\n";
        }
        std::cout << "\n> " << std::flush;
    }

    std::cout << "\nGoodbye!" << std::endl;
    return 0;
}
