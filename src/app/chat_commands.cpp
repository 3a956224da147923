#include "app/chat_commands.hpp"

#include "validation/registration_validator.hpp"

namespace regdesk::app {

namespace {

const std::string kSearchShortcut = "/search";

}  // namespace

client::ServerCommand build_server_command(const core::config::ChatOptions& options,
                                           const std::filesystem::path& fallback_executable) {
    client::ServerCommand command;
    command.executable = options.server_executable.value_or(fallback_executable);
    command.working_directory = options.server_working_directory;
    if (options.ledger_path) {
        command.arguments = {"--ledger", options.ledger_path->string()};
    }
    return command;
}

std::string ledger_uri(const core::config::ChatOptions& options) {
    const std::filesystem::path ledger =
        options.ledger_path.value_or(core::config::kDefaultLedgerFile);
    return "file://" + ledger.filename().string();
}

std::string expand_shortcut(const std::string& line) {
    if (line == "/register") return "register";
    if (line == "/view") return "show registrations";
    if (line == "/stats") return "statistics";
    if (line == kSearchShortcut || line.rfind(kSearchShortcut + " ", 0) == 0) {
        return "search " + validation::trim(line.substr(kSearchShortcut.size()));
    }
    return line;
}

}  // namespace regdesk::app
