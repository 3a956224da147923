#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/desk_errors.hpp"
#include "core/logging/logger.hpp"
#include "server/registration_tools.hpp"
#include "server/stdio_server.hpp"
#include "storage/registration_store.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every diagnostic line of this process
    regdesk::core::logging::Logger::get().set_session_tag(
        regdesk::core::config::generate_session_id("server"));

    // 2. Parse CLI input
    auto parsed = regdesk::app::cli::parse_server_args(argc, argv);
    if (regdesk::core::errors::is_error(parsed)) {
        const auto& err = regdesk::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = regdesk::core::errors::get_value(parsed);
    regdesk::core::logging::Logger::get().set_min_level(options.log_level);

    // 3. Make sure the ledger exists before the first request arrives
    regdesk::storage::RegistrationStore store(options.ledger_path);
    auto initialized = store.ensure_initialized();
    if (regdesk::core::errors::is_error(initialized)) {
        const auto& err = regdesk::core::errors::get_error(initialized);
        LOG_ERROR("Ledger initialization failed [" + err.code + "]: " + err.message);
        return 3;
    }

    regdesk::server::RegistrationTools tools(store);
    LOG_INFO("Registration server starting, ledger: " + options.ledger_path.string());
    for (const auto& tool : tools.list_tools()) {
        LOG_INFO("  tool: " + tool.name);
    }

    // 4. Serve until the client closes stdin
    regdesk::server::StdioServer server(tools);
    const int exit_code = server.run(std::cin, std::cout);
    LOG_INFO("Registration server stopped.");
    return exit_code;
}
