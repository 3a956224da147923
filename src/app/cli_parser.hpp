#pragma once
#include "core/config/options.hpp"
#include "core/errors/desk_errors.hpp"

namespace regdesk::app::cli {
    regdesk::core::errors::Result<regdesk::core::config::ServerOptions> parse_server_args(int argc, char* argv[]);
    regdesk::core::errors::Result<regdesk::core::config::ChatOptions> parse_chat_args(int argc, char* argv[]);
}
