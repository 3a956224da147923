#pragma once

#include <filesystem>
#include <string>
#include "client/child_process.hpp"
#include "core/config/options.hpp"

namespace regdesk::app {

// Launch command for the tool server. `fallback_executable` is used when
// no --server was given.
client::ServerCommand build_server_command(const core::config::ChatOptions& options,
                                           const std::filesystem::path& fallback_executable);

// Resource uri the server publishes for the configured ledger.
std::string ledger_uri(const core::config::ChatOptions& options);

// Maps the sidebar-style shortcuts (/register, /view, /stats, /search)
// onto the conversational commands. Other input passes through.
std::string expand_shortcut(const std::string& line);

}  // namespace regdesk::app
