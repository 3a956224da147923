#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace regdesk::core::config {

    inline constexpr const char* kDefaultLedgerFile = "user_registrations.csv";
    inline constexpr std::uint32_t kDefaultTimeoutMs = 10000;
    inline constexpr std::uint32_t kMaxTimeoutMs = 600000;

    enum class SessionMode {
        OneShot,     // fresh server process per tool call
        Persistent   // one process, one handshake, many calls
    };

    // Validated options for the tool server executable.
    struct ServerOptions {
        std::filesystem::path ledger_path = kDefaultLedgerFile;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    // Validated options for the chat front end.
    struct ChatOptions {
        std::optional<std::filesystem::path> server_executable;
        std::optional<std::filesystem::path> server_working_directory;
        std::optional<std::filesystem::path> ledger_path;  // forwarded as --ledger
        std::uint32_t timeout_ms = kDefaultTimeoutMs;
        SessionMode session_mode = SessionMode::OneShot;
        bool list_tools = false;
        logging::LogLevel log_level = logging::LogLevel::WARN;
    };

} // namespace regdesk::core::config
