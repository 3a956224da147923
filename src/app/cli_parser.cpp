#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace regdesk::app::cli {

    using namespace regdesk::core::errors;
    using regdesk::core::config::ChatOptions;
    using regdesk::core::config::ServerOptions;
    using regdesk::core::config::SessionMode;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> ledger;
        std::optional<std::string> log_level;
        std::optional<std::string> server;
        std::optional<std::string> server_cwd;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> session;
        bool list_tools = false;
    };

    std::vector<std::string> collect_args(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }
        return args;
    }

    Result<Done> take_value(const std::vector<std::string>& args, size_t& i,
                            std::optional<std::string>& slot) {
        if (i + 1 < args.size()) {
            slot = args[++i];
            return Done{};
        }
        return DeskError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
    }

    Result<core::logging::LogLevel> validate_log_level(const std::string& text) {
        auto level = core::logging::parse_log_level(text);
        if (!level) {
            return DeskError{ErrorCategory::Input, "Invalid value for --log-level: " + text,
                             "invalid_log_level", "Use one of: debug, info, warn, error."};
        }
        return *level;
    }

    Result<std::filesystem::path> validate_ledger(const std::string& text) {
        if (text.empty()) {
            return DeskError{ErrorCategory::Input, "Ledger path cannot be empty", "invalid_path"};
        }
        std::filesystem::path p(text);
        const auto parent = p.has_parent_path() ? p.parent_path() : std::filesystem::path(".");
        std::error_code path_ec;
        const bool parent_is_dir = std::filesystem::is_directory(parent, path_ec);
        if (path_ec || !parent_is_dir) {
            return DeskError{ErrorCategory::Input, "Ledger directory does not exist: " + parent.string(),
                             "invalid_path"};
        }
        return p;
    }

    // The server child changes directory before exec, so paths handed to it
    // are pinned to the directory the chat was started from.
    Result<std::filesystem::path> pin_to_cwd(const std::filesystem::path& p) {
        std::error_code path_ec;
        auto absolute = std::filesystem::absolute(p, path_ec);
        if (path_ec) {
            return DeskError{ErrorCategory::Input, "Cannot resolve path: " + p.string(), "invalid_path"};
        }
        return absolute.lexically_normal();
    }

    } // namespace

    Result<ServerOptions> parse_server_args(int argc, char* argv[]) {
        RawCliOptions raw;
        const auto args = collect_args(argc, argv);

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            Result<Done> taken = Done{};
            if (args[i] == "--ledger") {
                taken = take_value(args, i, raw.ledger);
            } else if (args[i] == "--log-level") {
                taken = take_value(args, i, raw.log_level);
            } else {
                return DeskError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                 "Usage: regdesk_server [--ledger <path>] [--log-level <level>]"};
            }
            if (is_error(taken)) return get_error(taken);
        }

        // 3. Validator Phase
        ServerOptions options;
        if (raw.ledger) {
            auto ledger = validate_ledger(*raw.ledger);
            if (is_error(ledger)) return get_error(ledger);
            options.ledger_path = get_value(ledger);
        }
        if (raw.log_level) {
            auto level = validate_log_level(*raw.log_level);
            if (is_error(level)) return get_error(level);
            options.log_level = get_value(level);
        }
        return options;
    }

    Result<ChatOptions> parse_chat_args(int argc, char* argv[]) {
        RawCliOptions raw;
        const auto args = collect_args(argc, argv);

        // 2. Parser Phase
        for (size_t i = 0; i < args.size(); ++i) {
            Result<Done> taken = Done{};
            if (args[i] == "--server") {
                taken = take_value(args, i, raw.server);
            } else if (args[i] == "--server-cwd") {
                taken = take_value(args, i, raw.server_cwd);
            } else if (args[i] == "--ledger") {
                taken = take_value(args, i, raw.ledger);
            } else if (args[i] == "--timeout-ms") {
                taken = take_value(args, i, raw.timeout_ms);
            } else if (args[i] == "--session") {
                taken = take_value(args, i, raw.session);
            } else if (args[i] == "--log-level") {
                taken = take_value(args, i, raw.log_level);
            } else if (args[i] == "--list-tools") {
                raw.list_tools = true;
            } else {
                return DeskError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
            if (is_error(taken)) return get_error(taken);
        }

        // 3. Validator Phase: Enforce logic and bounds
        ChatOptions options;
        options.list_tools = raw.list_tools;

        if (raw.server) {
            std::filesystem::path p(raw.server.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return DeskError{ErrorCategory::Input, "Server executable not found: " + p.string(),
                                 "invalid_path"};
            }
            auto pinned = pin_to_cwd(p);
            if (is_error(pinned)) return get_error(pinned);
            options.server_executable = get_value(pinned);
        }

        if (raw.server_cwd) {
            std::filesystem::path p(raw.server_cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return DeskError{ErrorCategory::Input, "Server working directory does not exist or is not a directory",
                                 "invalid_path"};
            }
            auto pinned = pin_to_cwd(p);
            if (is_error(pinned)) return get_error(pinned);
            options.server_working_directory = get_value(pinned);
        }

        if (raw.ledger) {
            auto ledger = validate_ledger(*raw.ledger);
            if (is_error(ledger)) return get_error(ledger);
            auto pinned = pin_to_cwd(get_value(ledger));
            if (is_error(pinned)) return get_error(pinned);
            options.ledger_path = get_value(pinned);
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return DeskError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer",
                                 "Provide a positive integer."};
            }
            if (timeout == 0 || timeout > core::config::kMaxTimeoutMs) {
                return DeskError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error",
                                 "Must be between 1 and 600000."};
            }
            options.timeout_ms = timeout;
        }

        if (raw.session) {
            if (*raw.session == "one-shot") {
                options.session_mode = SessionMode::OneShot;
            } else if (*raw.session == "persistent") {
                options.session_mode = SessionMode::Persistent;
            } else {
                return DeskError{ErrorCategory::Input, "Invalid value for --session: " + *raw.session,
                                 "invalid_session_mode", "Use 'one-shot' or 'persistent'."};
            }
        }

        if (raw.log_level) {
            auto level = validate_log_level(*raw.log_level);
            if (is_error(level)) return get_error(level);
            options.log_level = get_value(level);
        }

        return options;
    }

} // namespace regdesk::app::cli
