#pragma once
#include <string>
#include <variant>

namespace regdesk::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,              // E.g., an unknown CLI flag or out-of-range option
        InvalidArgument,    // E.g., an empty search query
        IOFailure,          // E.g., the ledger file cannot be opened
        ServerUnavailable,  // E.g., the tool server died before replying
        ProtocolViolation,  // E.g., a reply line that is not JSON
        InitializeFailed,   // E.g., the server rejected the handshake
        CallFailed,         // E.g., the server answered a tool call with an error object
        Internal            // E.g., pipe() or fork() failed
    };

    // The standardized error payload
    struct DeskError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a DeskError.
    template <typename T>
    using Result = std::variant<T, DeskError>;

    // Used by operations that only report success or failure.
    struct Done {};

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<DeskError>(result);
    }

    template <typename T>
    const DeskError& get_error(const Result<T>& result) {
        return std::get<DeskError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::InvalidArgument: return "invalid_argument";
            case ErrorCategory::IOFailure: return "io_failure";
            case ErrorCategory::ServerUnavailable: return "server_unavailable";
            case ErrorCategory::ProtocolViolation: return "protocol_violation";
            case ErrorCategory::InitializeFailed: return "initialize_failed";
            case ErrorCategory::CallFailed: return "call_failed";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // Transport-level failures abort a call; everything else is domain-level.
    inline bool is_transport_failure(const ErrorCategory category) {
        return category == ErrorCategory::ServerUnavailable ||
               category == ErrorCategory::ProtocolViolation ||
               category == ErrorCategory::InitializeFailed;
    }

} // namespace regdesk::core::errors
