#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace regdesk::protocol {

    namespace tool {
        inline constexpr const char* kAddRegistration = "add_registration";
        inline constexpr const char* kGetAllRegistrations = "get_all_registrations";
        inline constexpr const char* kSearchRegistrations = "search_registrations";
        inline constexpr const char* kGetStatistics = "get_registration_statistics";
        inline constexpr const char* kValidateRegistration = "validate_registration_data";

        inline const std::array<const char*, 5> kAll = {
            kAddRegistration, kGetAllRegistrations, kSearchRegistrations,
            kGetStatistics, kValidateRegistration};
    }

    // Tagged outcome of a tool execution. Domain failures are outcomes,
    // not protocol errors.
    enum class ToolStatus {
        Success,
        ValidationFailed,
        Duplicate,
        IoError,
        InvalidArgument
    };

    // What a tool hands back to the wire layer.
    struct ToolOutcome {
        ToolStatus status = ToolStatus::Success;
        std::map<std::string, std::string> fields;
        std::string text;  // prose rendering for chat display
    };

    // What the client gets back from one tool call.
    struct ToolReply {
        std::string content;
        std::optional<ToolStatus> status;  // absent when the server sent prose only
        std::map<std::string, std::string> fields;
    };

    // One entry of the tool catalog.
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema;
    };

    inline std::string to_string(const ToolStatus status) {
        switch (status) {
            case ToolStatus::Success:
                return "success";
            case ToolStatus::ValidationFailed:
                return "validation_failed";
            case ToolStatus::Duplicate:
                return "duplicate";
            case ToolStatus::IoError:
                return "io_error";
            case ToolStatus::InvalidArgument:
                return "invalid_argument";
            default:
                return "unknown";
        }
    }

    inline std::optional<ToolStatus> parse_tool_status(const std::string& text) {
        if (text == "success") return ToolStatus::Success;
        if (text == "validation_failed") return ToolStatus::ValidationFailed;
        if (text == "duplicate") return ToolStatus::Duplicate;
        if (text == "io_error") return ToolStatus::IoError;
        if (text == "invalid_argument") return ToolStatus::InvalidArgument;
        return std::nullopt;
    }

} // namespace regdesk::protocol
