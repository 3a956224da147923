#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/desk_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace regdesk::protocol {

using json = nlohmann::json;

inline constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "registration-server";
inline constexpr const char* kClientName = "registration-chatbot";
inline constexpr const char* kSoftwareVersion = "1.0.0";

namespace method {
    inline constexpr const char* kInitialize = "initialize";
    inline constexpr const char* kInitialized = "initialized-notification";
    inline constexpr const char* kToolList = "tool-list";
    inline constexpr const char* kToolCall = "tool-call";
    inline constexpr const char* kResourceList = "resource-list";
    inline constexpr const char* kResourceRead = "resource-read";
}

// JSON-RPC 2.0 error codes
namespace error_code {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
}

// One decoded line of the wire protocol.
struct Envelope {
    std::optional<json> id;  // absent for notifications; may be null
    std::string method;      // empty for responses
    json params = json::object();
    std::optional<json> result;
    std::optional<json> error;

    bool is_request() const { return !method.empty() && id.has_value(); }
    bool is_notification() const { return !method.empty() && !id.has_value(); }
    bool is_response() const { return method.empty() && (result || error); }
};

// Maps the MCP spellings onto the method names used on this wire.
std::string canonical_method(const std::string& method);

json make_request(std::int64_t id, const std::string& method, json params);
json make_notification(const std::string& method);
json make_result(const json& id, json result);
json make_error(const json& id, int code, const std::string& message);

// Serialises a message as exactly one newline-terminated line.
std::string encode_line(const json& message);

core::errors::Result<Envelope> decode_line(const std::string& line);

// tool-call result payload <-> ToolOutcome / ToolReply
json outcome_to_result(const ToolOutcome& outcome);
ToolReply reply_from_result(const json& result);

json descriptor_to_json(const ToolDescriptor& descriptor);
core::errors::Result<ToolDescriptor> descriptor_from_json(const json& value);

}  // namespace regdesk::protocol
