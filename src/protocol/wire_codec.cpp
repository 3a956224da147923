#include "protocol/wire_contract.hpp"

#include <utility>

namespace regdesk::protocol {

using core::errors::DeskError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kMaxQuotedLine = 200;

std::string quote_for_error(const std::string& line) {
    if (line.size() <= kMaxQuotedLine) {
        return line;
    }
    return line.substr(0, kMaxQuotedLine) + "...";
}

}  // namespace

std::string canonical_method(const std::string& method) {
    if (method == "notifications/initialized") return method::kInitialized;
    if (method == "tools/list") return method::kToolList;
    if (method == "tools/call") return method::kToolCall;
    if (method == "resources/list") return method::kResourceList;
    if (method == "resources/read") return method::kResourceRead;
    return method;
}

json make_request(const std::int64_t id, const std::string& method, json params) {
    json message;
    message["jsonrpc"] = kJsonRpcVersion;
    message["id"] = id;
    message["method"] = method;
    message["params"] = std::move(params);
    return message;
}

json make_notification(const std::string& method) {
    json message;
    message["jsonrpc"] = kJsonRpcVersion;
    message["method"] = method;
    return message;
}

json make_result(const json& id, json result) {
    json message;
    message["jsonrpc"] = kJsonRpcVersion;
    message["id"] = id;
    message["result"] = std::move(result);
    return message;
}

json make_error(const json& id, const int code, const std::string& message) {
    json out;
    out["jsonrpc"] = kJsonRpcVersion;
    out["id"] = id;
    out["error"] = {{"code", code}, {"message", message}};
    return out;
}

std::string encode_line(const json& message) {
    // dump() never emits a raw newline, so one value is always one line.
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

core::errors::Result<Envelope> decode_line(const std::string& line) {
    json parsed;
    try {
        parsed = json::parse(line);
    } catch (const json::parse_error& e) {
        return DeskError{ErrorCategory::ProtocolViolation,
                         "Invalid JSON line: " + quote_for_error(line),
                         "invalid_json", e.what()};
    }

    if (!parsed.is_object()) {
        return DeskError{ErrorCategory::ProtocolViolation,
                         "Message is not a JSON object: " + quote_for_error(line),
                         "not_an_object"};
    }

    Envelope envelope;
    if (parsed.contains("id")) {
        envelope.id = parsed["id"];
    }
    if (parsed.contains("method")) {
        if (!parsed["method"].is_string()) {
            return DeskError{ErrorCategory::ProtocolViolation,
                             "Message method is not a string.", "invalid_method"};
        }
        envelope.method = parsed["method"].get<std::string>();
    }
    if (parsed.contains("params")) {
        envelope.params = parsed["params"];
    }
    if (parsed.contains("result")) {
        envelope.result = parsed["result"];
    }
    if (parsed.contains("error")) {
        envelope.error = parsed["error"];
    }

    if (envelope.method.empty() && !envelope.result && !envelope.error) {
        return DeskError{ErrorCategory::ProtocolViolation,
                         "Message is neither a request nor a response: " +
                             quote_for_error(line),
                         "invalid_envelope"};
    }
    return envelope;
}

json outcome_to_result(const ToolOutcome& outcome) {
    json fields = json::object();
    for (const auto& [key, value] : outcome.fields) {
        fields[key] = value;
    }

    json text_item;
    text_item["type"] = "text";
    text_item["text"] = outcome.text;

    json result;
    result["content"] = json::array();
    result["content"].push_back(std::move(text_item));
    result["structuredContent"] = {{"status", to_string(outcome.status)},
                                   {"fields", std::move(fields)}};
    result["isError"] = outcome.status != ToolStatus::Success;
    return result;
}

ToolReply reply_from_result(const json& result) {
    ToolReply reply;
    if (!result.is_object()) {
        reply.content = "Operation completed successfully";
        return reply;
    }

    const auto content = result.find("content");
    if (content != result.end() && content->is_array() && !content->empty()) {
        const auto& first = content->front();
        if (first.is_object() && first.contains("text") && first["text"].is_string()) {
            reply.content = first["text"].get<std::string>();
        }
    } else {
        reply.content = "Operation completed successfully";
    }

    const auto structured = result.find("structuredContent");
    if (structured != result.end() && structured->is_object()) {
        const auto status = structured->find("status");
        if (status != structured->end() && status->is_string()) {
            reply.status = parse_tool_status(status->get<std::string>());
        }
        const auto fields = structured->find("fields");
        if (fields != structured->end() && fields->is_object()) {
            for (const auto& item : fields->items()) {
                if (item.value().is_string()) {
                    reply.fields[item.key()] = item.value().get<std::string>();
                }
            }
        }
    }
    return reply;
}

json descriptor_to_json(const ToolDescriptor& descriptor) {
    return {{"name", descriptor.name},
            {"description", descriptor.description},
            {"inputSchema", descriptor.input_schema}};
}

core::errors::Result<ToolDescriptor> descriptor_from_json(const json& value) {
    if (!value.is_object() || !value.contains("name") || !value["name"].is_string()) {
        return DeskError{ErrorCategory::ProtocolViolation,
                         "Tool catalog entry has no name.", "invalid_tool_entry"};
    }
    ToolDescriptor descriptor;
    descriptor.name = value["name"].get<std::string>();
    if (value.contains("description")) {
        if (!value["description"].is_string()) {
            return DeskError{ErrorCategory::ProtocolViolation,
                             "Tool '" + descriptor.name + "' has a non-string description.",
                             "invalid_tool_entry"};
        }
        descriptor.description = value["description"].get<std::string>();
    }
    descriptor.input_schema = json::object();
    if (value.contains("inputSchema")) {
        if (!value["inputSchema"].is_object()) {
            return DeskError{ErrorCategory::ProtocolViolation,
                             "Tool '" + descriptor.name + "' has a non-object input schema.",
                             "invalid_tool_entry"};
        }
        descriptor.input_schema = value["inputSchema"];
    }
    return descriptor;
}

}  // namespace regdesk::protocol
