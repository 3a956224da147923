#include "server/stdio_server.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace regdesk::server {

using nlohmann::json;
using protocol::Envelope;
namespace error_code = protocol::error_code;
namespace method = protocol::method;

StdioServer::StdioServer(const RegistrationTools& tools) : tools_(tools) {}

std::optional<json> StdioServer::handle_line(const std::string& line) {
    auto decoded = protocol::decode_line(line);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        LOG_WARN("StdioServer: rejected line [" + err.code + "]: " + err.message);
        const int code = err.code == "invalid_json" ? error_code::PARSE_ERROR
                                                    : error_code::INVALID_REQUEST;
        return protocol::make_error(nullptr, code, err.message);
    }

    const auto& envelope = core::errors::get_value(decoded);
    if (envelope.is_response()) {
        LOG_WARN("StdioServer: ignoring unexpected response message");
        return std::nullopt;
    }

    if (envelope.is_notification()) {
        const std::string name = protocol::canonical_method(envelope.method);
        if (name == method::kInitialized) {
            if (!initialize_seen_) {
                LOG_WARN("StdioServer: initialized notification before initialize");
            }
            initialized_ = true;
            LOG_DEBUG("StdioServer: handshake complete");
        } else {
            LOG_DEBUG("StdioServer: ignoring notification " + envelope.method);
        }
        return std::nullopt;
    }

    return handle_request(envelope);
}

json StdioServer::handle_request(const Envelope& request) {
    const json& id = *request.id;
    const std::string name = protocol::canonical_method(request.method);
    LOG_DEBUG("StdioServer: request " + id.dump() + " " + name);

    if (name == method::kInitialize) {
        return handle_initialize(id);
    }
    if (name == method::kToolList) {
        json tools = json::array();
        for (const auto& descriptor : tools_.list_tools()) {
            tools.push_back(protocol::descriptor_to_json(descriptor));
        }
        return protocol::make_result(id, {{"tools", tools}});
    }
    if (name == method::kToolCall) {
        return handle_tool_call(id, request.params);
    }
    if (name == method::kResourceList) {
        json resources = json::array();
        for (const auto& resource : tools_.list_resources()) {
            resources.push_back({{"uri", resource.uri},
                                 {"name", resource.name},
                                 {"description", resource.description},
                                 {"mimeType", resource.mime_type}});
        }
        return protocol::make_result(id, {{"resources", resources}});
    }
    if (name == method::kResourceRead) {
        return handle_resource_read(id, request.params);
    }

    return protocol::make_error(id, error_code::METHOD_NOT_FOUND,
                                "Method not found: " + request.method);
}

json StdioServer::handle_initialize(const json& id) {
    initialize_seen_ = true;
    json result;
    result["protocolVersion"] = protocol::kProtocolVersion;
    result["capabilities"] = {{"tools", json::object()}, {"resources", json::object()}};
    result["serverInfo"] = {{"name", protocol::kServerName},
                            {"version", protocol::kSoftwareVersion}};
    return protocol::make_result(id, result);
}

json StdioServer::handle_tool_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return protocol::make_error(id, error_code::INVALID_PARAMS,
                                    "tool-call requires a string 'name' parameter");
    }
    const json arguments = params.value("arguments", json::object());
    if (!arguments.is_object()) {
        return protocol::make_error(id, error_code::INVALID_PARAMS,
                                    "tool-call 'arguments' must be an object");
    }
    if (!initialized_) {
        LOG_WARN("StdioServer: tool-call before the handshake completed");
    }

    const std::string tool_name = params["name"].get<std::string>();
    auto outcome = tools_.call_tool(tool_name, arguments);
    if (core::errors::is_error(outcome)) {
        return protocol::make_error(id, error_code::METHOD_NOT_FOUND,
                                    core::errors::get_error(outcome).message);
    }

    const auto& value = core::errors::get_value(outcome);
    LOG_INFO("StdioServer: " + tool_name + " -> " + protocol::to_string(value.status));
    return protocol::make_result(id, protocol::outcome_to_result(value));
}

json StdioServer::handle_resource_read(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        return protocol::make_error(id, error_code::INVALID_PARAMS,
                                    "resource-read requires a string 'uri' parameter");
    }
    const std::string uri = params["uri"].get<std::string>();
    auto content = tools_.read_resource(uri);
    if (core::errors::is_error(content)) {
        const auto& err = core::errors::get_error(content);
        const int code = err.category == core::errors::ErrorCategory::InvalidArgument
                             ? error_code::INVALID_PARAMS
                             : error_code::INTERNAL_ERROR;
        return protocol::make_error(id, code, err.message);
    }

    json item;
    item["uri"] = uri;
    item["mimeType"] = "text/csv";
    item["text"] = core::errors::get_value(content);
    json contents = json::array();
    contents.push_back(std::move(item));
    return protocol::make_result(id, {{"contents", contents}});
}

int StdioServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto reply = handle_line(line);
        if (!reply) {
            continue;
        }
        out << protocol::encode_line(*reply);
        out.flush();
        if (!out.good()) {
            LOG_ERROR("StdioServer: output channel closed");
            return 1;
        }
    }
    LOG_INFO("StdioServer: input closed, shutting down");
    return 0;
}

}  // namespace regdesk::server
