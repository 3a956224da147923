#include "client/protocol_connection.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace regdesk::client {

using core::errors::DeskError;
using core::errors::Done;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Envelope;
namespace method = protocol::method;

namespace {

constexpr std::chrono::milliseconds kDiagnosticDrain{500};

std::string trim_trailing_newlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

}  // namespace

std::string error_message(const json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    return error.dump();
}

ProtocolConnection::ProtocolConnection(std::unique_ptr<ChildProcess> child,
                                       const std::chrono::milliseconds timeout,
                                       RequestIds& ids)
    : child_(std::move(child)), timeout_(timeout), ids_(ids) {}

ProtocolConnection::~ProtocolConnection() { close(); }

core::errors::Result<std::unique_ptr<ProtocolConnection>> ProtocolConnection::open(
    const ServerCommand& command, const std::chrono::milliseconds timeout, RequestIds& ids) {
    auto spawned = ChildProcess::spawn(command);
    if (core::errors::is_error(spawned)) {
        const auto& err = core::errors::get_error(spawned);
        return DeskError{ErrorCategory::ServerUnavailable,
                         "Unable to start tool server: " + err.message, err.code};
    }

    std::unique_ptr<ProtocolConnection> connection(new ProtocolConnection(
        std::move(std::get<std::unique_ptr<ChildProcess>>(spawned)), timeout, ids));

    json params;
    params["protocolVersion"] = protocol::kProtocolVersion;
    params["capabilities"] = {{"tools", json::object()}};
    params["clientInfo"] = {{"name", protocol::kClientName},
                            {"version", protocol::kSoftwareVersion}};

    auto reply = connection->request(method::kInitialize, std::move(params));
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& envelope = core::errors::get_value(reply);
    if (envelope.error) {
        connection->close();
        return DeskError{ErrorCategory::InitializeFailed,
                         "Initialize failed: " + error_message(*envelope.error),
                         "initialize_rejected"};
    }
    if (envelope.result && envelope.result->is_object() &&
        envelope.result->contains("serverInfo") && (*envelope.result)["serverInfo"].is_object()) {
        connection->server_info_ = (*envelope.result)["serverInfo"];
    }

    auto notified = connection->send_notification(method::kInitialized);
    if (core::errors::is_error(notified)) {
        return core::errors::get_error(notified);
    }
    LOG_DEBUG("ProtocolConnection: handshake complete with " + connection->server_info_.dump());
    return connection;
}

DeskError ProtocolConnection::fail(const ErrorCategory category, const std::string& message,
                                   const std::string& code) {
    std::string diagnostics;
    if (child_) {
        // A child that died may still be flushing stderr. A timed-out child is
        // alive, so waiting for its stderr to close would only add latency.
        diagnostics = category == ErrorCategory::ServerUnavailable && code != "read_timeout"
                          ? child_->drain_diagnostics(kDiagnosticDrain)
                          : child_->diagnostics();
        diagnostics = trim_trailing_newlines(diagnostics);
    }
    close();

    DeskError error{category, message, code, diagnostics};
    if (category == ErrorCategory::ServerUnavailable && !diagnostics.empty()) {
        error.message += ": " + diagnostics;
    }
    LOG_WARN("ProtocolConnection: [" + code + "] " + error.message);
    return error;
}

core::errors::Result<Done> ProtocolConnection::send_line(const json& message) {
    if (!child_) {
        return DeskError{ErrorCategory::ServerUnavailable, "Connection is closed.",
                         "connection_closed"};
    }
    const std::string line = protocol::encode_line(message);
    LOG_DEBUG("ProtocolConnection: >> " + line.substr(0, line.size() - 1));
    auto written = child_->write_all(line);
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        return fail(ErrorCategory::ServerUnavailable, err.message, err.code);
    }
    return Done{};
}

core::errors::Result<std::int64_t> ProtocolConnection::send_request(const std::string& name,
                                                                    json params) {
    const std::int64_t id = ids_.allocate();
    auto sent = send_line(protocol::make_request(id, name, std::move(params)));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    pending_[id] = name;
    return id;
}

core::errors::Result<Done> ProtocolConnection::send_notification(const std::string& name) {
    return send_line(protocol::make_notification(name));
}

core::errors::Result<Envelope> ProtocolConnection::await_response(const std::int64_t id) {
    const auto done = completed_.find(id);
    if (done != completed_.end()) {
        Envelope envelope = std::move(done->second);
        completed_.erase(done);
        return envelope;
    }

    const std::string awaited = pending_.count(id) != 0 ? pending_[id] : "request";
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (child_) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return fail(ErrorCategory::ServerUnavailable,
                        "Timed out after " + std::to_string(timeout_.count()) +
                            " ms waiting for the reply to " + awaited,
                        "read_timeout");
        }

        const auto outcome = child_->read_line(remaining);
        if (outcome.status == ReadStatus::TimedOut) {
            continue;
        }
        if (outcome.status == ReadStatus::EndOfStream) {
            return fail(ErrorCategory::ServerUnavailable,
                        "Tool server exited without replying to " + awaited, "server_exited");
        }
        if (outcome.line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        LOG_DEBUG("ProtocolConnection: << " + outcome.line);

        auto decoded = protocol::decode_line(outcome.line);
        if (core::errors::is_error(decoded)) {
            const auto& err = core::errors::get_error(decoded);
            return fail(ErrorCategory::ProtocolViolation, err.message, err.code);
        }
        Envelope envelope = std::move(std::get<Envelope>(decoded));

        if (!envelope.is_response()) {
            LOG_DEBUG("ProtocolConnection: ignoring server-initiated " + envelope.method);
            continue;
        }
        if (!envelope.id || !envelope.id->is_number_integer()) {
            return fail(ErrorCategory::ProtocolViolation,
                        "Reply carries no usable id: " + outcome.line, "id_mismatch");
        }

        const auto reply_id = envelope.id->get<std::int64_t>();
        if (reply_id == id) {
            pending_.erase(id);
            return envelope;
        }
        if (pending_.count(reply_id) != 0) {
            pending_.erase(reply_id);
            completed_.emplace(reply_id, std::move(envelope));
            continue;
        }
        return fail(ErrorCategory::ProtocolViolation,
                    "Reply id " + std::to_string(reply_id) +
                        " does not match outstanding request " + std::to_string(id),
                    "id_mismatch");
    }

    return DeskError{ErrorCategory::ServerUnavailable, "Connection is closed.",
                     "connection_closed"};
}

core::errors::Result<Envelope> ProtocolConnection::request(const std::string& name,
                                                           json params) {
    auto sent = send_request(name, std::move(params));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return await_response(core::errors::get_value(sent));
}

core::errors::Result<protocol::ToolReply> ProtocolConnection::call_tool(
    const std::string& name, const json& arguments) {
    json params;
    params["name"] = name;
    params["arguments"] = arguments.is_object() ? arguments : json::object();

    auto reply = request(method::kToolCall, std::move(params));
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& envelope = core::errors::get_value(reply);
    if (envelope.error) {
        return DeskError{ErrorCategory::CallFailed, error_message(*envelope.error),
                         "tool_call_failed"};
    }
    return protocol::reply_from_result(*envelope.result);
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> ProtocolConnection::list_tools() {
    auto reply = request(method::kToolList, json::object());
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& envelope = core::errors::get_value(reply);
    if (envelope.error) {
        return DeskError{ErrorCategory::CallFailed, error_message(*envelope.error),
                         "tool_list_failed"};
    }

    const auto& result = *envelope.result;
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return DeskError{ErrorCategory::ProtocolViolation, "Tool list reply has no tools array.",
                         "invalid_tool_list"};
    }
    std::vector<protocol::ToolDescriptor> tools;
    for (const auto& entry : result["tools"]) {
        auto descriptor = protocol::descriptor_from_json(entry);
        if (core::errors::is_error(descriptor)) {
            return core::errors::get_error(descriptor);
        }
        tools.push_back(core::errors::get_value(descriptor));
    }
    return tools;
}

core::errors::Result<std::string> ProtocolConnection::read_resource(const std::string& uri) {
    auto reply = request(method::kResourceRead, {{"uri", uri}});
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& envelope = core::errors::get_value(reply);
    if (envelope.error) {
        return DeskError{ErrorCategory::CallFailed, error_message(*envelope.error),
                         "resource_read_failed"};
    }

    const auto& result = *envelope.result;
    if (!result.is_object() || !result.contains("contents") || !result["contents"].is_array() ||
        result["contents"].empty() || !result["contents"][0].is_object()) {
        return DeskError{ErrorCategory::ProtocolViolation, "Resource reply has no contents.",
                         "invalid_resource_reply"};
    }
    const auto& first = result["contents"][0];
    if (!first.contains("text")) {
        return std::string();
    }
    if (!first["text"].is_string()) {
        return DeskError{ErrorCategory::ProtocolViolation, "Resource text is not a string.",
                         "invalid_resource_reply"};
    }
    return first["text"].get<std::string>();
}

void ProtocolConnection::close() {
    if (child_) {
        static_cast<void>(child_->terminate());
        child_.reset();
    }
    pending_.clear();
}

}  // namespace regdesk::client
