#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "client/child_process.hpp"
#include "core/errors/desk_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/wire_contract.hpp"

namespace regdesk::client {

// Request ids are owned by the client so they keep increasing across
// the connections it opens.
class RequestIds {
public:
    std::int64_t allocate() { return next_++; }
    std::int64_t peek() const { return next_; }

private:
    std::int64_t next_ = 1;
};

// One handshaken connection to a tool server child process. Strictly
// half-duplex: callers send one request and wait for its reply, but
// replies are routed through a pending table keyed by id.
class ProtocolConnection {
public:
    // Spawns the server, sends initialize, waits for the reply and sends
    // the initialized notification.
    static core::errors::Result<std::unique_ptr<ProtocolConnection>> open(
        const ServerCommand& command, std::chrono::milliseconds timeout, RequestIds& ids);

    ~ProtocolConnection();
    ProtocolConnection(const ProtocolConnection&) = delete;
    ProtocolConnection& operator=(const ProtocolConnection&) = delete;

    // Sends one request and returns the matching reply envelope. Transport
    // failures tear the connection down.
    core::errors::Result<protocol::Envelope> request(const std::string& method,
                                                     nlohmann::json params);

    core::errors::Result<protocol::ToolReply> call_tool(const std::string& name,
                                                        const nlohmann::json& arguments);
    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools();
    core::errors::Result<std::string> read_resource(const std::string& uri);

    // Closes stdin and terminates the child. Safe to call repeatedly.
    void close();

    bool is_open() const { return child_ != nullptr; }
    std::size_t pending_count() const { return pending_.size(); }
    const nlohmann::json& server_info() const { return server_info_; }

private:
    ProtocolConnection(std::unique_ptr<ChildProcess> child, std::chrono::milliseconds timeout,
                       RequestIds& ids);

    core::errors::Result<std::int64_t> send_request(const std::string& method,
                                                    nlohmann::json params);
    core::errors::Result<core::errors::Done> send_notification(const std::string& method);
    core::errors::Result<protocol::Envelope> await_response(std::int64_t id);
    core::errors::Result<core::errors::Done> send_line(const nlohmann::json& message);

    core::errors::DeskError fail(core::errors::ErrorCategory category,
                                 const std::string& message, const std::string& code);

    std::unique_ptr<ChildProcess> child_;
    std::chrono::milliseconds timeout_;
    RequestIds& ids_;
    std::map<std::int64_t, std::string> pending_;
    std::map<std::int64_t, protocol::Envelope> completed_;
    nlohmann::json server_info_ = nlohmann::json::object();
};

// Message carried by an error object, or the object itself when it has none.
std::string error_message(const nlohmann::json& error);

}  // namespace regdesk::client
