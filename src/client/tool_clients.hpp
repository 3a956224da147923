#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "client/child_process.hpp"
#include "client/protocol_connection.hpp"
#include "client/tool_invoker.hpp"

namespace regdesk::client {

// Default mode: every call spawns a fresh server, performs the handshake,
// sends exactly one request, reads exactly one reply and terminates the
// process on every exit path.
class OneShotToolClient : public ToolInvoker {
public:
    OneShotToolClient(ServerCommand command, std::chrono::milliseconds timeout);

    core::errors::Result<protocol::ToolReply> call_tool(
        const std::string& name, const nlohmann::json& arguments) override;
    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() override;
    core::errors::Result<std::string> read_resource(const std::string& uri) override;

    // Next id this client will put on the wire.
    std::int64_t next_request_id() const { return ids_.peek(); }

private:
    ServerCommand command_;
    std::chrono::milliseconds timeout_;
    RequestIds ids_;
};

// Opt-in mode: one long-lived server process and a single handshake shared
// by many calls. A transport failure closes the session; the next call
// opens a new one.
class ToolSession : public ToolInvoker {
public:
    ToolSession(ServerCommand command, std::chrono::milliseconds timeout);
    ~ToolSession() override;

    core::errors::Result<core::errors::Done> open();
    void close();
    bool is_open() const;

    core::errors::Result<protocol::ToolReply> call_tool(
        const std::string& name, const nlohmann::json& arguments) override;
    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() override;
    core::errors::Result<std::string> read_resource(const std::string& uri) override;

    std::int64_t next_request_id() const { return ids_.peek(); }
    std::size_t handshakes() const { return handshakes_; }

private:
    template <typename T, typename Call>
    core::errors::Result<T> with_connection(Call&& call);

    ServerCommand command_;
    std::chrono::milliseconds timeout_;
    RequestIds ids_;
    std::unique_ptr<ProtocolConnection> connection_;
    std::size_t handshakes_ = 0;
};

}  // namespace regdesk::client
