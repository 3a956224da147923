#include "client/tool_clients.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace regdesk::client {

using core::errors::Done;

OneShotToolClient::OneShotToolClient(ServerCommand command,
                                     const std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

core::errors::Result<protocol::ToolReply> OneShotToolClient::call_tool(
    const std::string& name, const nlohmann::json& arguments) {
    LOG_INFO("OneShotToolClient: calling " + name);
    auto opened = ProtocolConnection::open(command_, timeout_, ids_);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    // The connection's destructor tears the process down on every path.
    auto connection = std::move(std::get<std::unique_ptr<ProtocolConnection>>(opened));
    auto reply = connection->call_tool(name, arguments);
    connection->close();
    return reply;
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> OneShotToolClient::list_tools() {
    auto opened = ProtocolConnection::open(command_, timeout_, ids_);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    auto connection = std::move(std::get<std::unique_ptr<ProtocolConnection>>(opened));
    auto tools = connection->list_tools();
    connection->close();
    return tools;
}

core::errors::Result<std::string> OneShotToolClient::read_resource(const std::string& uri) {
    auto opened = ProtocolConnection::open(command_, timeout_, ids_);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    auto connection = std::move(std::get<std::unique_ptr<ProtocolConnection>>(opened));
    auto content = connection->read_resource(uri);
    connection->close();
    return content;
}

ToolSession::ToolSession(ServerCommand command, const std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

ToolSession::~ToolSession() { close(); }

core::errors::Result<Done> ToolSession::open() {
    if (is_open()) {
        return Done{};
    }
    auto opened = ProtocolConnection::open(command_, timeout_, ids_);
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    connection_ = std::move(std::get<std::unique_ptr<ProtocolConnection>>(opened));
    ++handshakes_;
    LOG_INFO("ToolSession: session opened (handshake " + std::to_string(handshakes_) + ")");
    return Done{};
}

void ToolSession::close() {
    if (connection_) {
        connection_->close();
        connection_.reset();
        LOG_INFO("ToolSession: session closed");
    }
}

bool ToolSession::is_open() const { return connection_ && connection_->is_open(); }

template <typename T, typename Call>
core::errors::Result<T> ToolSession::with_connection(Call&& call) {
    auto opened = open();
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    core::errors::Result<T> result = call(*connection_);
    if (!connection_->is_open()) {
        connection_.reset();
    }
    return result;
}

core::errors::Result<protocol::ToolReply> ToolSession::call_tool(
    const std::string& name, const nlohmann::json& arguments) {
    LOG_INFO("ToolSession: calling " + name);
    return with_connection<protocol::ToolReply>(
        [&](ProtocolConnection& connection) { return connection.call_tool(name, arguments); });
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> ToolSession::list_tools() {
    return with_connection<std::vector<protocol::ToolDescriptor>>(
        [](ProtocolConnection& connection) { return connection.list_tools(); });
}

core::errors::Result<std::string> ToolSession::read_resource(const std::string& uri) {
    return with_connection<std::string>(
        [&](ProtocolConnection& connection) { return connection.read_resource(uri); });
}

}  // namespace regdesk::client
