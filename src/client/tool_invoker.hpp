#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/desk_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace regdesk::client {

// Anything that can run a named tool on the registration server.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;

    virtual core::errors::Result<protocol::ToolReply> call_tool(
        const std::string& name, const nlohmann::json& arguments) = 0;

    virtual core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() = 0;

    virtual core::errors::Result<std::string> read_resource(const std::string& uri) = 0;
};

}  // namespace regdesk::client
