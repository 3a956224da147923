#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/wire_contract.hpp"
#include "server/registration_tools.hpp"

namespace regdesk::server {

// Line-oriented JSON-RPC front of the registration tools: one JSON value
// per line in, at most one JSON value per line out.
class StdioServer {
public:
    explicit StdioServer(const RegistrationTools& tools);

    // Returns the reply for one input line; nullopt for notifications and
    // stray responses.
    std::optional<nlohmann::json> handle_line(const std::string& line);

    // Serves until the input reaches EOF; returns the process exit code.
    int run(std::istream& in, std::ostream& out);

    bool initialized() const { return initialized_; }

private:
    nlohmann::json handle_request(const protocol::Envelope& request);
    nlohmann::json handle_initialize(const nlohmann::json& id);
    nlohmann::json handle_tool_call(const nlohmann::json& id, const nlohmann::json& params);
    nlohmann::json handle_resource_read(const nlohmann::json& id, const nlohmann::json& params);

    const RegistrationTools& tools_;
    bool initialize_seen_ = false;
    bool initialized_ = false;
};

}  // namespace regdesk::server
