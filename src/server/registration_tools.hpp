#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/desk_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "storage/registration_store.hpp"

namespace regdesk::server {

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

// The five registration tools bound to one ledger. Every tool returns a
// ToolOutcome; only an unknown tool name is reported as an error.
class RegistrationTools {
public:
    explicit RegistrationTools(storage::RegistrationStore store);

    std::vector<protocol::ToolDescriptor> list_tools() const;

    core::errors::Result<protocol::ToolOutcome> call_tool(
        const std::string& name, const nlohmann::json& arguments) const;

    protocol::ToolOutcome validate_registration(const std::string& name,
                                                const std::string& email,
                                                const std::string& dob) const;
    protocol::ToolOutcome add_registration(const std::string& name,
                                           const std::string& email,
                                           const std::string& dob) const;
    protocol::ToolOutcome get_all_registrations() const;
    protocol::ToolOutcome search_registrations(const std::string& query) const;
    protocol::ToolOutcome get_statistics() const;

    std::vector<ResourceDescriptor> list_resources() const;
    core::errors::Result<std::string> read_resource(const std::string& uri) const;
    std::string ledger_uri() const;

    const storage::RegistrationStore& store() const { return store_; }

private:
    storage::RegistrationStore store_;
};

}  // namespace regdesk::server
