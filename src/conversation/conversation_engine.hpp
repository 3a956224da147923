#pragma once

#include <string>
#include "client/tool_invoker.hpp"
#include "protocol/tool_contract.hpp"

namespace regdesk::conversation {

enum class ConversationStep {
    Start,
    Name,
    Email,
    Dob,
    Confirm
};

// Per-user dialogue state. The caller owns one instance per user session
// and passes it into every turn.
struct ConversationState {
    ConversationStep step = ConversationStep::Start;
    std::string name;
    std::string email;
    std::string dob;
    bool completed = false;

    void reset() {
        step = ConversationStep::Start;
        name.clear();
        email.clear();
        dob.clear();
        completed = false;
    }
};

std::string to_string(ConversationStep step);

// Turns one line of user text into at most one tool call and a chat reply.
class ConversationEngine {
public:
    explicit ConversationEngine(client::ToolInvoker& tools);

    std::string handle(ConversationState& state, const std::string& input);

    static std::string welcome_message();
    static std::string help_message();

private:
    std::string show_registrations();
    std::string show_statistics();
    std::string search(const std::string& query);
    std::string show_confirmation(const ConversationState& state);
    std::string complete_registration(ConversationState& state);

    std::string handle_step(ConversationState& state, const std::string& input,
                            const std::string& lowered);

    client::ToolInvoker& tools_;
};

}  // namespace regdesk::conversation
