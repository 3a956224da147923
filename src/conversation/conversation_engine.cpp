#include "conversation/conversation_engine.hpp"

#include <algorithm>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "validation/registration_validator.hpp"

namespace regdesk::conversation {

using nlohmann::json;
using protocol::ToolReply;
using protocol::ToolStatus;

namespace {

const std::string kSearchCommand = "search";

bool is_one_of(const std::string& lowered, std::initializer_list<const char*> options) {
    return std::any_of(options.begin(), options.end(),
                       [&lowered](const char* option) { return lowered == option; });
}

bool is_show_command(const std::string& s) {
    return is_one_of(s, {"show registrations", "get all registrations", "list registrations",
                         "view all"});
}

bool is_statistics_command(const std::string& s) {
    return is_one_of(s, {"statistics", "stats", "show stats"});
}

bool is_register_command(const std::string& s) {
    return is_one_of(s, {"start registration", "register", "new registration", "sign up"});
}

bool is_help_command(const std::string& s) { return is_one_of(s, {"help", "/help", "commands"}); }

bool is_confirm_word(const std::string& s) { return is_one_of(s, {"confirm", "yes", "y", "correct"}); }

bool is_restart_word(const std::string& s) { return is_one_of(s, {"restart", "no", "n", "edit"}); }

bool reply_succeeded(const ToolReply& reply, const char* legacy_marker) {
    if (reply.status) {
        return *reply.status == ToolStatus::Success;
    }
    return reply.content.find(legacy_marker) != std::string::npos;
}

std::string render_error(const std::string& label, const core::errors::DeskError& error) {
    return "\xE2\x9D\x8C **" + label + ":** " + error.message;
}

json registration_arguments(const ConversationState& state) {
    return {{"name", state.name}, {"email", state.email}, {"dob", state.dob}};
}

}  // namespace

std::string to_string(const ConversationStep step) {
    switch (step) {
        case ConversationStep::Start:
            return "start";
        case ConversationStep::Name:
            return "name";
        case ConversationStep::Email:
            return "email";
        case ConversationStep::Dob:
            return "dob";
        case ConversationStep::Confirm:
            return "confirm";
        default:
            return "unknown";
    }
}

ConversationEngine::ConversationEngine(client::ToolInvoker& tools) : tools_(tools) {}

std::string ConversationEngine::handle(ConversationState& state, const std::string& raw_input) {
    const std::string input = validation::trim(raw_input);
    const std::string lowered = validation::lowercase(input);
    LOG_DEBUG("ConversationEngine: step=" + to_string(state.step) + " input=" + input);

    // Commands that work from any step.
    if (is_show_command(lowered)) {
        return show_registrations();
    }
    if (is_statistics_command(lowered)) {
        return show_statistics();
    }
    if (lowered == kSearchCommand || lowered.rfind(kSearchCommand + " ", 0) == 0) {
        return search(validation::trim(input.substr(kSearchCommand.size())));
    }
    if (is_register_command(lowered)) {
        state.reset();
        state.step = ConversationStep::Name;
        return "Great! Let's start your registration. \xF0\x9F\x93\x9D\n\nWhat's your full name?";
    }
    if (is_help_command(lowered)) {
        return help_message();
    }

    return handle_step(state, input, lowered);
}

std::string ConversationEngine::handle_step(ConversationState& state, const std::string& input,
                                            const std::string& lowered) {
    switch (state.step) {
        case ConversationStep::Start:
            return welcome_message();

        case ConversationStep::Name:
            if (validation::utf8_length(input) < validation::kMinNameLength) {
                return "Please enter a valid name (at least 2 characters long).";
            }
            state.name = input;
            state.step = ConversationStep::Email;
            return "Nice to meet you, **" + input +
                   "**! \xF0\x9F\x91\x8B\n\nNow, please provide your email address:";

        case ConversationStep::Email:
            if (!validation::is_email_format(input)) {
                return "Please enter a valid email address.\n\n**Format:** user@example.com";
            }
            state.email = input;
            state.step = ConversationStep::Dob;
            return "Perfect! \xF0\x9F\x93\xA7\n\nNow please enter your date of birth.\n\n"
                   "**Format:** YYYY-MM-DD (e.g., 1990-05-15)";

        case ConversationStep::Dob:
            if (!validation::is_date_format(input)) {
                return "Please enter a valid date in YYYY-MM-DD format.\n\n"
                       "**Example:** 1990-05-15 for May 15, 1990";
            }
            state.dob = input;
            state.step = ConversationStep::Confirm;
            return show_confirmation(state);

        case ConversationStep::Confirm:
            if (is_confirm_word(lowered)) {
                return complete_registration(state);
            }
            if (is_restart_word(lowered)) {
                state.reset();
                state.step = ConversationStep::Name;
                return "Let's start over! \xF0\x9F\x94\x84\n\nWhat's your full name?";
            }
            return "Please confirm your registration:\n\n"
                   "\xE2\x80\xA2 Type **'confirm'** to complete registration\n"
                   "\xE2\x80\xA2 Type **'restart'** to start over";
    }

    return "I didn't understand that. \xF0\x9F\xA4\x94\n\n"
           "Type **'help'** to see available commands or **'register'** to start a new "
           "registration.";
}

std::string ConversationEngine::show_registrations() {
    auto reply = tools_.call_tool(protocol::tool::kGetAllRegistrations, json::object());
    if (core::errors::is_error(reply)) {
        return render_error("Error", core::errors::get_error(reply));
    }
    return core::errors::get_value(reply).content;
}

std::string ConversationEngine::show_statistics() {
    auto reply = tools_.call_tool(protocol::tool::kGetStatistics, json::object());
    if (core::errors::is_error(reply)) {
        return render_error("Statistics Error", core::errors::get_error(reply));
    }
    return core::errors::get_value(reply).content;
}

std::string ConversationEngine::search(const std::string& query) {
    if (query.empty()) {
        return "Please provide a search query.\n\n**Usage:** search [name or email]";
    }
    auto reply = tools_.call_tool(protocol::tool::kSearchRegistrations, {{"query", query}});
    if (core::errors::is_error(reply)) {
        return render_error("Search Error", core::errors::get_error(reply));
    }
    return core::errors::get_value(reply).content;
}

std::string ConversationEngine::show_confirmation(const ConversationState& state) {
    std::string message = "\xF0\x9F\x93\x8B **Please confirm your registration details:**\n\n";
    message += "\xE2\x80\xA2 **Name:** " + state.name + "\n";
    message += "\xE2\x80\xA2 **Email:** " + state.email + "\n";
    message += "\xE2\x80\xA2 **Date of Birth:** " + state.dob + "\n\n";

    auto reply = tools_.call_tool(protocol::tool::kValidateRegistration,
                                  registration_arguments(state));
    if (core::errors::is_error(reply)) {
        message += "\xE2\x9A\xA0\xEF\xB8\x8F **Validation Error:** " +
                   core::errors::get_error(reply).message + "\n\n";
        message += "Type **'restart'** to try again.";
        return message;
    }

    const auto& validation = core::errors::get_value(reply);
    message += validation.content + "\n\n";
    if (reply_succeeded(validation, "Ready for registration")) {
        message += "\xE2\x9C\x85 **Everything looks good!**\n\n";
        message += "\xE2\x80\xA2 Type **'confirm'** to complete registration\n";
        message += "\xE2\x80\xA2 Type **'restart'** to start over";
    } else {
        message += "\xE2\x9D\x8C **Please fix the issues above before proceeding.**\n\n";
        message += "Type **'restart'** to start over.";
    }
    return message;
}

std::string ConversationEngine::complete_registration(ConversationState& state) {
    auto reply = tools_.call_tool(protocol::tool::kAddRegistration,
                                  registration_arguments(state));
    if (core::errors::is_error(reply)) {
        // Collected fields survive a failed call.
        return "\xE2\x9D\x8C **Registration Failed**\n\n" + core::errors::get_error(reply).message +
               "\n\nPlease try again by typing **'confirm'**, or **'restart'** to start over.";
    }

    const auto& added = core::errors::get_value(reply);
    if (!reply_succeeded(added, "SUCCESS")) {
        return "\xE2\x9D\x8C **Registration Failed**\n\n" + added.content +
               "\n\nPlease try again by typing **'restart'**.";
    }

    LOG_INFO("ConversationEngine: registration committed for " + state.email);
    state.reset();
    return "\xF0\x9F\x8E\x89 **Registration Completed Successfully!**\n\n" + added.content +
           "\n\n**What's next?**\n"
           "\xE2\x80\xA2 Type **'register'** for a new registration\n"
           "\xE2\x80\xA2 Type **'show registrations'** to view all users\n"
           "\xE2\x80\xA2 Type **'statistics'** to view registration stats";
}

std::string ConversationEngine::welcome_message() {
    return "\xF0\x9F\x91\x8B **Welcome to the Registration System!**\n\n"
           "I can help you with:\n\n"
           "**Registration**\n"
           "\xE2\x80\xA2 Type **'register'** to start a new registration\n\n"
           "**View Data**\n"
           "\xE2\x80\xA2 Type **'show registrations'** to view all registered users\n"
           "\xE2\x80\xA2 Type **'statistics'** to see registration statistics\n"
           "\xE2\x80\xA2 Type **'search [query]'** to search by name or email\n\n"
           "**Help**\n"
           "\xE2\x80\xA2 Type **'help'** to see all available commands\n\n"
           "What would you like to do?";
}

std::string ConversationEngine::help_message() {
    return "**Registration Chatbot Help**\n\n"
           "**Registration Commands:**\n"
           "\xE2\x80\xA2 `register` or `start registration` - Begin new user registration\n"
           "\xE2\x80\xA2 `restart` - Start registration over during the process\n\n"
           "**Data Commands:**\n"
           "\xE2\x80\xA2 `show registrations` or `list registrations` - View all registered users\n"
           "\xE2\x80\xA2 `search [query]` - Search by name or email (e.g., \"search john\" or "
           "\"search @gmail\")\n"
           "\xE2\x80\xA2 `statistics` or `stats` - View registration statistics\n\n"
           "**General Commands:**\n"
           "\xE2\x80\xA2 `help` or `commands` - Show this help message\n\n"
           "**Registration Process:**\n"
           "1. **Name** - Provide your full name (2+ characters)\n"
           "2. **Email** - Enter a valid email address\n"
           "3. **Date of Birth** - Enter in YYYY-MM-DD format (e.g., 1990-05-15)\n"
           "4. **Confirmation** - Review and confirm your details\n\n"
           "**Tips:**\n"
           "\xE2\x80\xA2 All data is stored locally in a CSV file\n"
           "\xE2\x80\xA2 Email addresses must be unique\n\n"
           "What would you like to do?";
}

}  // namespace regdesk::conversation
