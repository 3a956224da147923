#pragma once
#include <random>
#include <sstream>
#include <string>

namespace regdesk::core::config {

    // Generates an 8-character hex ID, e.g. "session-3fa09c1e".
    inline std::string generate_session_id(const std::string& prefix = "session") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace regdesk::core::config
