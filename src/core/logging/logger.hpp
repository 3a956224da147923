#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace regdesk::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Writes to stderr: stdout belongs to the wire protocol (server) or to
    // the conversation text (chat front end).
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // nullptr restores stderr.
        void set_sink(std::ostream* sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = sink == nullptr ? &std::cerr : sink;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            (*sink_) << "[" << level_to_string(level) << "] "
                     << (session_tag_.empty() ? "" : "[" + session_tag_ + "] ")
                     << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_tag_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) regdesk::core::logging::Logger::get().log(regdesk::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  regdesk::core::logging::Logger::get().log(regdesk::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  regdesk::core::logging::Logger::get().log(regdesk::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) regdesk::core::logging::Logger::get().log(regdesk::core::logging::LogLevel::ERROR, msg)

} // namespace regdesk::core::logging
