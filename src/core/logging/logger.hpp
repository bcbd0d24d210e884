#pragma once
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <mutex>

namespace relay::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
        if (text == "info" || text == "INFO") return LogLevel::INFO;
        if (text == "warn" || text == "WARN") return LogLevel::WARN;
        if (text == "error" || text == "ERROR") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Session tags are "session-" followed by eight lowercase hex digits.
    inline std::string format_session_id(std::uint32_t value) {
        char digits[9];
        std::snprintf(digits, sizeof(digits), "%08x", static_cast<unsigned int>(value));
        return std::string("session-") + digits;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        // Tags every following line with a fresh random session id.
        std::string begin_session() {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<std::uint32_t> dis;
            const std::string id = format_session_id(dis(gen));
            set_session_id(id);
            return id;
        }

        std::string session_id() {
            std::lock_guard<std::mutex> lock(mutex_);
            return session_id_;
        }

        // The tool server must keep stdout free for protocol traffic, so it
        // points the logger at std::cerr.
        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        std::ostream* out_ = &std::cout;
        LogLevel min_level_ = LogLevel::INFO;

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

    // 3. Helper macros for clean syntax everywhere else in your code
    #define RELAY_LOG_DEBUG(msg) relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::DEBUG, msg)
    #define RELAY_LOG_INFO(msg)  relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::INFO, msg)
    #define RELAY_LOG_WARN(msg)  relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::WARN, msg)
    #define RELAY_LOG_ERROR(msg) relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::ERROR, msg)

} // namespace relay::core::logging
