#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace scriptbox::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info")  return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global logger. Writes to stderr: stdout carries the CLI's JSON response.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        void set_min_level(const LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(const LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
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

    // 3. Helper macros
    #define LOG_DEBUG(msg) scriptbox::core::logging::Logger::get().log(scriptbox::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  scriptbox::core::logging::Logger::get().log(scriptbox::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  scriptbox::core::logging::Logger::get().log(scriptbox::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) scriptbox::core::logging::Logger::get().log(scriptbox::core::logging::LogLevel::ERROR, msg)

} // namespace scriptbox::core::logging
