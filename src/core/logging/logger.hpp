#pragma once
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace rustmcp::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole server shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Prefixed to every line, e.g. the server instance name.
        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // stdout carries the stream transport, so the default sink is stderr.
        void set_sink(std::ostream& sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = &sink;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (tag_.empty() ? "" : "[" + tag_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string tag_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cerr;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros used everywhere else in the code
    #define LOG_DEBUG(msg) rustmcp::core::logging::Logger::get().log(rustmcp::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  rustmcp::core::logging::Logger::get().log(rustmcp::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  rustmcp::core::logging::Logger::get().log(rustmcp::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) rustmcp::core::logging::Logger::get().log(rustmcp::core::logging::LogLevel::ERROR, msg)

} // namespace rustmcp::core::logging
