#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace cuebridge::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger
    // stdout belongs to the formatted text and vet reports, so log lines go to stderr.
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

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_tag_.empty() ? "" : "[" + session_tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_tag_;
        LogLevel min_level_ = LogLevel::WARN;

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

    // 3. Helper macros
    #define CUEBRIDGE_LOG_DEBUG(msg) cuebridge::core::logging::Logger::get().log(cuebridge::core::logging::LogLevel::DEBUG, msg)
    #define CUEBRIDGE_LOG_INFO(msg)  cuebridge::core::logging::Logger::get().log(cuebridge::core::logging::LogLevel::INFO, msg)
    #define CUEBRIDGE_LOG_WARN(msg)  cuebridge::core::logging::Logger::get().log(cuebridge::core::logging::LogLevel::WARN, msg)
    #define CUEBRIDGE_LOG_ERROR(msg) cuebridge::core::logging::Logger::get().log(cuebridge::core::logging::LogLevel::ERROR, msg)

} // namespace cuebridge::core::logging
