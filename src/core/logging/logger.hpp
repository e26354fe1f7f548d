#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace cmdtrust::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. Writes to stderr; stdout is reserved for protocol
    // responses.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_project_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            project_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (project_id_.empty() ? "" : "[" + project_id_.substr(0, 8) + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string project_id_;
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

    #define LOG_DEBUG(msg) cmdtrust::core::logging::Logger::get().log(cmdtrust::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  cmdtrust::core::logging::Logger::get().log(cmdtrust::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  cmdtrust::core::logging::Logger::get().log(cmdtrust::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) cmdtrust::core::logging::Logger::get().log(cmdtrust::core::logging::LogLevel::ERROR, msg)

} // namespace cmdtrust::core::logging
