#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace autoloop::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger shared by the CLI and the loop
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

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            // Warnings and errors go to stderr so stdout stays readable for the operator
            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
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
    #define AUTOLOOP_LOG_DEBUG(msg) autoloop::core::logging::Logger::get().log(autoloop::core::logging::LogLevel::DEBUG, msg)
    #define AUTOLOOP_LOG_INFO(msg)  autoloop::core::logging::Logger::get().log(autoloop::core::logging::LogLevel::INFO, msg)
    #define AUTOLOOP_LOG_WARN(msg)  autoloop::core::logging::Logger::get().log(autoloop::core::logging::LogLevel::WARN, msg)
    #define AUTOLOOP_LOG_ERROR(msg) autoloop::core::logging::Logger::get().log(autoloop::core::logging::LogLevel::ERROR, msg)

} // namespace autoloop::core::logging
