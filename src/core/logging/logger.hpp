#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace statekeep::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        OFF
    };

    // 2. Process-wide logger. It carries no coordination state, only the
    // output sink, so sharing it across core instances is harmless.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tag prepended to every line, e.g. the worker process name.
        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_ || level == LogLevel::OFF) {
                return;
            }

            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
                << (tag_.empty() ? "" : "[" + tag_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string tag_;
        LogLevel min_level_ = LogLevel::INFO;

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

    // 3. Helper macros used everywhere else
    #define LOG_DEBUG(msg) statekeep::core::logging::Logger::get().log(statekeep::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  statekeep::core::logging::Logger::get().log(statekeep::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  statekeep::core::logging::Logger::get().log(statekeep::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) statekeep::core::logging::Logger::get().log(statekeep::core::logging::LogLevel::ERROR, msg)

} // namespace statekeep::core::logging
