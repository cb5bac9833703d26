#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace autopilot::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // The one process-wide sink. Everything else is owned by the Agent.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Opens (and truncates) a log file that receives every line in addition to the console.
        bool open_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
            file_.clear();
            file_.open(path, std::ios::out | std::ios::trunc);
            return file_.is_open();
        }

        void close_file() {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            std::ostringstream line;
            line << "[" << level_to_string(level) << "] "
                 << (tag_.empty() ? "" : "[" + tag_ + "] ")
                 << message;

            std::cout << line.str() << std::endl;
            if (file_.is_open()) {
                file_ << timestamp() << " - " << line.str() << '\n';
                file_.flush();
            }
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string tag_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ofstream file_;

        static std::string timestamp() {
            const std::time_t now =
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local{};
            localtime_r(&now, &local);
            std::ostringstream out;
            out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return out.str();
        }

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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) autopilot::core::logging::Logger::get().log(autopilot::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  autopilot::core::logging::Logger::get().log(autopilot::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  autopilot::core::logging::Logger::get().log(autopilot::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) autopilot::core::logging::Logger::get().log(autopilot::core::logging::LogLevel::ERROR, msg)

} // namespace autopilot::core::logging
