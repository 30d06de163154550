#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace vrc::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Process-wide logger. The loop, the planner worker and the actuation
    // thread all write here; each line carries the writer's thread tag.
    //   12:04:31.518 [INFO ] [session-1a2b3c4d] [loop] Replan (scene_changed)
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        // Tag for lines written by the calling thread.
        static void set_thread_name(const std::string& name) { thread_name() = name; }

        void log(LogLevel level, const std::string& message) {
            const std::string stamp = wall_clock_stamp();
            const std::string& thread = thread_name();

            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
            std::cout << stamp << " [" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << (thread.empty() ? "" : "[" + thread + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string& thread_name() {
            thread_local std::string name;
            return name;
        }

        static std::string wall_clock_stamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()).count() % 1000;
            std::tm local{};
            localtime_r(&seconds, &local);
            std::ostringstream ss;
            ss << std::put_time(&local, "%H:%M:%S") << "." << std::setw(3)
               << std::setfill('0') << millis;
            return ss.str();
        }

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // The message expression is only evaluated when the level is enabled, so
    // DEBUG lines on the tick path cost nothing at the default level.
    #define VRC_LOG_AT(level, msg)                                                   \
        do {                                                                         \
            if (vrc::core::logging::Logger::get().enabled(level)) {                  \
                vrc::core::logging::Logger::get().log(level, msg);                   \
            }                                                                        \
        } while (0)

    #define LOG_DEBUG(msg) VRC_LOG_AT(vrc::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  VRC_LOG_AT(vrc::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  VRC_LOG_AT(vrc::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) VRC_LOG_AT(vrc::core::logging::LogLevel::ERROR, msg)

} // namespace vrc::core::logging
