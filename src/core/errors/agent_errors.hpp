#pragma once
#include <string>
#include <variant>

namespace vrc::core::errors {

    // Which subsystem failed. Only Input and Config are fatal at startup; the
    // loop logs the rest and keeps ticking.
    enum class ErrorCategory {
        Input,      // Bad CLI flag or value
        Config,     // Missing API key, out-of-range setting
        Capture,    // Observation snapshot missing or half-written
        Planner,    // Completion timed out, HTTP error, unparseable reply
        Dispatch,   // OSC socket unreachable, scheduler stopped
        Policy,     // Action rejected by the action guard
        Internal    // Filesystem or logic failure
    };

    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";  // Stable snake_case id
            std::string hint = "";               // Shown to the user after the message
            bool retryable = false;              // Transient; the planner retries these
        };

    // Either the value or the error; no exceptions cross module boundaries.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Capture:  return "capture";
            case ErrorCategory::Planner:  return "planner";
            case ErrorCategory::Dispatch: return "dispatch";
            case ErrorCategory::Policy:   return "policy";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // "planner/planner_timeout: Planner call timed out after 30000 ms"
    inline std::string describe(const AgentError& error) {
        return to_string(error.category) + "/" + error.code + ": " + error.message;
    }

} // namespace vrc::core::errors
