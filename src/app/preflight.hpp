#pragma once

#include <string>
#include <vector>
#include "core/config/agent_config.hpp"

namespace vrc::app {

enum class CheckLevel {
    Green,
    Yellow,  // Works, degraded
    Red      // Will not work as configured
};

struct PreflightCheck {
    std::string name;
    CheckLevel level = CheckLevel::Green;
    std::string detail;
    std::string suggestion;
};

struct PreflightReport {
    std::vector<PreflightCheck> checks;

    CheckLevel overall() const;
};

std::string to_string(CheckLevel level);

// Grades the status of GET {base_url}/models: 200 is ready, a rejected key
// is fatal, throttling and other client errors are degraded.
PreflightCheck classify_models_status(const std::string& url, long status);

// Startup readiness checks. Never fails; problems are reported per check.
PreflightReport run_preflight(const core::config::AgentConfig& config);

void log_report(const PreflightReport& report);

}  // namespace vrc::app
