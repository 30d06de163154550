#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"

namespace vrc::app::cli {

    enum class Command {
        Run,        // Start the control loop
        Preflight   // Print the readiness report and exit
    };

    // Normalized command line. Optional fields override the config file.
    struct CliOptions {
        Command command = Command::Run;
        std::filesystem::path config_path = "config/agent.json";
        std::optional<vrc::core::config::Preset> preset;
        bool dry_run = false;
        bool once = false;
        std::optional<std::string> osc_host;
        std::optional<std::uint16_t> osc_port;
        bool verbose = false;
    };

    vrc::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    // Folds command line overrides into a loaded config.
    void apply_overrides(const CliOptions& options, vrc::core::config::AgentConfig& config);

    std::string usage();
}
