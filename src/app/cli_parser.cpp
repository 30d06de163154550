#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace vrc::app::cli {

    using namespace vrc::core::errors;
    namespace config = vrc::core::config;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> preset;
        std::optional<std::string> osc_host;
        std::optional<std::string> osc_port;
        bool dry_run = false;
        bool once = false;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: vrc_agent_cli run|preflight [--config PATH] [--preset quiet|active] "
               "[--dry-run] [--once] [--osc-host HOST] [--osc-port N] [--verbose]";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliOptions options;
        std::string command = argv[1];
        if (command == "run") {
            options.command = Command::Run;
        } else if (command == "preflight") {
            options.command = Command::Preflight;
        } else {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--preset") {
                if (i + 1 < args.size()) raw.preset = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --preset", "missing_value"};
            } else if (args[i] == "--osc-host") {
                if (i + 1 < args.size()) raw.osc_host = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --osc-host", "missing_value"};
            } else if (args[i] == "--osc-port") {
                if (i + 1 < args.size()) raw.osc_port = args[++i];
                else return AgentError{ErrorCategory::Input, "Missing value for --osc-port", "missing_value"};
            } else if (args[i] == "--dry-run") {
                raw.dry_run = true;
            } else if (args[i] == "--once") {
                raw.once = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        options.dry_run = raw.dry_run;
        options.once = raw.once;
        options.verbose = raw.verbose;

        if (raw.once && options.command != Command::Run) {
            return AgentError{ErrorCategory::Input, "--once only applies to 'run'", "conflicting_flags"};
        }

        if (raw.config) {
            if (raw.config->empty()) {
                return AgentError{ErrorCategory::Input, "Config path cannot be empty", "invalid_path"};
            }
            options.config_path = std::filesystem::path(raw.config.value());
        }

        if (raw.preset) {
            options.preset = config::preset_from_string(raw.preset.value());
            if (!options.preset.has_value()) {
                return AgentError{ErrorCategory::Input, "Unknown preset: " + raw.preset.value(), "invalid_preset", "Use 'quiet' or 'active'."};
            }
        }

        if (raw.osc_host) {
            if (raw.osc_host->empty()) {
                return AgentError{ErrorCategory::Input, "OSC host cannot be empty", "invalid_host"};
            }
            options.osc_host = raw.osc_host.value();
        }

        // Exception-free integer parsing
        if (raw.osc_port) {
            uint32_t port = 0;
            const char* begin = raw.osc_port->data();
            const char* end = raw.osc_port->data() + raw.osc_port->size();
            auto [ptr, ec] = std::from_chars(begin, end, port);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Input, "Invalid number for --osc-port", "invalid_integer", "Provide a positive integer."};
            }
            if (port == 0 || port > 65535) {
                return AgentError{ErrorCategory::Input, "--osc-port out of bounds", "bounds_error", "Must be between 1 and 65535."};
            }
            options.osc_port = static_cast<std::uint16_t>(port);
        }

        return options;
    }

    void apply_overrides(const CliOptions& options, config::AgentConfig& cfg) {
        if (options.preset) config::apply_preset(cfg, options.preset.value());
        if (options.dry_run) cfg.runtime.dry_run = true;
        if (options.osc_host) cfg.osc.host = options.osc_host.value();
        if (options.osc_port) cfg.osc.port = options.osc_port.value();
    }

} // namespace vrc::app::cli
