#include "app/preflight.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include "core/logging/logger.hpp"
#include "osc/osc_message.hpp"
#include "osc/osc_sink.hpp"
#include "planner/openai_backend.hpp"

namespace vrc::app {

namespace {

constexpr core::clock::Duration kModelsTimeout{8000};

PreflightCheck check_osc(const core::config::AgentConfig& config) {
    PreflightCheck check;
    check.name = "osc";
    const std::string target = config.osc.host + ":" + std::to_string(config.osc.port);
    if (config.runtime.dry_run) {
        check.level = CheckLevel::Yellow;
        check.detail = "dry-run, messages for " + target + " are only logged";
        check.suggestion = "Set runtime.dry_run=false to drive the avatar.";
        return check;
    }

    osc::UdpOscSink sink(config.osc.host, config.osc.port);
    auto opened = sink.open();
    if (core::errors::is_error(opened)) {
        const auto& err = core::errors::get_error(opened);
        check.level = CheckLevel::Red;
        check.detail = err.message;
        check.suggestion = "Check osc.host / osc.port and that OSC is enabled in VRChat.";
        return check;
    }
    const std::string resolved = core::errors::get_value(opened);

    // UDP has no handshake; an accepted send is as far as the check can see.
    auto sent = sink.send(osc::OscMessage{"/preflight/ping", {}});
    if (core::errors::is_error(sent)) {
        check.level = CheckLevel::Red;
        check.detail = "udp send to " + resolved + " failed: " +
                       core::errors::get_error(sent).message;
        check.suggestion = "Enable OSC in VRChat and check osc.host / osc.port.";
        return check;
    }
    check.detail = "udp send ok: " + resolved;
    return check;
}

PreflightCheck check_planner(const core::config::AgentConfig& config) {
    PreflightCheck check;
    check.name = "planner";
    if (!config.planner.enabled) {
        check.level = CheckLevel::Yellow;
        check.detail = "disabled, instinct only";
        return check;
    }
    if (config.api.api_key.empty() || config.api.api_key.rfind("your-", 0) == 0) {
        check.level = CheckLevel::Red;
        check.detail = "api.api_key is empty or a placeholder";
        check.suggestion = "Export VRC_AGENT_API_KEY or fill api.api_key.";
        return check;
    }
    const auto& url = config.api.base_url;
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        check.level = CheckLevel::Red;
        check.detail = "api.base_url is not an http(s) URL: " + url;
        check.suggestion = "Use e.g. https://api.openai.com/v1.";
        return check;
    }

    const planner::OpenAiPlannerBackend backend(config.api);
    const auto timeout =
        std::min(kModelsTimeout, core::clock::Duration(config.api.timeout_ms));
    auto status = backend.models_status(timeout);
    if (core::errors::is_error(status)) {
        check.level = CheckLevel::Red;
        check.detail = core::errors::get_error(status).message;
        check.suggestion = "Check network, proxy and api.base_url.";
        return check;
    }
    return classify_models_status(backend.models_url(), core::errors::get_value(status));
}

PreflightCheck check_observation(const core::config::AgentConfig& config) {
    PreflightCheck check;
    check.name = "perception";
    const auto& path = config.perception.observation_file;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        check.level = CheckLevel::Yellow;
        check.detail = "no snapshot at " + path.string();
        check.suggestion = "Start the capture process; the agent idles on instinct until then.";
        return check;
    }
    check.detail = path.string();
    return check;
}

PreflightCheck check_journal(const core::config::AgentConfig& config) {
    PreflightCheck check;
    check.name = "journal";
    std::error_code ec;
    std::filesystem::create_directories(config.session.journal_dir, ec);
    if (ec || !std::filesystem::is_directory(config.session.journal_dir, ec)) {
        check.level = CheckLevel::Red;
        check.detail = "cannot create " + config.session.journal_dir.string();
        check.suggestion = "Point session.journal_dir at a writable directory.";
        return check;
    }
    check.detail = config.session.journal_dir.string();
    return check;
}

}  // namespace

std::string to_string(const CheckLevel level) {
    switch (level) {
        case CheckLevel::Green:
            return "GREEN";
        case CheckLevel::Yellow:
            return "YELLOW";
        case CheckLevel::Red:
            return "RED";
        default:
            return "UNKNOWN";
    }
}

PreflightCheck classify_models_status(const std::string& url, const long status) {
    PreflightCheck check;
    check.name = "planner";
    check.detail = "GET " + url + " -> " + std::to_string(status);
    if (status == 200) {
        check.level = CheckLevel::Green;
    } else if (status == 401 || status == 403) {
        check.level = CheckLevel::Red;
        check.suggestion = "The API key is invalid or lacks access.";
    } else if (status == 429) {
        check.level = CheckLevel::Yellow;
        check.suggestion = "Rate limited; retry later.";
    } else if (status >= 400 && status < 500) {
        check.level = CheckLevel::Yellow;
        check.suggestion = "Endpoint reachable but returned a client error; check that it is "
                           "OpenAI-compatible.";
    } else {
        check.level = CheckLevel::Red;
        check.suggestion = "Server error or unstable network; retry later.";
    }
    return check;
}

CheckLevel PreflightReport::overall() const {
    CheckLevel worst = CheckLevel::Green;
    for (const auto& check : checks) {
        if (static_cast<int>(check.level) > static_cast<int>(worst)) {
            worst = check.level;
        }
    }
    return worst;
}

PreflightReport run_preflight(const core::config::AgentConfig& config) {
    PreflightReport report;
    report.checks.push_back(check_osc(config));
    report.checks.push_back(check_planner(config));
    report.checks.push_back(check_observation(config));
    report.checks.push_back(check_journal(config));
    return report;
}

void log_report(const PreflightReport& report) {
    for (const auto& check : report.checks) {
        const std::string line =
            "Preflight " + check.name + ": " + to_string(check.level) + " - " + check.detail;
        if (check.level == CheckLevel::Red) {
            LOG_ERROR(line);
        } else if (check.level == CheckLevel::Yellow) {
            LOG_WARN(line);
        } else {
            LOG_INFO(line);
        }
        if (!check.suggestion.empty()) {
            LOG_INFO("  -> " + check.suggestion);
        }
    }
    LOG_INFO("Preflight overall: " + to_string(report.overall()));
}

}  // namespace vrc::app
