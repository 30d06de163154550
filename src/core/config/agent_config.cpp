#include "core/config/agent_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace vrc::core::config {

using errors::AgentError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

bool in_unit_range(const double value) { return value >= 0.0 && value <= 1.0; }

template <typename T>
void read_key(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    target = it->get<T>();
}

void read_path(const json& section, const char* key, std::filesystem::path& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return;
    }
    target = std::filesystem::path(it->get<std::string>());
}

const json& section_or_empty(const json& root, const char* name) {
    static const json kEmpty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

AgentError config_error(const std::string& message, const std::string& code,
                        const std::string& hint = "") {
    return AgentError{ErrorCategory::Config, message, code, hint};
}

}  // namespace

std::string expand_env(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    std::size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
            const auto close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out.append(value, i, std::string::npos);
                break;
            }
            const std::string name = value.substr(i + 2, close - i - 2);
            const char* env = std::getenv(name.c_str());
            if (env != nullptr) {
                out += env;
            }
            i = close + 1;
            continue;
        }
        out.push_back(value[i]);
        ++i;
    }
    return out;
}

errors::Result<AgentConfig> parse_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return config_error(std::string("Config is not valid JSON: ") + e.what(),
                            "config_parse_failed");
    }
    if (!root.is_object()) {
        return config_error("Config root must be a JSON object.", "config_parse_failed");
    }

    AgentConfig cfg;
    try {
        const auto& api = section_or_empty(root, "api");
        read_key(api, "base_url", cfg.api.base_url);
        read_key(api, "api_key", cfg.api.api_key);
        read_key(api, "model", cfg.api.model);
        read_key(api, "timeout_ms", cfg.api.timeout_ms);
        cfg.api.api_key = expand_env(cfg.api.api_key);

        const auto& planner = section_or_empty(root, "planner");
        read_key(planner, "enabled", cfg.planner.enabled);
        read_key(planner, "max_attempts", cfg.planner.max_attempts);
        read_key(planner, "retry_base_ms", cfg.planner.retry_base_ms);
        read_key(planner, "failure_cooldown_ms", cfg.planner.failure_cooldown_ms);
        read_key(planner, "max_cooldown_ms", cfg.planner.max_cooldown_ms);

        const auto& runtime = section_or_empty(root, "runtime");
        read_key(runtime, "tick_interval_ms", cfg.runtime.tick_interval_ms);
        read_key(runtime, "intent_ttl_ms", cfg.runtime.intent_ttl_ms);
        read_key(runtime, "dry_run", cfg.runtime.dry_run);
        read_key(runtime, "observe_only", cfg.runtime.observe_only);
        read_key(runtime, "seed", cfg.runtime.seed);

        const auto& instinct = section_or_empty(root, "instinct");
        read_key(instinct, "hesitate_idle_prob", cfg.instinct.hesitate_idle_prob);
        read_key(instinct, "hesitate_pause_prob", cfg.instinct.hesitate_pause_prob);
        read_key(instinct, "look_jitter_min_deg", cfg.instinct.look_jitter_min_deg);
        read_key(instinct, "look_jitter_max_deg", cfg.instinct.look_jitter_max_deg);
        read_key(instinct, "look_overshoot_prob", cfg.instinct.look_overshoot_prob);
        read_key(instinct, "small_step_move_prob", cfg.instinct.small_step_move_prob);

        const auto& gate = section_or_empty(root, "gate");
        read_key(gate, "scene_change_threshold", cfg.gate.scene_change_threshold);
        read_key(gate, "heard_latch_ms", cfg.gate.heard_latch_ms);

        const auto& osc = section_or_empty(root, "osc");
        read_key(osc, "host", cfg.osc.host);
        int port = cfg.osc.port;
        read_key(osc, "port", port);
        if (port <= 0 || port > 65535) {
            return config_error("osc.port out of range: " + std::to_string(port),
                                "invalid_config_value", "Use a UDP port between 1 and 65535.");
        }
        cfg.osc.port = static_cast<std::uint16_t>(port);

        read_path(section_or_empty(root, "perception"), "observation_file",
                  cfg.perception.observation_file);

        const auto& memory = section_or_empty(root, "memory");
        read_key(memory, "enabled", cfg.memory.enabled);
        read_path(memory, "file_path", cfg.memory.file_path);
        read_key(memory, "max_records", cfg.memory.max_records);
        read_key(memory, "retrieve_top_k", cfg.memory.retrieve_top_k);

        read_path(section_or_empty(root, "session"), "journal_dir", cfg.session.journal_dir);
    } catch (const json::exception& e) {
        return config_error(std::string("Config value has the wrong type: ") + e.what(),
                            "invalid_config_type");
    }

    return validate_config(std::move(cfg));
}

errors::Result<AgentConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return config_error("Config file not found: " + path.string(), "config_missing",
                            "Copy config/agent.example.json to " + path.string() + ".");
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return config_error("Unable to open config file: " + path.string(),
                            "config_open_failed");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

std::optional<Preset> preset_from_string(const std::string& name) {
    if (name == "quiet") {
        return Preset::Quiet;
    }
    if (name == "active") {
        return Preset::Active;
    }
    return std::nullopt;
}

std::string to_string(const Preset preset) {
    switch (preset) {
        case Preset::Quiet:
            return "quiet";
        case Preset::Active:
            return "active";
        default:
            return "unknown";
    }
}

void apply_preset(AgentConfig& config, const Preset preset) {
    switch (preset) {
        case Preset::Quiet:
            config.runtime.tick_interval_ms = 500;
            config.runtime.intent_ttl_ms = 3400;
            config.instinct.hesitate_idle_prob = 0.28;
            config.instinct.hesitate_pause_prob = 0.34;
            config.instinct.look_jitter_min_deg = 0.8;
            config.instinct.look_jitter_max_deg = 2.0;
            config.instinct.look_overshoot_prob = 0.08;
            config.instinct.small_step_move_prob = 0.14;
            break;
        case Preset::Active:
            config.runtime.tick_interval_ms = 250;
            config.runtime.intent_ttl_ms = 2400;
            config.instinct.hesitate_idle_prob = 0.10;
            config.instinct.hesitate_pause_prob = 0.18;
            config.instinct.look_jitter_min_deg = 1.2;
            config.instinct.look_jitter_max_deg = 3.4;
            config.instinct.look_overshoot_prob = 0.28;
            config.instinct.small_step_move_prob = 0.26;
            break;
    }
}

errors::Result<AgentConfig> validate_config(AgentConfig config) {
    if (config.planner.enabled && config.api.api_key.empty()) {
        return config_error("Missing API key.", "missing_api_key",
                            "Set api.api_key (\"${VRC_AGENT_API_KEY}\" is expanded) or "
                            "disable the planner with planner.enabled=false.");
    }
    if (config.planner.enabled && config.api.base_url.empty()) {
        return config_error("api.base_url cannot be empty.", "invalid_config_value");
    }
    if (config.api.timeout_ms == 0) {
        return config_error("api.timeout_ms must be positive.", "invalid_config_value");
    }
    if (config.planner.max_attempts == 0 || config.planner.max_attempts > 10) {
        return config_error("planner.max_attempts out of bounds.", "invalid_config_value",
                            "Must be between 1 and 10.");
    }
    if (config.runtime.tick_interval_ms < 20) {
        return config_error("runtime.tick_interval_ms must be at least 20.",
                            "invalid_config_value");
    }
    if (config.runtime.intent_ttl_ms < 1000) {
        return config_error("runtime.intent_ttl_ms must be at least 1000.",
                            "invalid_config_value");
    }

    const auto& inst = config.instinct;
    if (!in_unit_range(inst.hesitate_idle_prob) || !in_unit_range(inst.hesitate_pause_prob) ||
        !in_unit_range(inst.look_overshoot_prob) || !in_unit_range(inst.small_step_move_prob)) {
        return config_error("instinct probabilities must be within [0, 1].",
                            "invalid_config_value");
    }
    if (inst.look_jitter_min_deg <= 0.0 || inst.look_jitter_min_deg > inst.look_jitter_max_deg) {
        return config_error("instinct.look_jitter_min_deg must be positive and <= max.",
                            "invalid_config_value");
    }
    if (!in_unit_range(config.gate.scene_change_threshold)) {
        return config_error("gate.scene_change_threshold must be within [0, 1].",
                            "invalid_config_value");
    }
    if (config.osc.host.empty()) {
        return config_error("osc.host cannot be empty.", "invalid_config_value");
    }
    if (config.memory.enabled && config.memory.retrieve_top_k == 0) {
        return config_error("memory.retrieve_top_k must be positive.", "invalid_config_value");
    }
    return config;
}

}  // namespace vrc::core::config
