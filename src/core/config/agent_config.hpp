#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace vrc::core::config {

struct ApiConfig {
    std::string base_url = "https://api.siliconflow.cn/v1";
    std::string api_key;
    std::string model = "deepseek-ai/DeepSeek-V3.2-Exp";
    std::uint32_t timeout_ms = 30000;
};

struct PlannerConfig {
    bool enabled = true;
    std::uint32_t max_attempts = 3;
    std::uint32_t retry_base_ms = 1200;
    std::uint32_t failure_cooldown_ms = 2000;
    std::uint32_t max_cooldown_ms = 60000;
};

struct RuntimeConfig {
    std::uint32_t tick_interval_ms = 300;
    std::uint32_t intent_ttl_ms = 2800;
    bool dry_run = true;
    bool observe_only = false;
    std::uint32_t seed = 0;  // 0 = seed from std::random_device
};

struct InstinctConfig {
    double hesitate_idle_prob = 0.16;
    double hesitate_pause_prob = 0.24;
    double look_jitter_min_deg = 1.0;
    double look_jitter_max_deg = 3.0;
    double look_overshoot_prob = 0.20;
    double small_step_move_prob = 0.26;
};

struct GateConfig {
    double scene_change_threshold = 0.58;
    std::uint32_t heard_latch_ms = 10000;
};

struct OscConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 9000;
};

struct PerceptionConfig {
    std::filesystem::path observation_file = "data/observation.json";
};

struct MemoryConfig {
    bool enabled = true;
    std::filesystem::path file_path = "data/memory.jsonl";
    std::uint32_t max_records = 1000;
    std::uint32_t retrieve_top_k = 5;
};

struct SessionConfig {
    std::filesystem::path journal_dir = ".vrc_agent_runs";
};

struct AgentConfig {
    ApiConfig api;
    PlannerConfig planner;
    RuntimeConfig runtime;
    InstinctConfig instinct;
    GateConfig gate;
    OscConfig osc;
    PerceptionConfig perception;
    MemoryConfig memory;
    SessionConfig session;
};

enum class Preset {
    Quiet,
    Active
};

// Reads a JSON config file. Missing keys keep their defaults; ${VAR} inside
// api.api_key is expanded from the environment.
errors::Result<AgentConfig> load_config(const std::filesystem::path& path);

errors::Result<AgentConfig> parse_config(const std::string& json_text);

std::optional<Preset> preset_from_string(const std::string& name);

std::string to_string(Preset preset);

// Startup-only override of runtime/instinct values. The file is not touched.
void apply_preset(AgentConfig& config, Preset preset);

errors::Result<AgentConfig> validate_config(AgentConfig config);

std::string expand_env(const std::string& value);

}  // namespace vrc::core::config
