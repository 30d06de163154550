#include "perception/observation_source.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace vrc::perception {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string text_field(const json& payload, const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

FileObservationSource::FileObservationSource(std::filesystem::path snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {}

core::errors::Result<std::optional<protocol::Observation>> FileObservationSource::poll(
    const core::clock::TimePoint now) {
    std::error_code ec;
    const auto write_time = std::filesystem::last_write_time(snapshot_path_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Capture,
                          "Observation snapshot unavailable: " + snapshot_path_.string(),
                          "observation_missing",
                          "Start the capture process or fix perception.observation_file."};
    }
    if (last_write_.has_value() && last_write_.value() == write_time) {
        return std::optional<protocol::Observation>{};
    }

    std::ifstream in(snapshot_path_);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Capture,
                          "Unable to open observation snapshot: " + snapshot_path_.string(),
                          "observation_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    json payload;
    try {
        payload = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        // Usually a capture process caught mid-write; the next poll retries.
        return AgentError{ErrorCategory::Capture,
                          std::string("Observation snapshot is not valid JSON: ") + e.what(),
                          "observation_parse_failed", "", true};
    }
    if (!payload.is_object()) {
        return AgentError{ErrorCategory::Capture, "Observation snapshot must be an object.",
                          "observation_parse_failed"};
    }

    protocol::Observation observation;
    observation.sequence = next_sequence_++;
    observation.captured_at = now;
    observation.scene = text_field(payload, "scene");
    observation.heard = text_field(payload, "heard");
    last_write_ = write_time;
    return std::optional<protocol::Observation>(std::move(observation));
}

}  // namespace vrc::perception
