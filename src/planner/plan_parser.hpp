#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "planner/planner_backend.hpp"
#include "protocol/intent.hpp"

namespace vrc::planner {

// Model text -> normalized Intent. Accepts strict JSON or the first {...}
// block embedded in prose.
core::errors::Result<protocol::Intent> parse_plan(const std::string& text);

// Compact state sent as the user message of a planning call.
nlohmann::json build_planner_payload(const PlanRequest& request);

extern const char* const kIntentSystemPrompt;

}  // namespace vrc::planner
