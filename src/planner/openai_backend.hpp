#pragma once

#include <optional>
#include <string>
#include "core/clock/clock.hpp"
#include "core/config/agent_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "planner/planner_backend.hpp"

namespace vrc::planner {

// OpenAI-compatible chat completion endpoint (SiliconFlow, OpenAI, a local
// gateway). One POST per attempt; retries belong to PlannerClient.
class OpenAiPlannerBackend final : public PlannerBackend {
public:
    explicit OpenAiPlannerBackend(core::config::ApiConfig config);

    core::errors::Result<protocol::Intent> plan(const PlanRequest& request,
                                                const CancelToken& cancel) override;

    std::string name() const override { return "openai:" + config_.model; }

    // GET {base_url}/models with the configured key. Returns the HTTP status,
    // or an error when the endpoint could not be reached within `timeout`.
    core::errors::Result<long> models_status(core::clock::Duration timeout) const;

    std::string models_url() const;

private:
    core::errors::Result<std::string> complete(const std::string& system_prompt,
                                               const std::string& user_message,
                                               const CancelToken& cancel) const;

    core::config::ApiConfig config_;
};

// Maps an HTTP status from the provider to an error, or nullopt for 2xx.
std::optional<core::errors::AgentError> classify_http_status(long status,
                                                             const std::string& body);

}  // namespace vrc::planner
