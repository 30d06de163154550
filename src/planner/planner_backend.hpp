#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/intent.hpp"
#include "protocol/memory_record.hpp"
#include "protocol/observation.hpp"

namespace vrc::planner {

using CancelToken = std::shared_ptr<std::atomic_bool>;

struct PlanRequest {
    protocol::Observation observation;
    std::shared_ptr<const protocol::Intent> current_intent;  // may be null
    std::vector<protocol::MemoryRecord> short_term;
    std::vector<protocol::MemoryRecord> long_term;  // filled by the client from memory_query
    std::string memory_query;
};

// One planner round trip. Implementations fill goal/levels/steps only; the
// client stamps generation, creation time and TTL.
class PlannerBackend {
public:
    virtual ~PlannerBackend() = default;
    virtual core::errors::Result<protocol::Intent> plan(const PlanRequest& request,
                                                        const CancelToken& cancel) = 0;
    virtual std::string name() const = 0;
};

}  // namespace vrc::planner
