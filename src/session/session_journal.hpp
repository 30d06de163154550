#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/intent.hpp"

namespace vrc::session {

// Append-only JSONL record of one session, one file per session id.
class SessionJournal {
public:
    SessionJournal(std::filesystem::path journal_dir, std::string session_id);

    core::errors::Result<std::filesystem::path> journal_path() const;

    core::errors::Result<std::filesystem::path> write_session_start(
        const nlohmann::json& settings);

    core::errors::Result<std::filesystem::path> write_plan(const protocol::Intent& intent,
                                                           const std::string& trigger,
                                                           std::uint32_t attempts);

    core::errors::Result<std::filesystem::path> write_plan_failed(
        const core::errors::AgentError& error, std::uint32_t attempts);

    core::errors::Result<std::filesystem::path> write_dispatch_failed(
        std::uint64_t tick_id, const core::errors::AgentError& error);

    core::errors::Result<std::filesystem::path> write_session_end(
        const std::string& reason, const nlohmann::json& stats);

    const std::string& session_id() const { return session_id_; }

private:
    core::errors::Result<std::filesystem::path> append_event(const std::string& event,
                                                             nlohmann::json payload);

    std::filesystem::path journal_dir_;
    std::string session_id_;
    std::mutex mutex_;
};

}  // namespace vrc::session
