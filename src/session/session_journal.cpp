#include "session/session_journal.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include "protocol/action_contract.hpp"

namespace vrc::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json error_to_json(const AgentError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    payload["retryable"] = error.retryable;
    return payload;
}

}  // namespace

SessionJournal::SessionJournal(std::filesystem::path journal_dir, std::string session_id)
    : journal_dir_(std::move(journal_dir)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> SessionJournal::journal_path() const {
    if (session_id_.empty()) {
        return AgentError{ErrorCategory::Input, "Session ID cannot be empty.",
                          "invalid_session_id"};
    }
    if (journal_dir_.empty()) {
        return AgentError{ErrorCategory::Config, "Journal directory is not set.",
                          "invalid_journal_dir", "Set session.journal_dir in the config."};
    }

    std::error_code ec;
    std::filesystem::create_directories(journal_dir_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create journal directory: " + journal_dir_.string(),
                          "journal_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(journal_dir_, ec) || ec) {
        return AgentError{ErrorCategory::Config,
                          "Journal path is not a directory: " + journal_dir_.string(),
                          "invalid_journal_dir"};
    }

    return journal_dir_ / (session_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> SessionJournal::append_event(
    const std::string& event, json payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    json line;
    line["ts_unix_ms"] = now_unix_ms();
    line["event"] = event;
    line["session_id"] = session_id_;
    line["payload"] = std::move(payload);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open journal file: " + path.string(),
                          "journal_open_failed"};
    }

    out << line.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write journal event: " + path.string(),
                          "journal_write_failed"};
    }

    return path;
}

core::errors::Result<std::filesystem::path> SessionJournal::write_session_start(
    const json& settings) {
    return append_event("session_start", settings);
}

core::errors::Result<std::filesystem::path> SessionJournal::write_plan(
    const protocol::Intent& intent, const std::string& trigger, const std::uint32_t attempts) {
    json payload;
    payload["generation"] = intent.generation;
    payload["trigger"] = trigger;
    payload["goal"] = intent.goal;
    payload["activity_level"] = intent.activity_level;
    payload["curiosity"] = intent.curiosity;
    payload["allow_move"] = intent.allow_move;
    payload["speak"] = intent.speak;
    payload["steps"] = protocol::signature(intent.steps);
    payload["attempts"] = attempts;
    return append_event("plan", std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_plan_failed(
    const AgentError& error, const std::uint32_t attempts) {
    json payload = error_to_json(error);
    payload["attempts"] = attempts;
    return append_event("plan_failed", std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_dispatch_failed(
    const std::uint64_t tick_id, const AgentError& error) {
    json payload = error_to_json(error);
    payload["tick_id"] = tick_id;
    return append_event("dispatch_failed", std::move(payload));
}

core::errors::Result<std::filesystem::path> SessionJournal::write_session_end(
    const std::string& reason, const json& stats) {
    json payload;
    payload["reason"] = reason;
    payload["stats"] = stats;
    return append_event("session_end", std::move(payload));
}

}  // namespace vrc::session
