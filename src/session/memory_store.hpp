#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/memory_record.hpp"

namespace vrc::session {

// Long-term memory as a JSONL file. Retrieval is keyword overlap plus a small
// recency bonus; no embeddings.
class MemoryStore {
public:
    explicit MemoryStore(std::filesystem::path file_path, std::size_t max_records = 1000);

    core::errors::Result<std::size_t> append(const protocol::MemoryRecord& record);

    // Top-k records for the query, best first. Unreadable lines are skipped.
    std::vector<protocol::MemoryRecord> retrieve(const std::string& query,
                                                 std::size_t top_k = 5) const;

    std::vector<protocol::MemoryRecord> load_all() const;

    const std::filesystem::path& path() const { return path_; }

    // Lowercased [a-z0-9_]+ words and CJK runs of up to three characters.
    static std::set<std::string> tokenize(const std::string& text);

    static double overlap_score(const std::set<std::string>& query,
                                const std::set<std::string>& text);

private:
    core::errors::Result<std::size_t> truncate_if_needed();

    std::filesystem::path path_;
    std::size_t max_records_;
    mutable std::mutex mutex_;
};

}  // namespace vrc::session
