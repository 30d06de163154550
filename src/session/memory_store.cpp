#include "session/memory_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace vrc::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kMinRecords = 10;
constexpr double kOverlapWeight = 0.85;
constexpr double kRecencyWeight = 0.15;

json record_to_json(const protocol::MemoryRecord& record) {
    json payload;
    payload["timestamp"] = record.timestamp;
    payload["scene"] = record.scene;
    payload["heard"] = record.heard;
    payload["speak"] = record.speak;
    payload["actions"] = record.actions;
    return payload;
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Decodes one UTF-8 sequence at `pos`; returns its length (1 for invalid bytes).
std::size_t decode_utf8(const std::string& text, const std::size_t pos, std::uint32_t& cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 1;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        length = 4;
    } else {
        cp = 0xFFFD;
        return 1;
    }
    if (pos + length > text.size()) {
        cp = 0xFFFD;
        return 1;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            cp = 0xFFFD;
            return 1;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    return length;
}

bool is_cjk(const std::uint32_t cp) { return cp >= 0x4E00 && cp <= 0x9FFF; }

}  // namespace

MemoryStore::MemoryStore(std::filesystem::path file_path, const std::size_t max_records)
    : path_(std::move(file_path)), max_records_(std::max(kMinRecords, max_records)) {}

std::set<std::string> MemoryStore::tokenize(const std::string& text) {
    std::set<std::string> tokens;
    std::string word;
    std::string cjk;
    std::size_t cjk_chars = 0;

    const auto flush_word = [&]() {
        if (!word.empty()) {
            tokens.insert(word);
            word.clear();
        }
    };
    const auto flush_cjk = [&]() {
        if (!cjk.empty()) {
            tokens.insert(cjk);
            cjk.clear();
            cjk_chars = 0;
        }
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t cp = 0;
        const auto length = decode_utf8(text, pos, cp);
        if (cp < 0x80 && (std::isalnum(static_cast<int>(cp)) != 0 || cp == '_')) {
            flush_cjk();
            word.push_back(static_cast<char>(std::tolower(static_cast<int>(cp))));
        } else if (is_cjk(cp)) {
            flush_word();
            cjk.append(text, pos, length);
            if (++cjk_chars == 3) {
                flush_cjk();
            }
        } else {
            flush_word();
            flush_cjk();
        }
        pos += length;
    }
    flush_word();
    flush_cjk();
    return tokens;
}

double MemoryStore::overlap_score(const std::set<std::string>& query,
                                  const std::set<std::string>& text) {
    if (query.empty() || text.empty()) {
        return 0.0;
    }
    std::size_t shared = 0;
    for (const auto& token : query) {
        if (text.count(token) != 0) {
            ++shared;
        }
    }
    return static_cast<double>(shared) / static_cast<double>(query.size());
}

std::vector<protocol::MemoryRecord> MemoryStore::load_all() const {
    std::vector<protocol::MemoryRecord> records;
    std::ifstream in(path_);
    if (!in.is_open()) {
        return records;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        const auto row = json::parse(line, nullptr, false);
        if (row.is_discarded() || !row.is_object()) {
            continue;
        }
        protocol::MemoryRecord record;
        record.timestamp = string_field(row, "timestamp");
        record.scene = string_field(row, "scene");
        record.heard = string_field(row, "heard");
        record.speak = string_field(row, "speak");
        record.actions = string_field(row, "actions");
        records.push_back(std::move(record));
    }
    return records;
}

core::errors::Result<std::size_t> MemoryStore::append(const protocol::MemoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to create memory directory: " +
                                  path_.parent_path().string(),
                              "memory_dir_create_failed"};
        }
    }

    {
        std::ofstream out(path_, std::ios::app);
        if (!out.is_open()) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to open memory file: " + path_.string(),
                              "memory_open_failed"};
        }
        out << record_to_json(record).dump(-1, ' ', false, json::error_handler_t::replace)
            << "\n";
        if (!out.good()) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to write memory record: " + path_.string(),
                              "memory_write_failed"};
        }
    }
    return truncate_if_needed();
}

core::errors::Result<std::size_t> MemoryStore::truncate_if_needed() {
    const auto records = load_all();
    if (records.size() <= max_records_) {
        return records.size();
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to rewrite memory file: " + path_.string(),
                          "memory_open_failed"};
    }
    for (std::size_t i = records.size() - max_records_; i < records.size(); ++i) {
        out << record_to_json(records[i]).dump(-1, ' ', false, json::error_handler_t::replace)
            << "\n";
    }
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to rewrite memory file: " + path_.string(),
                          "memory_write_failed"};
    }
    return max_records_;
}

std::vector<protocol::MemoryRecord> MemoryStore::retrieve(const std::string& query,
                                                          const std::size_t top_k) const {
    std::vector<protocol::MemoryRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records = load_all();
    }
    if (records.empty()) {
        return {};
    }

    const auto query_tokens = tokenize(query);
    const auto total = static_cast<double>(records.size());

    std::vector<std::pair<double, std::size_t>> scored;
    scored.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        const auto overlap =
            overlap_score(query_tokens, tokenize(r.scene + "\n" + r.heard + "\n" + r.speak));
        const auto recency = static_cast<double>(i + 1) / total;
        scored.emplace_back(overlap * kOverlapWeight + recency * kRecencyWeight, i);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    const auto k = std::max<std::size_t>(1, top_k);
    std::vector<protocol::MemoryRecord> out;
    for (std::size_t i = 0; i < scored.size() && out.size() < k; ++i) {
        if (scored[i].first > 0.0) {
            out.push_back(records[scored[i].second]);
        }
    }
    return out;
}

}  // namespace vrc::session
