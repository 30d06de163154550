#include "dispatch/override_channel.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace vrc::dispatch {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string single_line(const std::string& value) {
    std::string out = value;
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    return trim(out);
}

// Vision descriptions arrive as markdown; keep only the words.
std::string strip_markup(std::string text) {
    static const char* kNoise[] = {"###", "---", "**", "##", "`"};
    for (const char* token : kNoise) {
        const std::string needle(token);
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos)) {
            text.replace(pos, needle.size(), " ");
        }
    }
    std::string collapsed;
    bool in_space = false;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            in_space = true;
            continue;
        }
        if (in_space && !collapsed.empty()) {
            collapsed.push_back(' ');
        }
        in_space = false;
        collapsed.push_back(c);
    }
    return collapsed;
}

std::string prefix_utf8(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    while (max_bytes > 0 && (static_cast<unsigned char>(text[max_bytes]) & 0xC0) == 0x80) {
        --max_bytes;
    }
    return text.substr(0, max_bytes);
}

}  // namespace

OverrideChannel::OverrideChannel(const std::size_t capacity) : capacity_(capacity) {}

bool OverrideChannel::push(OverrideEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (event.kind == OverrideKind::Stop) {
        stop_requested_ = true;
        pending_.push_back(std::move(event));
        return true;
    }
    if (pending_.size() >= capacity_) {
        return false;
    }
    pending_.push_back(std::move(event));
    return true;
}

std::vector<OverrideEvent> OverrideChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OverrideEvent> out(pending_.begin(), pending_.end());
    pending_.clear();
    return out;
}

bool OverrideChannel::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
}

std::optional<OverrideEvent> parse_override_command(const std::string& line) {
    const std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const auto space = trimmed.find(' ');
    std::string verb = trimmed.substr(0, space);
    std::transform(verb.begin(), verb.end(), verb.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (verb == "stop" || verb == "quit") {
        return OverrideEvent{OverrideKind::Stop, ""};
    }
    if (verb == "say") {
        const std::string text = space == std::string::npos ? "" : trim(trimmed.substr(space));
        return OverrideEvent{OverrideKind::Say, text};
    }
    return std::nullopt;
}

std::string build_utterance(const protocol::Observation& observation) {
    if (observation.has_heard()) {
        return "I heard: " + prefix_utf8(single_line(observation.heard), 66) + " - I'm here.";
    }
    const std::string scene = strip_markup(single_line(observation.scene));
    if (scene.empty()) {
        return "";
    }
    return "Hanging out here, looking at " + prefix_utf8(scene, 78) + ".";
}

}  // namespace vrc::dispatch
