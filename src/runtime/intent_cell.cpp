#include "runtime/intent_cell.hpp"

#include <utility>

namespace vrc::runtime {

std::uint64_t IntentCell::replace(protocol::Intent intent) {
    std::lock_guard<std::mutex> lock(mutex_);
    intent.generation = next_generation_++;
    const std::uint64_t generation = intent.generation;
    current_ = std::make_shared<const protocol::Intent>(std::move(intent));
    return generation;
}

IntentCell::Snapshot IntentCell::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

IntentCell::Snapshot IntentCell::load_fresh(const core::clock::TimePoint now) const {
    Snapshot snapshot = load();
    if (snapshot && snapshot->is_stale(now)) {
        return nullptr;
    }
    return snapshot;
}

void IntentCell::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
}

std::uint64_t IntentCell::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ ? current_->generation : 0;
}

}  // namespace vrc::runtime
