#include "attachq/retry_scheduler.hpp"

namespace attachq {

void RetryScheduler::schedule(uint64_t key, TimePoint due) {
    due_[key] = due;
    heap_.emplace(due, key);
}

void RetryScheduler::cancel(uint64_t key) {
    due_.erase(key);
}

void RetryScheduler::drop_stale() {
    while (!heap_.empty()) {
        const auto& [due, key] = heap_.top();
        auto it = due_.find(key);
        if (it != due_.end() && it->second == due) return;
        heap_.pop();
    }
}

std::optional<TimePoint> RetryScheduler::next_due() {
    drop_stale();
    if (heap_.empty()) return std::nullopt;
    return heap_.top().first;
}

std::vector<uint64_t> RetryScheduler::pop_due(TimePoint now) {
    std::vector<uint64_t> keys;
    while (true) {
        drop_stale();
        if (heap_.empty() || heap_.top().first > now) break;
        keys.push_back(heap_.top().second);
        due_.erase(heap_.top().second);
        heap_.pop();
    }
    return keys;
}

void RetryScheduler::clear() {
    heap_ = {};
    due_.clear();
}

}  // namespace attachq
