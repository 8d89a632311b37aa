#pragma once

#include "attachq/queue_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>
#include <utility>
#include <vector>

namespace attachq {

/// Due-time queue for retry wake-ups.
///
/// Entries are keyed by queue item sequence. Rescheduling or cancelling a key
/// leaves its old heap entry behind; stale entries are dropped lazily when they
/// reach the top. Not thread-safe: the owning service serializes access.
class RetryScheduler {
public:
    /// Schedule (or reschedule) a wake-up for `key` at `due`.
    void schedule(uint64_t key, TimePoint due);

    /// Forget `key`. No-op if it is not scheduled.
    void cancel(uint64_t key);

    /// Earliest pending due time, if any.
    std::optional<TimePoint> next_due();

    /// Remove and return all keys due at or before `now`, earliest first.
    std::vector<uint64_t> pop_due(TimePoint now);

    bool contains(uint64_t key) const { return due_.count(key) > 0; }
    size_t size() const { return due_.size(); }
    bool empty() const { return due_.empty(); }
    void clear();

private:
    using Entry = std::pair<TimePoint, uint64_t>;

    void drop_stale();

    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap_;
    std::unordered_map<uint64_t, TimePoint> due_;
};

}  // namespace attachq
