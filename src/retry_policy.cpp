#include "attachq/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace attachq {

std::chrono::milliseconds backoff_delay(uint32_t attempt, const RetryConfig& config) {
    if (attempt == 0) attempt = 1;

    // Cap the shift before it overflows; anything past 2^30 is beyond max_delay anyway
    uint32_t shift = std::min<uint32_t>(attempt - 1, 30);
    double exponential = static_cast<double>(config.base_delay.count()) *
                         static_cast<double>(uint64_t{1} << shift);
    double capped = std::min(exponential, static_cast<double>(config.max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

std::chrono::milliseconds backoff_delay(uint32_t attempt, const RetryConfig& config,
                                        double jitter_sample) {
    jitter_sample = std::clamp(jitter_sample, -1.0, 1.0);
    double base = static_cast<double>(backoff_delay(attempt, config).count());
    double jitter = jitter_sample * static_cast<double>(config.jitter.count());
    double delay = std::max(0.0, base + jitter);
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

RetryPolicy::RetryPolicy(const RetryConfig& config)
    : config_(config), rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryPolicy::next_delay(uint32_t attempt) {
    double sample = 0.0;
    if (config_.jitter.count() > 0) {
        std::lock_guard lock(rng_mutex_);
        sample = dist_(rng_);
    }
    return backoff_delay(attempt, config_, sample);
}

}  // namespace attachq
