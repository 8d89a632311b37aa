#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace attachq {

/// Backoff parameters for upload attempts.
/// Defaults: 2s base, 60s cap, +/-1s jitter, 3 attempts.
struct RetryConfig {
    std::chrono::milliseconds base_delay{2000};
    std::chrono::milliseconds max_delay{60000};
    std::chrono::milliseconds jitter{1000};
    uint32_t max_attempts = 3;
};

/// Capped exponential delay without jitter: min(base * 2^(attempt-1), max).
/// attempt is 1-based; 0 is treated as 1.
std::chrono::milliseconds backoff_delay(uint32_t attempt, const RetryConfig& config);

/// Backoff with jitter applied. jitter_sample is in [-1.0, 1.0] and scales
/// config.jitter; the result is floored at zero.
std::chrono::milliseconds backoff_delay(uint32_t attempt, const RetryConfig& config,
                                        double jitter_sample);

/// Draws jitter samples for backoff_delay(). Thread-safe.
class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config);

    const RetryConfig& config() const { return config_; }

    std::chrono::milliseconds next_delay(uint32_t attempt);

    /// True while another attempt is allowed after `attempt` failed.
    bool should_retry(uint32_t attempt) const { return attempt < config_.max_attempts; }

private:
    RetryConfig config_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> dist_{-1.0, 1.0};
};

}  // namespace attachq
