#pragma once

#include <mutex>
#include <random>

#include "execution/ExternalCallError.h"

namespace chainshuttle {
namespace execution {

struct RetryConfig {
    long long base_delay_ms = 1000;
    double multiplier = 2.0;
    long long max_delay_ms = 60000;
    int max_attempts = 5;           // per stage-state
    double jitter_fraction = 0.1;   // delay is scaled by (1 +/- jitter_fraction)
};

struct RetryDecision {
    bool retry = false;
    long long delay_ms = 0;
};

// Exponential backoff shared by every external call the orchestrator makes.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config, unsigned int seed = std::random_device{}());

    // attempt is 1-based: the number of failures already seen at this state.
    RetryDecision decide(ErrorClass error_class, int attempt, long long retry_after_ms = 0);

    // jitter_sample in [-1, 1]; 0 gives the undisturbed exponential delay.
    long long backoffDelayMs(int attempt, double jitter_sample) const;

    const RetryConfig& config() const { return config_; }

private:
    double nextJitterSample();

    RetryConfig config_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace execution
} // namespace chainshuttle
