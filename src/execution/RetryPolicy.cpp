#include "execution/RetryPolicy.h"

#include <algorithm>
#include <cmath>

namespace chainshuttle {
namespace execution {

RetryPolicy::RetryPolicy(RetryConfig config, unsigned int seed)
    : config_(config)
    , rng_(seed)
{
    config_.base_delay_ms = std::max(0LL, config_.base_delay_ms);
    config_.max_delay_ms = std::max(config_.base_delay_ms, config_.max_delay_ms);
    config_.multiplier = std::max(1.0, config_.multiplier);
    config_.max_attempts = std::max(1, config_.max_attempts);
    config_.jitter_fraction = std::clamp(config_.jitter_fraction, 0.0, 1.0);
}

RetryDecision RetryPolicy::decide(ErrorClass error_class, int attempt, long long retry_after_ms) {
    RetryDecision decision;
    if (error_class == ErrorClass::PERMANENT) {
        return decision;
    }
    if (attempt >= config_.max_attempts) {
        return decision;
    }

    decision.retry = true;
    if (error_class == ErrorClass::RATE_LIMITED && retry_after_ms > 0) {
        decision.delay_ms = std::min(retry_after_ms, config_.max_delay_ms);
        return decision;
    }

    const double jitter = config_.jitter_fraction > 0.0 ? nextJitterSample() : 0.0;
    decision.delay_ms = backoffDelayMs(attempt, jitter);
    return decision;
}

long long RetryPolicy::backoffDelayMs(int attempt, double jitter_sample) const {
    const int exponent = std::max(0, attempt - 1);
    double delay = static_cast<double>(config_.base_delay_ms) * std::pow(config_.multiplier, exponent);
    delay = std::min(delay, static_cast<double>(config_.max_delay_ms));

    const double sample = std::clamp(jitter_sample, -1.0, 1.0);
    delay *= 1.0 + sample * config_.jitter_fraction;
    return std::max(0LL, static_cast<long long>(std::llround(delay)));
}

double RetryPolicy::nextJitterSample() {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return dist(rng_);
}

} // namespace execution
} // namespace chainshuttle
