#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace chainshuttle {
namespace execution {

// Requests-per-second limiter shared by the calls of one leaf system
// (exchange, node, aggregator). Each endpoint group owns a one-second window;
// unknown groups fall back to "default".
class RateLimiter {
public:
    explicit RateLimiter(const std::map<std::string, int>& groups = {}, int default_per_second = 10);

    // Blocks on the condition variable until the group has a free slot and
    // no 429 hold is active.
    void acquire(const std::string& group);

    // 429 from the server: every group is held until the hint (or 1s) elapses.
    // Does not sleep; waiters in acquire() wake at the end of the hold.
    void handleRateLimitError(long long retry_after_ms = 0);

    // Times acquire() had to wait, for logs and tests.
    int forcedWaits() const;

private:
    struct Window {
        int max_per_second = 1;
        int used = 0;
        std::chrono::steady_clock::time_point started;
    };

    Window& windowFor(const std::string& group);
    void rollIfExpired(Window& window, std::chrono::steady_clock::time_point now);

    std::map<std::string, Window> windows_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int forced_waits_ = 0;
    bool held_ = false;
    std::chrono::steady_clock::time_point hold_until_;
};

} // namespace execution
} // namespace chainshuttle
