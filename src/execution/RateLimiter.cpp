#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace chainshuttle {
namespace execution {

RateLimiter::RateLimiter(const std::map<std::string, int>& groups, int default_per_second) {
    const auto now = std::chrono::steady_clock::now();
    for (const auto& entry : groups) {
        Window window;
        window.max_per_second = std::max(1, entry.second);
        window.started = now;
        windows_.emplace(entry.first, window);
    }
    if (windows_.find("default") == windows_.end()) {
        Window window;
        window.max_per_second = std::max(1, default_per_second);
        window.started = now;
        windows_.emplace("default", window);
    }
}

RateLimiter::Window& RateLimiter::windowFor(const std::string& group) {
    auto it = windows_.find(group);
    if (it == windows_.end()) it = windows_.find("default");
    return it->second;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& window = windowFor(group);
    bool waited = false;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (held_) {
            if (now < hold_until_) {
                waited = true;
                cv_.wait_until(lock, hold_until_);
                continue;
            }
            held_ = false;
        }

        rollIfExpired(window, now);
        if (window.used < window.max_per_second) {
            window.used++;
            if (waited) {
                forced_waits_++;
            }
            return;
        }

        // Next window opens one second after this one started (+1ms slack).
        waited = true;
        cv_.wait_until(lock, window.started + std::chrono::seconds(1) + std::chrono::milliseconds(1));
    }
}

void RateLimiter::handleRateLimitError(long long retry_after_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    const long long hold_ms = retry_after_ms > 0 ? retry_after_ms : 1000;
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(hold_ms);
    if (!held_ || until > hold_until_) {
        hold_until_ = until;
    }
    held_ = true;
    LOG_WARN("[RateLimiter] 429 Too Many Requests, holding all groups for {} ms", hold_ms);
    cv_.notify_all();
}

int RateLimiter::forcedWaits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forced_waits_;
}

void RateLimiter::rollIfExpired(Window& window, std::chrono::steady_clock::time_point now) {
    if (now - window.started >= std::chrono::seconds(1)) {
        window.used = 0;
        window.started = now;
    }
}

} // namespace execution
} // namespace chainshuttle
