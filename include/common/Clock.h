#pragma once

#include <chrono>

namespace chainshuttle {

// Wall-clock source for deadlines, wait timeouts and backoff scheduling.
class IClock {
public:
    virtual ~IClock() = default;
    virtual long long nowMs() const = 0;
};

class SystemClock : public IClock {
public:
    long long nowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
};

} // namespace chainshuttle
