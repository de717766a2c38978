#pragma once

#include <condition_variable>
#include <map>
#include <mutex>

#include "common/Types.h"

namespace chainshuttle {
namespace core {

// Caps concurrent external calls per leaf system. Shared by every budgeted
// client of one runner; a call waits on the condition variable for a free
// slot. A service with no limit (or a limit <= 0) is counted but never waits.
class ServiceBudget {
public:
    explicit ServiceBudget(std::map<ServiceKind, int> limits);

    ServiceBudget(const ServiceBudget&) = delete;
    ServiceBudget& operator=(const ServiceBudget&) = delete;

    void acquire(ServiceKind service);
    void release(ServiceKind service);

    // Holds one slot for the lifetime of the guard.
    class Slot {
    public:
        Slot(ServiceBudget& budget, ServiceKind service) : budget_(budget), service_(service) {
            budget_.acquire(service_);
        }
        ~Slot() { budget_.release(service_); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        ServiceBudget& budget_;
        ServiceKind service_;
    };

    int inFlight(ServiceKind service) const;
    std::map<ServiceKind, int> peakInFlight() const;

    // Calls that had to wait for a slot.
    int forcedWaits() const;

private:
    int limitFor(ServiceKind service) const;

    std::map<ServiceKind, int> limits_;
    std::map<ServiceKind, int> in_flight_;
    std::map<ServiceKind, int> peak_;
    int forced_waits_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace core
} // namespace chainshuttle
