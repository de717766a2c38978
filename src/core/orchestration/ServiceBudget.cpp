#include "core/orchestration/ServiceBudget.h"

#include <algorithm>
#include <utility>

#include "common/Logger.h"

namespace chainshuttle {
namespace core {

ServiceBudget::ServiceBudget(std::map<ServiceKind, int> limits)
    : limits_(std::move(limits))
{
}

int ServiceBudget::limitFor(ServiceKind service) const {
    const auto it = limits_.find(service);
    if (service == ServiceKind::NONE || it == limits_.end()) {
        return 0;
    }
    return it->second;
}

void ServiceBudget::acquire(ServiceKind service) {
    std::unique_lock<std::mutex> lock(mutex_);
    const int limit = limitFor(service);
    int& used = in_flight_[service];

    if (limit > 0 && used >= limit) {
        ++forced_waits_;
        LOG_DEBUG("[Budget] {} full ({} in flight), waiting", serviceKindToString(service), used);
        cv_.wait(lock, [&used, limit]() { return used < limit; });
    }

    used += 1;
    peak_[service] = std::max(peak_[service], used);
}

void ServiceBudget::release(ServiceKind service) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(service);
        if (it == in_flight_.end() || it->second == 0) {
            LOG_WARN("[Budget] release of {} without a matching acquire", serviceKindToString(service));
            return;
        }
        it->second -= 1;
    }
    cv_.notify_all();
}

int ServiceBudget::inFlight(ServiceKind service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = in_flight_.find(service);
    return it == in_flight_.end() ? 0 : it->second;
}

std::map<ServiceKind, int> ServiceBudget::peakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

int ServiceBudget::forcedWaits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forced_waits_;
}

} // namespace core
} // namespace chainshuttle
