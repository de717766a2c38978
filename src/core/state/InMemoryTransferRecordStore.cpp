#include "core/state/InMemoryTransferRecordStore.h"

#include <stdexcept>

#include "common/Logger.h"
#include "core/execution/TransferStateMachine.h"
#include "core/model/TransferSchema.h"

namespace chainshuttle {
namespace core {

TransferRecord InMemoryTransferRecordStore::create(const TransferRequest& request, long long now_ms) {
    const std::string key = deriveIdempotencyKey(request);
    if (!isValidIdempotencyKey(key)) {
        throw std::invalid_argument("invalid idempotency key: " + key);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it != records_.end()) {
        if (!requestsEquivalent(it->second.request, request)) {
            throw ConflictError("idempotency key reused with different request: " + key);
        }
        return it->second;
    }

    TransferRecord record = makeInitialRecord(request, key, now_ms);
    records_.emplace(key, record);
    return record;
}

std::optional<TransferRecord> InMemoryTransferRecordStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

CasResult InMemoryTransferRecordStore::compareAndSwap(
    const std::string& key,
    std::uint64_t expected_version,
    const TransferRecord& new_record
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return CasResult::NOT_FOUND;
    }
    if (it->second.version != expected_version) {
        return CasResult::VERSION_CONFLICT;
    }

    const auto violation = execution::TransferStateMachine::validateUpdate(it->second, new_record);
    if (violation) {
        LOG_WARN("[Store] rejected update of {}: {}", key, *violation);
        return CasResult::REJECTED;
    }

    TransferRecord stored = new_record;
    stored.version = expected_version + 1;
    it->second = std::move(stored);
    return CasResult::OK;
}

std::vector<TransferRecord> InMemoryTransferRecordStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferRecord> out;
    out.reserve(records_.size());
    for (const auto& entry : records_) {
        out.push_back(entry.second);
    }
    return out;
}

} // namespace core
} // namespace chainshuttle
