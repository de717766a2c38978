#pragma once

#include <map>
#include <mutex>

#include "core/contracts/ITransferRecordStore.h"

namespace chainshuttle {
namespace core {

class InMemoryTransferRecordStore : public ITransferRecordStore {
public:
    TransferRecord create(const TransferRequest& request, long long now_ms) override;
    std::optional<TransferRecord> get(const std::string& key) const override;
    CasResult compareAndSwap(
        const std::string& key,
        std::uint64_t expected_version,
        const TransferRecord& new_record
    ) override;
    std::vector<TransferRecord> list() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, TransferRecord> records_;
};

} // namespace core
} // namespace chainshuttle
