#pragma once

#include <filesystem>
#include <mutex>

#include "core/contracts/ITransferRecordStore.h"

namespace chainshuttle {
namespace core {

// One "<key>.json" document per record under a directory. Writes go to a
// temp file and are renamed over the record, so a reader never sees a torn
// document. CAS is serialised by an in-process mutex: one store instance per
// directory.
class TransferRecordStoreJson : public ITransferRecordStore {
public:
    explicit TransferRecordStoreJson(std::filesystem::path directory);

    TransferRecord create(const TransferRequest& request, long long now_ms) override;
    std::optional<TransferRecord> get(const std::string& key) const override;
    CasResult compareAndSwap(
        const std::string& key,
        std::uint64_t expected_version,
        const TransferRecord& new_record
    ) override;
    std::vector<TransferRecord> list() const override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path pathFor(const std::string& key) const;
    std::optional<TransferRecord> load(const std::filesystem::path& path) const;
    void save(const TransferRecord& record) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace chainshuttle
