#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/model/TransferTypes.h"

namespace chainshuttle {
namespace core {

// Same idempotency key, different request content.
class ConflictError : public std::runtime_error {
public:
    explicit ConflictError(const std::string& message) : std::runtime_error(message) {}
};

enum class CasResult {
    OK,
    VERSION_CONFLICT,
    NOT_FOUND,
    REJECTED        // stored record is terminal, or the write breaks a record invariant
};

inline const char* casResultToString(CasResult result) {
    switch (result) {
        case CasResult::OK: return "OK";
        case CasResult::VERSION_CONFLICT: return "VERSION_CONFLICT";
        case CasResult::NOT_FOUND: return "NOT_FOUND";
        case CasResult::REJECTED: return "REJECTED";
    }
    return "OK";
}

// Durable keyed storage of transfer records. Every mutation is a
// compare-and-swap on the record version, so at most one writer wins
// per version.
class ITransferRecordStore {
public:
    virtual ~ITransferRecordStore() = default;

    // Returns the existing record when the key is already present and the
    // request is equivalent; throws ConflictError when it is not.
    virtual TransferRecord create(const TransferRequest& request, long long now_ms) = 0;

    virtual std::optional<TransferRecord> get(const std::string& key) const = 0;

    // On OK the stored record is new_record with version expected_version + 1.
    virtual CasResult compareAndSwap(
        const std::string& key,
        std::uint64_t expected_version,
        const TransferRecord& new_record
    ) = 0;

    virtual std::vector<TransferRecord> list() const = 0;
};

} // namespace core
} // namespace chainshuttle
