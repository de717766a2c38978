#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

namespace chainshuttle {
namespace core {

enum class JournalEventType {
    TRANSFER_ADMITTED,
    STATE_CHANGED,
    EXTERNAL_SUBMITTED,
    RETRY_SCHEDULED,
    TRANSFER_CANCELLED,
    TRANSFER_SETTLED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::STATE_CHANGED;
    std::string transfer_key;
    std::string state;
    nlohmann::json payload;
};

class ITransferJournal {
public:
    virtual ~ITransferJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace chainshuttle
