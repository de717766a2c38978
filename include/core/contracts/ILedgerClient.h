#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace chainshuttle {
namespace core {

enum class LedgerOperationStatus {
    PENDING,
    SUCCESS,
    FAILED
};

struct LedgerStatus {
    LedgerOperationStatus status = LedgerOperationStatus::PENDING;
    std::string external_id;
    Amount observed_amount = 0;   // net amount that left or reached the account
    std::string chain_tx_hash;
    std::string detail;
};

// Custodial exchange account. Errors surface as execution::ExternalCallError.
class ILedgerClient {
public:
    virtual ~ILedgerClient() = default;

    // Idempotent on client_id; returns the exchange withdrawal id.
    virtual std::string withdraw(
        const AssetInfo& asset,
        const std::string& chain,
        const Amount& amount,
        const std::string& destination_address,
        const std::string& client_id
    ) = 0;

    // Locates a withdrawal issued with client_id whose id was never recorded.
    virtual std::optional<LedgerStatus> findWithdrawal(const std::string& client_id) = 0;

    // Stable per asset and chain.
    virtual std::string depositAddressFor(const AssetInfo& asset, const std::string& chain) = 0;

    virtual LedgerStatus statusOf(const std::string& withdrawal_id) = 0;

    // Credit for an on-chain deposit, matched by transaction hash.
    virtual LedgerStatus depositStatusOf(const AssetInfo& asset, const std::string& tx_hash) = 0;
};

} // namespace core
} // namespace chainshuttle
