#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "core/contracts/ILedgerClient.h"

namespace chainshuttle {
namespace execution {

// Exchange wallet-history rows -> ledger operation status.
class ExternalStatusMapper {
public:
    static core::LedgerOperationStatus mapStatus(const std::string& exchange_status);

    // withdraw-list row; observed amount is size minus fee when both are in the coin.
    static core::LedgerStatus fromWithdrawRecord(const nlohmann::json& row, int decimals);

    // deposit-list row; observed amount is the credited size.
    static core::LedgerStatus fromDepositRecord(const nlohmann::json& row, int decimals);
};

} // namespace execution
} // namespace chainshuttle
