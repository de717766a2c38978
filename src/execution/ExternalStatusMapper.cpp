#include "execution/ExternalStatusMapper.h"

#include <algorithm>
#include <cctype>

#include "common/AmountFormat.h"
#include "execution/ExternalCallError.h"

namespace chainshuttle {
namespace execution {

namespace {
std::string normalizeStatus(std::string status) {
    std::transform(status.begin(), status.end(), status.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return status;
}

// Exchange JSON carries amounts either as strings or as numbers.
std::string amountText(const nlohmann::json& row, const char* key) {
    if (!row.contains(key) || row[key].is_null()) {
        return "0";
    }
    if (row[key].is_string()) {
        return row[key].get<std::string>();
    }
    return row[key].dump();
}

Amount parseAmountField(const nlohmann::json& row, const char* key, int decimals) {
    std::string text = amountText(row, key);
    if (!text.empty() && text[0] == '-') {
        // Fees are sometimes reported as debits.
        text.erase(0, 1);
    }
    const auto parsed = common::parseUnits(text, decimals);
    if (!parsed) {
        throw ExternalCallError(ErrorClass::TRANSIENT,
                                std::string("unparseable ") + key + " in exchange record: " + text);
    }
    return *parsed;
}

std::string stringField(const nlohmann::json& row, const char* key) {
    if (!row.contains(key) || row[key].is_null()) {
        return "";
    }
    return row[key].is_string() ? row[key].get<std::string>() : row[key].dump();
}
} // namespace

core::LedgerOperationStatus ExternalStatusMapper::mapStatus(const std::string& exchange_status) {
    const std::string normalized = normalizeStatus(exchange_status);

    if (normalized == "success" || normalized == "successful" ||
        normalized == "done" || normalized == "completed") {
        return core::LedgerOperationStatus::SUCCESS;
    }

    if (normalized == "fail" || normalized == "failed" ||
        normalized == "reject" || normalized == "rejected" ||
        normalized == "cancel" || normalized == "cancelled") {
        return core::LedgerOperationStatus::FAILED;
    }

    // "pending", "wallet_processing", "confirming", unknown values
    return core::LedgerOperationStatus::PENDING;
}

core::LedgerStatus ExternalStatusMapper::fromWithdrawRecord(const nlohmann::json& row, int decimals) {
    core::LedgerStatus result;
    result.status = mapStatus(stringField(row, "status"));
    result.external_id = stringField(row, "orderId");
    result.chain_tx_hash = stringField(row, "tradeId");
    result.detail = stringField(row, "status");

    if (result.status == core::LedgerOperationStatus::SUCCESS) {
        const Amount size = parseAmountField(row, "size", decimals);
        const Amount fee = parseAmountField(row, "fee", decimals);
        if (fee >= size) {
            throw ExternalCallError(ErrorClass::PERMANENT,
                                    "withdrawal " + result.external_id + " fee " + stringField(row, "fee") +
                                    " leaves nothing of size " + stringField(row, "size"));
        }
        result.observed_amount = size - fee;
    }
    return result;
}

core::LedgerStatus ExternalStatusMapper::fromDepositRecord(const nlohmann::json& row, int decimals) {
    core::LedgerStatus result;
    result.status = mapStatus(stringField(row, "status"));
    result.external_id = stringField(row, "orderId");
    result.chain_tx_hash = stringField(row, "tradeId");
    result.detail = stringField(row, "status");

    if (result.status == core::LedgerOperationStatus::SUCCESS) {
        result.observed_amount = parseAmountField(row, "size", decimals);
    }
    return result;
}

} // namespace execution
} // namespace chainshuttle
