#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "core/model/TransferTypes.h"

namespace chainshuttle {
namespace core {

const char* stageToString(Stage stage);
const char* stageStatusToString(StageStatus status);
const char* transferStateToString(TransferState state);
const char* transferOutcomeToString(TransferOutcome outcome);
const char* failureReasonToString(FailureReason reason);

Stage stageFromString(const std::string& value);
StageStatus stageStatusFromString(const std::string& value);
TransferState transferStateFromString(const std::string& value);
TransferOutcome transferOutcomeFromString(const std::string& value);
FailureReason failureReasonFromString(const std::string& value);

nlohmann::json toJson(const TransferRequest& request);
nlohmann::json toJson(const TransferRecord& record);

// Throws std::runtime_error on missing or malformed amount fields.
TransferRequest requestFromJson(const nlohmann::json& raw);
TransferRecord recordFromJson(const nlohmann::json& raw);

// Same economic content; idempotency key and nonce are not compared.
bool requestsEquivalent(const TransferRequest& lhs, const TransferRequest& rhs);

// Caller key when present, else "tr-" + first 32 hex chars of
// SHA-256(canonical request content + nonce).
std::string deriveIdempotencyKey(const TransferRequest& request);

// Exchange-side client order id for the withdrawal: the key itself when it
// fits the exchange's 40-char limit, else "cs-" + 32 hex of SHA-256(key).
std::string ledgerClientIdFor(const std::string& key);

// Keys double as file names: [A-Za-z0-9_.-], 1..128 chars, no leading dot.
bool isValidIdempotencyKey(const std::string& key);

// Fresh INIT record for an admitted request.
TransferRecord makeInitialRecord(const TransferRequest& request, const std::string& key, long long now_ms);

} // namespace core
} // namespace chainshuttle
