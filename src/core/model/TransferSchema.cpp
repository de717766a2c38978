#include "core/model/TransferSchema.h"

#include "common/AmountFormat.h"

#include <openssl/sha.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace chainshuttle {
namespace core {

namespace {
Amount amountField(const nlohmann::json& raw, const char* key) {
    if (!raw.contains(key) || !raw[key].is_string()) {
        throw std::runtime_error(std::string("missing amount field: ") + key);
    }
    const auto parsed = common::fromDecimalString(raw[key].get<std::string>());
    if (!parsed) {
        throw std::runtime_error(std::string("malformed amount field: ") + key);
    }
    return *parsed;
}

nlohmann::json toJson(const StageProgress& stage) {
    nlohmann::json line;
    line["status"] = stageStatusToString(stage.status);
    line["external_id"] = stage.external_id;
    line["requested_amount"] = common::toDecimalString(stage.requested_amount);
    line["observed_amount"] = common::toDecimalString(stage.observed_amount);
    line["has_observed"] = stage.has_observed;
    line["attempts"] = stage.attempts;
    line["submitted_at_ms"] = stage.submitted_at_ms;
    line["completed_at_ms"] = stage.completed_at_ms;
    return line;
}

StageProgress stageFromJson(const nlohmann::json& raw) {
    StageProgress stage;
    stage.status = stageStatusFromString(raw.value("status", std::string("PENDING")));
    stage.external_id = raw.value("external_id", std::string());
    stage.requested_amount = amountField(raw, "requested_amount");
    stage.observed_amount = amountField(raw, "observed_amount");
    stage.has_observed = raw.value("has_observed", false);
    stage.attempts = raw.value("attempts", 0);
    stage.submitted_at_ms = raw.value("submitted_at_ms", 0LL);
    stage.completed_at_ms = raw.value("completed_at_ms", 0LL);
    return stage;
}

nlohmann::json toJson(const SignedTransaction& tx) {
    return nlohmann::json{{"raw", tx.raw}, {"hash", tx.hash}};
}

SignedTransaction signedTxFromJson(const nlohmann::json& raw) {
    SignedTransaction tx;
    tx.raw = raw.value("raw", std::string());
    tx.hash = raw.value("hash", std::string());
    return tx;
}
} // namespace

const char* stageToString(Stage stage) {
    switch (stage) {
        case Stage::WITHDRAW: return "WITHDRAW";
        case Stage::CONVERT: return "CONVERT";
        case Stage::DEPOSIT: return "DEPOSIT";
    }
    return "WITHDRAW";
}

const char* stageStatusToString(StageStatus status) {
    switch (status) {
        case StageStatus::PENDING: return "PENDING";
        case StageStatus::SUBMITTED: return "SUBMITTED";
        case StageStatus::CONFIRMING: return "CONFIRMING";
        case StageStatus::DONE: return "DONE";
        case StageStatus::FAILED: return "FAILED";
    }
    return "PENDING";
}

const char* transferStateToString(TransferState state) {
    switch (state) {
        case TransferState::INIT: return "INIT";
        case TransferState::WITHDRAW_SUBMIT: return "WITHDRAW_SUBMIT";
        case TransferState::WITHDRAW_WAIT: return "WITHDRAW_WAIT";
        case TransferState::CONVERT_QUOTE: return "CONVERT_QUOTE";
        case TransferState::CONVERT_SUBMIT: return "CONVERT_SUBMIT";
        case TransferState::CONVERT_WAIT: return "CONVERT_WAIT";
        case TransferState::DEPOSIT_SUBMIT: return "DEPOSIT_SUBMIT";
        case TransferState::DEPOSIT_WAIT: return "DEPOSIT_WAIT";
        case TransferState::SUCCEEDED: return "SUCCEEDED";
        case TransferState::FAILED: return "FAILED";
        case TransferState::ABORTED: return "ABORTED";
    }
    return "INIT";
}

const char* transferOutcomeToString(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::NONE: return "NONE";
        case TransferOutcome::SUCCEEDED: return "SUCCEEDED";
        case TransferOutcome::FAILED: return "FAILED";
        case TransferOutcome::ABORTED: return "ABORTED";
    }
    return "NONE";
}

const char* failureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "NONE";
        case FailureReason::PERMANENT_ERROR: return "PERMANENT_ERROR";
        case FailureReason::RETRIES_EXHAUSTED: return "RETRIES_EXHAUSTED";
        case FailureReason::CONFIRMATION_TIMEOUT: return "CONFIRMATION_TIMEOUT";
        case FailureReason::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        case FailureReason::EXTERNAL_REJECTED: return "EXTERNAL_REJECTED";
        case FailureReason::MIN_OUTPUT_NOT_MET: return "MIN_OUTPUT_NOT_MET";
        case FailureReason::CANCELLED: return "CANCELLED";
    }
    return "NONE";
}

Stage stageFromString(const std::string& value) {
    if (value == "CONVERT") return Stage::CONVERT;
    if (value == "DEPOSIT") return Stage::DEPOSIT;
    return Stage::WITHDRAW;
}

StageStatus stageStatusFromString(const std::string& value) {
    if (value == "SUBMITTED") return StageStatus::SUBMITTED;
    if (value == "CONFIRMING") return StageStatus::CONFIRMING;
    if (value == "DONE") return StageStatus::DONE;
    if (value == "FAILED") return StageStatus::FAILED;
    return StageStatus::PENDING;
}

TransferState transferStateFromString(const std::string& value) {
    if (value == "WITHDRAW_SUBMIT") return TransferState::WITHDRAW_SUBMIT;
    if (value == "WITHDRAW_WAIT") return TransferState::WITHDRAW_WAIT;
    if (value == "CONVERT_QUOTE") return TransferState::CONVERT_QUOTE;
    if (value == "CONVERT_SUBMIT") return TransferState::CONVERT_SUBMIT;
    if (value == "CONVERT_WAIT") return TransferState::CONVERT_WAIT;
    if (value == "DEPOSIT_SUBMIT") return TransferState::DEPOSIT_SUBMIT;
    if (value == "DEPOSIT_WAIT") return TransferState::DEPOSIT_WAIT;
    if (value == "SUCCEEDED") return TransferState::SUCCEEDED;
    if (value == "FAILED") return TransferState::FAILED;
    if (value == "ABORTED") return TransferState::ABORTED;
    return TransferState::INIT;
}

TransferOutcome transferOutcomeFromString(const std::string& value) {
    if (value == "SUCCEEDED") return TransferOutcome::SUCCEEDED;
    if (value == "FAILED") return TransferOutcome::FAILED;
    if (value == "ABORTED") return TransferOutcome::ABORTED;
    return TransferOutcome::NONE;
}

FailureReason failureReasonFromString(const std::string& value) {
    if (value == "PERMANENT_ERROR") return FailureReason::PERMANENT_ERROR;
    if (value == "RETRIES_EXHAUSTED") return FailureReason::RETRIES_EXHAUSTED;
    if (value == "CONFIRMATION_TIMEOUT") return FailureReason::CONFIRMATION_TIMEOUT;
    if (value == "DEADLINE_EXCEEDED") return FailureReason::DEADLINE_EXCEEDED;
    if (value == "EXTERNAL_REJECTED") return FailureReason::EXTERNAL_REJECTED;
    if (value == "MIN_OUTPUT_NOT_MET") return FailureReason::MIN_OUTPUT_NOT_MET;
    if (value == "CANCELLED") return FailureReason::CANCELLED;
    return FailureReason::NONE;
}

nlohmann::json toJson(const TransferRequest& request) {
    nlohmann::json line;
    line["source_asset"] = request.source_asset;
    line["destination_asset"] = request.destination_asset;
    line["amount"] = common::toDecimalString(request.amount);
    line["destination_chain"] = request.destination_chain;
    line["destination_account"] = request.destination_account;
    line["min_output"] = common::toDecimalString(request.min_output);
    line["deadline_ms"] = request.deadline_ms;
    line["idempotency_key"] = request.idempotency_key;
    line["nonce"] = request.nonce;
    return line;
}

nlohmann::json toJson(const TransferRecord& record) {
    nlohmann::json line;
    line["schema_version"] = 1;
    line["key"] = record.key;
    line["version"] = record.version;
    line["request"] = toJson(record.request);
    line["state"] = transferStateToString(record.state);

    nlohmann::json stages = nlohmann::json::object();
    for (Stage s : {Stage::WITHDRAW, Stage::CONVERT, Stage::DEPOSIT}) {
        stages[stageToString(s)] = toJson(record.stage(s));
    }
    line["stages"] = stages;

    line["state_attempts"] = record.state_attempts;
    line["state_entered_at_ms"] = record.state_entered_at_ms;
    line["not_before_ms"] = record.not_before_ms;

    nlohmann::json quote;
    quote["path_id"] = record.quote.path_id;
    quote["router_address"] = record.quote.router_address;
    quote["calldata"] = record.quote.calldata;
    quote["value"] = common::toDecimalString(record.quote.value);
    quote["input_amount"] = common::toDecimalString(record.quote.input_amount);
    quote["expected_output"] = common::toDecimalString(record.quote.expected_output);
    quote["price_impact"] = record.quote.price_impact;
    quote["expires_at_ms"] = record.quote.expires_at_ms;
    line["quote"] = quote;
    line["requotes"] = record.requotes;

    line["approval_tx"] = toJson(record.approval_tx);
    line["approval_spender"] = record.approval_spender;
    line["convert_tx"] = toJson(record.convert_tx);
    line["deposit_tx"] = toJson(record.deposit_tx);
    line["deposit_address"] = record.deposit_address;
    line["ledger_deposit_id"] = record.ledger_deposit_id;

    line["outcome"] = transferOutcomeToString(record.outcome);
    nlohmann::json failure;
    failure["stage"] = stageToString(record.failure.stage);
    failure["reason"] = failureReasonToString(record.failure.reason);
    failure["message"] = record.failure.message;
    failure["funds_moved"] = record.failure.funds_moved;
    line["failure"] = failure;

    line["created_at_ms"] = record.created_at_ms;
    line["updated_at_ms"] = record.updated_at_ms;
    return line;
}

TransferRequest requestFromJson(const nlohmann::json& raw) {
    TransferRequest request;
    request.source_asset = raw.value("source_asset", std::string());
    request.destination_asset = raw.value("destination_asset", std::string());
    request.amount = amountField(raw, "amount");
    request.destination_chain = raw.value("destination_chain", std::string());
    request.destination_account = raw.value("destination_account", std::string());
    request.min_output = amountField(raw, "min_output");
    request.deadline_ms = raw.value("deadline_ms", 0LL);
    request.idempotency_key = raw.value("idempotency_key", std::string());
    request.nonce = raw.value("nonce", std::string());
    return request;
}

TransferRecord recordFromJson(const nlohmann::json& raw) {
    TransferRecord record;
    record.key = raw.at("key").get<std::string>();
    record.version = raw.value("version", static_cast<std::uint64_t>(0));
    record.request = requestFromJson(raw.at("request"));
    record.state = transferStateFromString(raw.value("state", std::string("INIT")));

    const auto& stages = raw.at("stages");
    for (Stage s : {Stage::WITHDRAW, Stage::CONVERT, Stage::DEPOSIT}) {
        record.stage(s) = stageFromJson(stages.at(stageToString(s)));
    }

    record.state_attempts = raw.value("state_attempts", 0);
    record.state_entered_at_ms = raw.value("state_entered_at_ms", 0LL);
    record.not_before_ms = raw.value("not_before_ms", 0LL);

    const auto& quote = raw.at("quote");
    record.quote.path_id = quote.value("path_id", std::string());
    record.quote.router_address = quote.value("router_address", std::string());
    record.quote.calldata = quote.value("calldata", std::string());
    record.quote.value = amountField(quote, "value");
    record.quote.input_amount = amountField(quote, "input_amount");
    record.quote.expected_output = amountField(quote, "expected_output");
    record.quote.price_impact = quote.value("price_impact", 0.0);
    record.quote.expires_at_ms = quote.value("expires_at_ms", 0LL);
    record.requotes = raw.value("requotes", 0);

    record.approval_tx = signedTxFromJson(raw.value("approval_tx", nlohmann::json::object()));
    record.approval_spender = raw.value("approval_spender", std::string());
    record.convert_tx = signedTxFromJson(raw.value("convert_tx", nlohmann::json::object()));
    record.deposit_tx = signedTxFromJson(raw.value("deposit_tx", nlohmann::json::object()));
    record.deposit_address = raw.value("deposit_address", std::string());
    record.ledger_deposit_id = raw.value("ledger_deposit_id", std::string());

    record.outcome = transferOutcomeFromString(raw.value("outcome", std::string("NONE")));
    const auto failure = raw.value("failure", nlohmann::json::object());
    record.failure.stage = stageFromString(failure.value("stage", std::string("WITHDRAW")));
    record.failure.reason = failureReasonFromString(failure.value("reason", std::string("NONE")));
    record.failure.message = failure.value("message", std::string());
    record.failure.funds_moved = failure.value("funds_moved", false);

    record.created_at_ms = raw.value("created_at_ms", 0LL);
    record.updated_at_ms = raw.value("updated_at_ms", 0LL);
    return record;
}

bool requestsEquivalent(const TransferRequest& lhs, const TransferRequest& rhs) {
    return lhs.source_asset == rhs.source_asset &&
           lhs.destination_asset == rhs.destination_asset &&
           lhs.amount == rhs.amount &&
           lhs.destination_chain == rhs.destination_chain &&
           lhs.destination_account == rhs.destination_account &&
           lhs.min_output == rhs.min_output &&
           lhs.deadline_ms == rhs.deadline_ms;
}

namespace {
std::string sha256Hex32(const std::string& content) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(content.c_str()), content.length(), hash);

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(hash[i]);
    }
    return hex_stream.str();
}
} // namespace

std::string deriveIdempotencyKey(const TransferRequest& request) {
    if (!request.idempotency_key.empty()) {
        return request.idempotency_key;
    }

    std::ostringstream canonical;
    canonical << request.source_asset << "|"
              << request.destination_asset << "|"
              << common::toDecimalString(request.amount) << "|"
              << request.destination_chain << "|"
              << request.destination_account << "|"
              << common::toDecimalString(request.min_output) << "|"
              << request.deadline_ms << "|"
              << request.nonce;
    return "tr-" + sha256Hex32(canonical.str());
}

std::string ledgerClientIdFor(const std::string& key) {
    if (key.size() <= 40) {
        return key;
    }
    return "cs-" + sha256Hex32(key);
}

bool isValidIdempotencyKey(const std::string& key) {
    if (key.empty() || key.size() > 128 || key[0] == '.') {
        return false;
    }
    for (char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

TransferRecord makeInitialRecord(const TransferRequest& request, const std::string& key, long long now_ms) {
    TransferRecord record;
    record.key = key;
    record.version = 1;
    record.request = request;
    record.request.idempotency_key = key;
    record.state = TransferState::INIT;
    record.stage(Stage::WITHDRAW).requested_amount = request.amount;
    record.state_entered_at_ms = now_ms;
    record.created_at_ms = now_ms;
    record.updated_at_ms = now_ms;
    return record;
}

} // namespace core
} // namespace chainshuttle
