#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "common/Types.h"

namespace chainshuttle {
namespace core {

enum class Stage {
    WITHDRAW,
    CONVERT,
    DEPOSIT
};

enum class StageStatus {
    PENDING,
    SUBMITTED,
    CONFIRMING,
    DONE,
    FAILED
};

enum class TransferState {
    INIT,
    WITHDRAW_SUBMIT,
    WITHDRAW_WAIT,
    CONVERT_QUOTE,
    CONVERT_SUBMIT,
    CONVERT_WAIT,
    DEPOSIT_SUBMIT,
    DEPOSIT_WAIT,
    SUCCEEDED,
    FAILED,
    ABORTED
};

enum class TransferOutcome {
    NONE,
    SUCCEEDED,
    FAILED,
    ABORTED
};

enum class FailureReason {
    NONE,
    PERMANENT_ERROR,
    RETRIES_EXHAUSTED,
    CONFIRMATION_TIMEOUT,
    DEADLINE_EXCEEDED,
    EXTERNAL_REJECTED,     // the exchange or the chain reported the operation as failed
    MIN_OUTPUT_NOT_MET,
    CANCELLED
};

// Immutable input of one transfer.
struct TransferRequest {
    std::string source_asset;         // withdrawn from the exchange, e.g. "USDC"
    std::string destination_asset;    // deposited back, e.g. "ETH"
    Amount amount = 0;                // source asset base units
    std::string destination_chain;    // e.g. "Arbitrum"
    std::string destination_account;  // wallet address on that chain
    Amount min_output = 0;            // destination asset base units
    long long deadline_ms = 0;        // epoch ms
    std::string idempotency_key;      // optional; derived when empty
    std::string nonce;
};

struct StageProgress {
    StageStatus status = StageStatus::PENDING;
    std::string external_id;          // withdrawal id / tx hash; immutable once set
    Amount requested_amount = 0;
    Amount observed_amount = 0;
    bool has_observed = false;
    int attempts = 0;
    long long submitted_at_ms = 0;
    long long completed_at_ms = 0;
};

// Executable conversion plan returned by the quote source.
struct QuotePlan {
    std::string path_id;
    std::string router_address;
    std::string calldata;
    Amount value = 0;                 // native value attached to the swap call
    Amount input_amount = 0;
    Amount expected_output = 0;
    double price_impact = 0.0;
    long long expires_at_ms = 0;

    bool empty() const { return calldata.empty(); }
};

struct SignedTransaction {
    std::string raw;                  // 0x-prefixed signed envelope
    std::string hash;

    bool empty() const { return raw.empty(); }
};

struct FailureDetail {
    Stage stage = Stage::WITHDRAW;
    FailureReason reason = FailureReason::NONE;
    std::string message;
    bool funds_moved = false;
};

// Durable unit of state, one per admitted request.
struct TransferRecord {
    std::string key;
    std::uint64_t version = 0;
    TransferRequest request;

    TransferState state = TransferState::INIT;
    std::array<StageProgress, 3> stages;
    int state_attempts = 0;
    long long state_entered_at_ms = 0;
    long long not_before_ms = 0;

    QuotePlan quote;
    int requotes = 0;
    SignedTransaction approval_tx;
    std::string approval_spender;     // router the approval_tx allows
    SignedTransaction convert_tx;
    SignedTransaction deposit_tx;
    std::string deposit_address;
    std::string ledger_deposit_id;

    TransferOutcome outcome = TransferOutcome::NONE;
    FailureDetail failure;

    long long created_at_ms = 0;
    long long updated_at_ms = 0;

    StageProgress& stage(Stage s) { return stages[static_cast<size_t>(s)]; }
    const StageProgress& stage(Stage s) const { return stages[static_cast<size_t>(s)]; }
    bool isTerminal() const { return outcome != TransferOutcome::NONE; }
};

} // namespace core
} // namespace chainshuttle
