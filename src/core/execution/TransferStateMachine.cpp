#include "core/execution/TransferStateMachine.h"

#include "core/model/TransferSchema.h"

namespace chainshuttle {
namespace core {
namespace execution {

TransferState TransferStateMachine::nextOnSuccess(TransferState state) {
    switch (state) {
        case TransferState::INIT: return TransferState::WITHDRAW_SUBMIT;
        case TransferState::WITHDRAW_SUBMIT: return TransferState::WITHDRAW_WAIT;
        case TransferState::WITHDRAW_WAIT: return TransferState::CONVERT_QUOTE;
        case TransferState::CONVERT_QUOTE: return TransferState::CONVERT_SUBMIT;
        case TransferState::CONVERT_SUBMIT: return TransferState::CONVERT_WAIT;
        case TransferState::CONVERT_WAIT: return TransferState::DEPOSIT_SUBMIT;
        case TransferState::DEPOSIT_SUBMIT: return TransferState::DEPOSIT_WAIT;
        case TransferState::DEPOSIT_WAIT: return TransferState::SUCCEEDED;
        case TransferState::SUCCEEDED:
        case TransferState::FAILED:
        case TransferState::ABORTED:
            return state;
    }
    return state;
}

Stage TransferStateMachine::stageOf(TransferState state) {
    switch (state) {
        case TransferState::INIT:
        case TransferState::WITHDRAW_SUBMIT:
        case TransferState::WITHDRAW_WAIT:
            return Stage::WITHDRAW;
        case TransferState::CONVERT_QUOTE:
        case TransferState::CONVERT_SUBMIT:
        case TransferState::CONVERT_WAIT:
            return Stage::CONVERT;
        case TransferState::DEPOSIT_SUBMIT:
        case TransferState::DEPOSIT_WAIT:
        case TransferState::SUCCEEDED:
            return Stage::DEPOSIT;
        case TransferState::FAILED:
        case TransferState::ABORTED:
            // The failing stage is kept in FailureDetail.
            return Stage::WITHDRAW;
    }
    return Stage::WITHDRAW;
}

bool TransferStateMachine::isTerminal(TransferState state) {
    return state == TransferState::SUCCEEDED ||
           state == TransferState::FAILED ||
           state == TransferState::ABORTED;
}

bool TransferStateMachine::isCancellable(TransferState state) {
    return state == TransferState::INIT || state == TransferState::CONVERT_QUOTE;
}

ServiceKind TransferStateMachine::serviceFor(TransferState state) {
    switch (state) {
        case TransferState::WITHDRAW_SUBMIT:
        case TransferState::WITHDRAW_WAIT:
            return ServiceKind::LEDGER;
        case TransferState::CONVERT_QUOTE:
            return ServiceKind::QUOTE;
        case TransferState::CONVERT_SUBMIT:
        case TransferState::CONVERT_WAIT:
        case TransferState::DEPOSIT_SUBMIT:
        case TransferState::DEPOSIT_WAIT:
            return ServiceKind::CHAIN;
        case TransferState::INIT:
        case TransferState::SUCCEEDED:
        case TransferState::FAILED:
        case TransferState::ABORTED:
            return ServiceKind::NONE;
    }
    return ServiceKind::NONE;
}

TransferOutcome TransferStateMachine::outcomeFor(TransferState state) {
    switch (state) {
        case TransferState::SUCCEEDED: return TransferOutcome::SUCCEEDED;
        case TransferState::FAILED: return TransferOutcome::FAILED;
        case TransferState::ABORTED: return TransferOutcome::ABORTED;
        default: return TransferOutcome::NONE;
    }
}

int TransferStateMachine::rank(TransferState state) {
    switch (state) {
        case TransferState::INIT: return 0;
        case TransferState::WITHDRAW_SUBMIT: return 1;
        case TransferState::WITHDRAW_WAIT: return 2;
        case TransferState::CONVERT_QUOTE: return 3;
        case TransferState::CONVERT_SUBMIT: return 4;
        case TransferState::CONVERT_WAIT: return 5;
        case TransferState::DEPOSIT_SUBMIT: return 6;
        case TransferState::DEPOSIT_WAIT: return 7;
        case TransferState::SUCCEEDED:
        case TransferState::FAILED:
        case TransferState::ABORTED:
            return 8;
    }
    return 0;
}

std::optional<std::string> TransferStateMachine::validateUpdate(
    const TransferRecord& stored,
    const TransferRecord& next
) {
    if (stored.isTerminal()) {
        return std::string("record is terminal: ") + transferOutcomeToString(stored.outcome);
    }
    if (next.key != stored.key || !requestsEquivalent(next.request, stored.request)) {
        return std::string("request content is immutable");
    }
    if (rank(next.state) < rank(stored.state)) {
        return std::string("state regression ") + transferStateToString(stored.state) +
               " -> " + transferStateToString(next.state);
    }
    if (next.outcome != outcomeFor(next.state)) {
        return std::string("outcome does not match state ") + transferStateToString(next.state);
    }

    for (Stage s : {Stage::WITHDRAW, Stage::CONVERT, Stage::DEPOSIT}) {
        const auto& before = stored.stage(s);
        const auto& after = next.stage(s);
        if (!before.external_id.empty() && after.external_id != before.external_id) {
            return std::string("external id of ") + stageToString(s) + " is immutable";
        }
        if (before.status == StageStatus::DONE && after.status != StageStatus::DONE) {
            return std::string("stage ") + stageToString(s) + " already DONE";
        }
    }

    const auto immutableTx = [](const SignedTransaction& before, const SignedTransaction& after) {
        return before.hash.empty() || before.hash == after.hash;
    };
    // a new router needs its own approval
    const bool reapproval = !next.approval_spender.empty() && next.approval_spender != stored.approval_spender;
    if ((!reapproval && !immutableTx(stored.approval_tx, next.approval_tx)) ||
        !immutableTx(stored.convert_tx, next.convert_tx) ||
        !immutableTx(stored.deposit_tx, next.deposit_tx)) {
        return std::string("signed transaction is immutable once stored");
    }

    return std::nullopt;
}

} // namespace execution
} // namespace core
} // namespace chainshuttle
