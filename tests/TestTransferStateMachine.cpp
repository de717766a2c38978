#include "core/execution/TransferStateMachine.h"
#include "core/model/TransferSchema.h"

#include <cassert>
#include <iostream>

using namespace chainshuttle;
using namespace chainshuttle::core;
using chainshuttle::core::execution::TransferStateMachine;

namespace {
TransferRecord sampleRecord() {
    TransferRequest request;
    request.source_asset = "USDC";
    request.destination_asset = "ETH";
    request.amount = 1000000;
    request.destination_chain = "Arbitrum";
    request.destination_account = "0x1111111111111111111111111111111111111111";
    request.idempotency_key = "sm-1";
    return makeInitialRecord(request, "sm-1", 1000);
}
}

int main() {
    {
        TransferState state = TransferState::INIT;
        int steps = 0;
        while (!TransferStateMachine::isTerminal(state)) {
            const TransferState next = TransferStateMachine::nextOnSuccess(state);
            assert(TransferStateMachine::rank(next) > TransferStateMachine::rank(state));
            state = next;
            ++steps;
        }
        assert(state == TransferState::SUCCEEDED);
        assert(steps == 8);
        assert(TransferStateMachine::nextOnSuccess(TransferState::FAILED) == TransferState::FAILED);
    }

    {
        assert(TransferStateMachine::stageOf(TransferState::WITHDRAW_WAIT) == Stage::WITHDRAW);
        assert(TransferStateMachine::stageOf(TransferState::CONVERT_QUOTE) == Stage::CONVERT);
        assert(TransferStateMachine::stageOf(TransferState::DEPOSIT_SUBMIT) == Stage::DEPOSIT);

        assert(TransferStateMachine::isCancellable(TransferState::INIT));
        assert(TransferStateMachine::isCancellable(TransferState::CONVERT_QUOTE));
        assert(!TransferStateMachine::isCancellable(TransferState::WITHDRAW_SUBMIT));
        assert(!TransferStateMachine::isCancellable(TransferState::CONVERT_SUBMIT));
        assert(!TransferStateMachine::isCancellable(TransferState::ABORTED));

        assert(TransferStateMachine::serviceFor(TransferState::WITHDRAW_WAIT) == ServiceKind::LEDGER);
        assert(TransferStateMachine::serviceFor(TransferState::CONVERT_QUOTE) == ServiceKind::QUOTE);
        assert(TransferStateMachine::serviceFor(TransferState::DEPOSIT_WAIT) == ServiceKind::CHAIN);
        assert(TransferStateMachine::serviceFor(TransferState::SUCCEEDED) == ServiceKind::NONE);

        assert(TransferStateMachine::outcomeFor(TransferState::ABORTED) == TransferOutcome::ABORTED);
        assert(TransferStateMachine::outcomeFor(TransferState::CONVERT_WAIT) == TransferOutcome::NONE);
    }

    {
        const TransferRecord stored = sampleRecord();

        TransferRecord forward = stored;
        forward.state = TransferState::WITHDRAW_SUBMIT;
        assert(!TransferStateMachine::validateUpdate(stored, forward).has_value());

        TransferRecord wrong_outcome = stored;
        wrong_outcome.state = TransferState::FAILED;
        assert(TransferStateMachine::validateUpdate(stored, wrong_outcome).has_value());

        TransferRecord done = stored;
        done.state = TransferState::CONVERT_QUOTE;
        done.stage(Stage::WITHDRAW).status = StageStatus::DONE;
        done.stage(Stage::WITHDRAW).external_id = "wd-1";
        assert(!TransferStateMachine::validateUpdate(stored, done).has_value());

        TransferRecord undone = done;
        undone.stage(Stage::WITHDRAW).status = StageStatus::CONFIRMING;
        assert(TransferStateMachine::validateUpdate(done, undone).has_value());

        TransferRecord signed_once = done;
        signed_once.state = TransferState::CONVERT_SUBMIT;
        signed_once.convert_tx.hash = "0xaa";
        signed_once.convert_tx.raw = "0x02aa";
        assert(!TransferStateMachine::validateUpdate(done, signed_once).has_value());

        TransferRecord resigned = signed_once;
        resigned.convert_tx.hash = "0xbb";
        assert(TransferStateMachine::validateUpdate(signed_once, resigned).has_value());

        // an approval is replaced only together with its spender
        TransferRecord approved = signed_once;
        approved.approval_tx.hash = "0xa1";
        approved.approval_tx.raw = "0x02a1";
        approved.approval_spender = "0x3333333333333333333333333333333333333333";
        assert(!TransferStateMachine::validateUpdate(signed_once, approved).has_value());

        TransferRecord same_spender = approved;
        same_spender.approval_tx.hash = "0xa2";
        assert(TransferStateMachine::validateUpdate(approved, same_spender).has_value());

        TransferRecord new_spender = same_spender;
        new_spender.approval_spender = "0x4444444444444444444444444444444444444444";
        assert(!TransferStateMachine::validateUpdate(approved, new_spender).has_value());

        TransferRecord other_request = stored;
        other_request.request.destination_account = "0x9999999999999999999999999999999999999999";
        assert(TransferStateMachine::validateUpdate(stored, other_request).has_value());
    }

    std::cout << "[TEST] TransferStateMachine PASSED\n";
    return 0;
}
