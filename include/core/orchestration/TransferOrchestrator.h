#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "common/Clock.h"
#include "core/contracts/IChainClient.h"
#include "core/contracts/ILedgerClient.h"
#include "core/contracts/IQuoteSource.h"
#include "core/contracts/ITransferJournal.h"
#include "core/contracts/ITransferRecordStore.h"
#include "core/orchestration/PipelineConfig.h"
#include "execution/ExternalCallError.h"
#include "execution/RetryPolicy.h"

namespace chainshuttle {
namespace core {

struct StepResult {
    enum class Kind {
        CONTINUE,    // state advanced; step again right away
        WAIT,        // nothing to do before wake_at_ms
        TERMINAL,
        CONFLICT,    // lost a CAS race; re-read and step again
        REJECTED,    // the store refused the write; the same step would be refused again
        NOT_FOUND
    };

    Kind kind = Kind::CONTINUE;
    long long wake_at_ms = 0;
    TransferState state = TransferState::INIT;

    static StepResult proceed(TransferState s) { return {Kind::CONTINUE, 0, s}; }
    static StepResult waitUntil(TransferState s, long long at_ms) { return {Kind::WAIT, at_ms, s}; }
    static StepResult terminal(TransferState s) { return {Kind::TERMINAL, 0, s}; }
    static StepResult conflict(TransferState s) { return {Kind::CONFLICT, 0, s}; }
    static StepResult rejected(TransferState s) { return {Kind::REJECTED, 0, s}; }
    static StepResult notFound() { return {Kind::NOT_FOUND, 0, TransferState::INIT}; }
};

enum class CancelResult {
    OK,
    REFUSED,
    NOT_FOUND
};

const char* cancelResultToString(CancelResult result);

// Drives one transfer record at a time through
// INIT -> WITHDRAW_* -> CONVERT_* -> DEPOSIT_* -> SUCCEEDED.
//
// Every step re-reads the record, does at most one kind of external action,
// and persists through compare-and-swap before the next external call
// (checkpoint-then-act). A crashed process resumes from the stored state:
// stored withdrawal ids are polled, stored signed transactions re-broadcast,
// nothing completed is issued twice.
class TransferOrchestrator {
public:
    TransferOrchestrator(
        PipelineConfig config,
        std::map<std::string, AssetInfo> assets,
        std::shared_ptr<ITransferRecordStore> store,
        std::shared_ptr<ILedgerClient> ledger,
        std::shared_ptr<IChainClient> chain,
        std::shared_ptr<IQuoteSource> quotes,
        std::shared_ptr<chainshuttle::execution::RetryPolicy> retry,
        std::shared_ptr<const IClock> clock,
        std::shared_ptr<ITransferJournal> journal = nullptr
    );

    StepResult step(const std::string& key);

    // Steps until the record waits or settles (or max_steps runs out).
    StepResult runUntilBlocked(const std::string& key, int max_steps = 64);

    // Allowed in INIT and CONVERT_QUOTE only.
    CancelResult cancel(const std::string& key);

    ServiceKind serviceFor(const std::string& key) const;

    ITransferRecordStore& store() { return *store_; }

private:
    using Record = TransferRecord;

    StepResult stepLoaded(Record& record);
    StepResult dispatch(Record& record);
    StepResult onInit(Record& record);
    StepResult onWithdrawSubmit(Record& record);
    StepResult onWithdrawWait(Record& record);
    StepResult onConvertQuote(Record& record);
    StepResult onConvertSubmit(Record& record);
    StepResult onConvertWait(Record& record);
    StepResult onDepositSubmit(Record& record);
    StepResult onDepositWait(Record& record);

    // Approval of the router for token input; nullopt once allowance is in place.
    std::optional<StepResult> ensureApproval(Record& record);

    StepResult onExternalError(
        Record& record,
        chainshuttle::execution::ErrorClass error_class,
        const std::string& message,
        long long retry_after_ms
    );

    // CAS record -> next; on success record becomes the stored copy. False on a
    // lost race; a store rejection throws and ends the step as REJECTED.
    bool commit(Record& record, Record next);
    Record advanced(const Record& record, TransferState next_state) const;
    Record settled(const Record& record, TransferState terminal_state, FailureReason reason, const std::string& message) const;
    StepResult settle(Record& record, Record next);
    StepResult settle(Record& record, TransferState terminal_state, FailureReason reason, const std::string& message);
    // Best-effort lookup of a withdrawal whose id was never stored.
    void attachWithdrawalReference(Record& next);
    StepResult pollAgain(const Record& record) const;
    StepResult keepPolling(Record& record, Stage stage);
    bool waitTimedOut(const Record& record, long long timeout_ms) const;

    std::optional<std::string> validateRequest(const TransferRequest& request) const;
    const AssetInfo& asset(const std::string& symbol) const;

    void journal(JournalEventType type, const Record& record, nlohmann::json payload = nlohmann::json::object());
    void report(const Record& record) const;
    std::string formatAmount(const std::string& symbol, const Amount& amount) const;

    PipelineConfig config_;
    std::map<std::string, AssetInfo> assets_;
    std::shared_ptr<ITransferRecordStore> store_;
    std::shared_ptr<ILedgerClient> ledger_;
    std::shared_ptr<IChainClient> chain_;
    std::shared_ptr<IQuoteSource> quotes_;
    std::shared_ptr<chainshuttle::execution::RetryPolicy> retry_;
    std::shared_ptr<const IClock> clock_;
    std::shared_ptr<ITransferJournal> journal_;
};

} // namespace core
} // namespace chainshuttle
