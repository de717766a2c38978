#include "core/orchestration/TransferOrchestrator.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

#include "common/AmountFormat.h"
#include "common/Logger.h"
#include "core/execution/TransferStateMachine.h"
#include "core/model/TransferSchema.h"

namespace chainshuttle {
namespace core {

using Machine = execution::TransferStateMachine;
using chainshuttle::execution::ErrorClass;
using chainshuttle::execution::ExternalCallError;

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const char* stateName(TransferState state) {
    return transferStateToString(state);
}

// The store refused a write outright; retrying the same write cannot succeed.
class RecordRejectedError : public std::runtime_error {
public:
    explicit RecordRejectedError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace

const char* cancelResultToString(CancelResult result) {
    switch (result) {
        case CancelResult::OK: return "OK";
        case CancelResult::REFUSED: return "REFUSED";
        case CancelResult::NOT_FOUND: return "NOT_FOUND";
    }
    return "REFUSED";
}

TransferOrchestrator::TransferOrchestrator(
    PipelineConfig config,
    std::map<std::string, AssetInfo> assets,
    std::shared_ptr<ITransferRecordStore> store,
    std::shared_ptr<ILedgerClient> ledger,
    std::shared_ptr<IChainClient> chain,
    std::shared_ptr<IQuoteSource> quotes,
    std::shared_ptr<chainshuttle::execution::RetryPolicy> retry,
    std::shared_ptr<const IClock> clock,
    std::shared_ptr<ITransferJournal> journal
)
    : config_(std::move(config))
    , assets_(std::move(assets))
    , store_(std::move(store))
    , ledger_(std::move(ledger))
    , chain_(std::move(chain))
    , quotes_(std::move(quotes))
    , retry_(std::move(retry))
    , clock_(std::move(clock))
    , journal_(std::move(journal))
{
    if (!store_ || !ledger_ || !chain_ || !quotes_ || !retry_ || !clock_) {
        throw std::invalid_argument("TransferOrchestrator requires store, clients, retry policy and clock");
    }
}

// ===== Step loop =====

StepResult TransferOrchestrator::step(const std::string& key) {
    const auto loaded = store_->get(key);
    if (!loaded) {
        return StepResult::notFound();
    }

    Record record = *loaded;
    if (record.isTerminal()) {
        return StepResult::terminal(record.state);
    }

    try {
        return stepLoaded(record);
    } catch (const RecordRejectedError& e) {
        LOG_ERROR("[Transfer] {} held in {}: {}", key, stateName(record.state), e.what());
        return StepResult::rejected(record.state);
    }
}

StepResult TransferOrchestrator::stepLoaded(Record& record) {
    const std::string key = record.key;
    const long long now = clock_->nowMs();
    if (record.not_before_ms > now) {
        return StepResult::waitUntil(record.state, record.not_before_ms);
    }

    if (record.request.deadline_ms > 0 && now >= record.request.deadline_ms) {
        LOG_WARN("[Transfer] {} deadline passed in {}", key, stateName(record.state));
        return settle(record, TransferState::FAILED, FailureReason::DEADLINE_EXCEEDED,
                      std::string("deadline passed in ") + stateName(record.state));
    }

    try {
        return dispatch(record);
    } catch (const RecordRejectedError&) {
        throw;
    } catch (const ExternalCallError& e) {
        return onExternalError(record, e.errorClass(), e.what(), e.retryAfterMs());
    } catch (const std::invalid_argument& e) {
        // malformed addresses or amounts never become valid on retry
        return onExternalError(record, ErrorClass::PERMANENT, e.what(), 0);
    } catch (const std::exception& e) {
        return onExternalError(record, ErrorClass::TRANSIENT, e.what(), 0);
    }
}

StepResult TransferOrchestrator::runUntilBlocked(const std::string& key, int max_steps) {
    StepResult last = StepResult::notFound();
    for (int i = 0; i < max_steps; ++i) {
        last = step(key);
        if (last.kind != StepResult::Kind::CONTINUE && last.kind != StepResult::Kind::CONFLICT) {
            return last;
        }
    }
    return last;
}

StepResult TransferOrchestrator::dispatch(Record& record) {
    switch (record.state) {
        case TransferState::INIT: return onInit(record);
        case TransferState::WITHDRAW_SUBMIT: return onWithdrawSubmit(record);
        case TransferState::WITHDRAW_WAIT: return onWithdrawWait(record);
        case TransferState::CONVERT_QUOTE: return onConvertQuote(record);
        case TransferState::CONVERT_SUBMIT: return onConvertSubmit(record);
        case TransferState::CONVERT_WAIT: return onConvertWait(record);
        case TransferState::DEPOSIT_SUBMIT: return onDepositSubmit(record);
        case TransferState::DEPOSIT_WAIT: return onDepositWait(record);
        case TransferState::SUCCEEDED:
        case TransferState::FAILED:
        case TransferState::ABORTED:
            break;
    }
    return StepResult::terminal(record.state);
}

// ===== INIT =====

StepResult TransferOrchestrator::onInit(Record& record) {
    const auto invalid = validateRequest(record.request);
    if (invalid) {
        LOG_ERROR("[Transfer] {} rejected at admission: {}", record.key, *invalid);
        return settle(record, TransferState::FAILED, FailureReason::PERMANENT_ERROR, *invalid);
    }

    Record next = advanced(record, TransferState::WITHDRAW_SUBMIT);
    next.stage(Stage::WITHDRAW).requested_amount = record.request.amount;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }
    return StepResult::proceed(record.state);
}

// ===== WITHDRAW =====

StepResult TransferOrchestrator::onWithdrawSubmit(Record& record) {
    const StageProgress& withdrawal = record.stage(Stage::WITHDRAW);
    if (!withdrawal.external_id.empty()) {
        if (!commit(record, advanced(record, TransferState::WITHDRAW_WAIT))) {
            return StepResult::conflict(record.state);
        }
        return StepResult::proceed(record.state);
    }

    const AssetInfo& source = asset(record.request.source_asset);
    const std::string client_id = ledgerClientIdFor(record.key);
    const long long now = clock_->nowMs();

    if (withdrawal.status == StageStatus::SUBMITTED) {
        // A previous attempt may have reached the exchange before its id was stored.
        const auto found = ledger_->findWithdrawal(client_id);
        if (found && !found->external_id.empty()) {
            LOG_INFO("[Transfer] {} recovered withdrawal {} by client id", record.key, found->external_id);
            Record next = advanced(record, TransferState::WITHDRAW_WAIT);
            next.stage(Stage::WITHDRAW).external_id = found->external_id;
            if (!commit(record, std::move(next))) {
                return StepResult::conflict(record.state);
            }
            return StepResult::proceed(record.state);
        }
    } else {
        Record intent = record;
        StageProgress& stage = intent.stage(Stage::WITHDRAW);
        stage.status = StageStatus::SUBMITTED;
        stage.requested_amount = record.request.amount;
        stage.submitted_at_ms = now;
        stage.attempts += 1;
        if (!commit(record, std::move(intent))) {
            return StepResult::conflict(record.state);
        }
    }

    const std::string withdrawal_id = ledger_->withdraw(
        source,
        record.request.destination_chain,
        record.request.amount,
        record.request.destination_account,
        client_id
    );

    Record next = advanced(record, TransferState::WITHDRAW_WAIT);
    next.stage(Stage::WITHDRAW).external_id = withdrawal_id;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    LOG_INFO("[Transfer] {} withdrawal {} submitted: {} {}",
             record.key, withdrawal_id, formatAmount(source.symbol, record.request.amount), source.symbol);
    journal(JournalEventType::EXTERNAL_SUBMITTED, record, {
        {"stage", "WITHDRAW"},
        {"external_id", withdrawal_id},
        {"client_id", client_id}
    });
    return StepResult::proceed(record.state);
}

StepResult TransferOrchestrator::onWithdrawWait(Record& record) {
    const std::string withdrawal_id = record.stage(Stage::WITHDRAW).external_id;
    const LedgerStatus status = ledger_->statusOf(withdrawal_id);

    if (status.status == LedgerOperationStatus::FAILED) {
        return settle(record, TransferState::FAILED, FailureReason::EXTERNAL_REJECTED,
                      "withdrawal " + withdrawal_id + " rejected by exchange: " + status.detail);
    }

    if (status.status == LedgerOperationStatus::PENDING) {
        if (waitTimedOut(record, config_.withdraw_wait_timeout_ms)) {
            return settle(record, TransferState::FAILED, FailureReason::CONFIRMATION_TIMEOUT,
                          "withdrawal " + withdrawal_id + " still pending");
        }
        return keepPolling(record, Stage::WITHDRAW);
    }

    const AssetInfo& source = asset(record.request.source_asset);
    const Amount observed = status.observed_amount;
    if (observed == 0) {
        // the next stage must start from what actually left the exchange
        throw ExternalCallError(ErrorClass::TRANSIENT,
                                "withdrawal " + withdrawal_id + " reported done without a net amount");
    }

    // The exchange marks a withdrawal done when it broadcasts; wait for the wallet to hold it.
    const Amount balance = chain_->balanceOf(chain_->walletAddress(), source);
    if (balance < observed) {
        LOG_INFO("[Transfer] {} withdrawal {} done on exchange, wallet holds {} of {} {}",
                 record.key, withdrawal_id, formatAmount(source.symbol, balance),
                 formatAmount(source.symbol, observed), source.symbol);
        if (waitTimedOut(record, config_.withdraw_wait_timeout_ms)) {
            return settle(record, TransferState::FAILED, FailureReason::CONFIRMATION_TIMEOUT,
                          "withdrawal " + withdrawal_id + " never reached wallet " + chain_->walletAddress());
        }
        return keepPolling(record, Stage::WITHDRAW);
    }

    Record next = advanced(record, TransferState::CONVERT_QUOTE);
    StageProgress& done = next.stage(Stage::WITHDRAW);
    done.status = StageStatus::DONE;
    done.observed_amount = observed;
    done.has_observed = true;
    done.completed_at_ms = clock_->nowMs();
    next.stage(Stage::CONVERT).requested_amount = observed;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    LOG_INFO("[Transfer] {} withdrawal {} arrived: {} {}",
             record.key, withdrawal_id, formatAmount(source.symbol, observed), source.symbol);
    return StepResult::proceed(record.state);
}

// ===== CONVERT =====

StepResult TransferOrchestrator::onConvertQuote(Record& record) {
    const AssetInfo& input = asset(record.request.source_asset);
    const AssetInfo& output = asset(record.request.destination_asset);
    const Amount amount = record.stage(Stage::CONVERT).requested_amount;

    QuotePlan plan = quotes_->quote(input, output, amount, chain_->walletAddress());
    if (plan.expected_output < record.request.min_output) {
        return settle(record, TransferState::ABORTED, FailureReason::MIN_OUTPUT_NOT_MET,
                      "quote " + formatAmount(output.symbol, plan.expected_output) +
                      " below minimum " + formatAmount(output.symbol, record.request.min_output));
    }

    Record next = advanced(record, TransferState::CONVERT_SUBMIT);
    next.quote = std::move(plan);
    next.requotes = 0;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    LOG_INFO("[Transfer] {} quoted {} {} -> {} {} (impact {:.4f}%)",
             record.key, formatAmount(input.symbol, amount), input.symbol,
             formatAmount(output.symbol, record.quote.expected_output), output.symbol,
             record.quote.price_impact);
    return StepResult::proceed(record.state);
}

std::optional<StepResult> TransferOrchestrator::ensureApproval(Record& record) {
    const AssetInfo& input = asset(record.request.source_asset);
    if (input.isNative()) {
        return std::nullopt;
    }

    const std::string& router = record.quote.router_address;
    if (!record.approval_tx.empty() && toLower(record.approval_spender) == toLower(router)) {
        const ChainConfirmation approval = chain_->confirmationsOf(record.approval_tx.hash, TransferWatch{});
        switch (approval.status) {
            case ChainTxStatus::SUCCEEDED:
                if (approval.depth >= config_.min_confirmations) {
                    return std::nullopt;
                }
                break;
            case ChainTxStatus::REVERTED:
                return settle(record, TransferState::FAILED, FailureReason::PERMANENT_ERROR,
                              "approval " + record.approval_tx.hash + " reverted");
            case ChainTxStatus::NOT_FOUND:
                chain_->submit(record.approval_tx);
                break;
            case ChainTxStatus::PENDING:
                break;
        }
        if (waitTimedOut(record, config_.chain_wait_timeout_ms)) {
            return settle(record, TransferState::FAILED, FailureReason::CONFIRMATION_TIMEOUT,
                          "approval " + record.approval_tx.hash + " unconfirmed");
        }
        return pollAgain(record);
    }

    const Amount needed = record.stage(Stage::CONVERT).requested_amount;
    if (chain_->allowance(chain_->walletAddress(), input, router) >= needed) {
        return std::nullopt;
    }

    if (!record.approval_tx.empty()) {
        LOG_WARN("[Transfer] {} approval {} was for {}, re-approving for router {}",
                 record.key, record.approval_tx.hash, record.approval_spender, router);
    }

    const Amount approve_amount = config_.unlimited_approval ? std::numeric_limits<Amount>::max() : needed;
    SignedTransaction signed_tx = chain_->sign(chain_->approvalIntent(input, router, approve_amount));

    Record next = record;
    next.approval_tx = std::move(signed_tx);
    next.approval_spender = router;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    chain_->submit(record.approval_tx);
    LOG_INFO("[Transfer] {} approval {} for router {}", record.key, record.approval_tx.hash, router);
    journal(JournalEventType::EXTERNAL_SUBMITTED, record, {
        {"stage", "CONVERT"},
        {"kind", "approval"},
        {"tx_hash", record.approval_tx.hash},
        {"spender", router}
    });
    return pollAgain(record);
}

StepResult TransferOrchestrator::onConvertSubmit(Record& record) {
    if (!record.stage(Stage::CONVERT).external_id.empty()) {
        if (!commit(record, advanced(record, TransferState::CONVERT_WAIT))) {
            return StepResult::conflict(record.state);
        }
        return StepResult::proceed(record.state);
    }

    const AssetInfo& input = asset(record.request.source_asset);
    const AssetInfo& output = asset(record.request.destination_asset);

    if (record.convert_tx.empty()) {
        if (clock_->nowMs() >= record.quote.expires_at_ms) {
            if (record.requotes >= config_.max_requotes) {
                return onExternalError(record, ErrorClass::TRANSIENT,
                                       "quote expired after " + std::to_string(record.requotes) + " re-quotes", 0);
            }

            QuotePlan plan = quotes_->quote(input, output, record.stage(Stage::CONVERT).requested_amount,
                                            chain_->walletAddress());
            if (plan.expected_output < record.request.min_output) {
                return settle(record, TransferState::ABORTED, FailureReason::MIN_OUTPUT_NOT_MET,
                              "re-quote " + formatAmount(output.symbol, plan.expected_output) +
                              " below minimum " + formatAmount(output.symbol, record.request.min_output));
            }

            Record next = record;
            next.quote = std::move(plan);
            next.requotes += 1;
            if (!commit(record, std::move(next))) {
                return StepResult::conflict(record.state);
            }
            LOG_INFO("[Transfer] {} re-quoted ({}): {} {}", record.key, record.requotes,
                     formatAmount(output.symbol, record.quote.expected_output), output.symbol);
            return StepResult::proceed(record.state);
        }

        auto approval = ensureApproval(record);
        if (approval) {
            return *approval;
        }

        TransactionIntent intent{record.quote.router_address, record.quote.calldata, record.quote.value};
        SignedTransaction signed_tx = chain_->sign(intent);

        Record checkpoint = record;
        checkpoint.convert_tx = std::move(signed_tx);
        StageProgress& stage = checkpoint.stage(Stage::CONVERT);
        stage.status = StageStatus::SUBMITTED;
        stage.submitted_at_ms = clock_->nowMs();
        stage.attempts += 1;
        if (!commit(record, std::move(checkpoint))) {
            return StepResult::conflict(record.state);
        }
    }

    const std::string tx_hash = chain_->submit(record.convert_tx);

    Record next = advanced(record, TransferState::CONVERT_WAIT);
    next.stage(Stage::CONVERT).external_id = tx_hash;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    LOG_INFO("[Transfer] {} conversion tx {} broadcast", record.key, tx_hash);
    journal(JournalEventType::EXTERNAL_SUBMITTED, record, {
        {"stage", "CONVERT"},
        {"tx_hash", tx_hash},
        {"router", record.quote.router_address}
    });
    return StepResult::proceed(record.state);
}

StepResult TransferOrchestrator::onConvertWait(Record& record) {
    const std::string tx_hash = record.stage(Stage::CONVERT).external_id;
    const AssetInfo& output = asset(record.request.destination_asset);

    const ChainConfirmation confirmation =
        chain_->confirmationsOf(tx_hash, TransferWatch{output, chain_->walletAddress()});

    if (confirmation.status == ChainTxStatus::REVERTED) {
        return settle(record, TransferState::FAILED, FailureReason::EXTERNAL_REJECTED,
                      "conversion tx " + tx_hash + " reverted");
    }

    if (confirmation.status == ChainTxStatus::NOT_FOUND && !record.convert_tx.empty()) {
        LOG_WARN("[Transfer] {} conversion tx {} not seen by node, re-broadcasting", record.key, tx_hash);
        chain_->submit(record.convert_tx);
    }

    if (confirmation.status != ChainTxStatus::SUCCEEDED || confirmation.depth < config_.min_confirmations) {
        if (waitTimedOut(record, config_.chain_wait_timeout_ms)) {
            return settle(record, TransferState::FAILED, FailureReason::CONFIRMATION_TIMEOUT,
                          "conversion tx " + tx_hash + " unconfirmed");
        }
        return keepPolling(record, Stage::CONVERT);
    }

    if (confirmation.observed_amount == 0) {
        return settle(record, TransferState::FAILED, FailureReason::EXTERNAL_REJECTED,
                      "conversion tx " + tx_hash + " confirmed without " + output.symbol + " reaching the wallet");
    }

    Record next = advanced(record, TransferState::DEPOSIT_SUBMIT);
    StageProgress& done = next.stage(Stage::CONVERT);
    done.status = StageStatus::DONE;
    done.observed_amount = confirmation.observed_amount;
    done.has_observed = true;
    done.completed_at_ms = clock_->nowMs();
    next.stage(Stage::DEPOSIT).requested_amount = confirmation.observed_amount;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    LOG_INFO("[Transfer] {} conversion confirmed: {} {}", record.key,
             formatAmount(output.symbol, confirmation.observed_amount), output.symbol);
    return StepResult::proceed(record.state);
}

// ===== DEPOSIT =====

StepResult TransferOrchestrator::onDepositSubmit(Record& record) {
    if (!record.stage(Stage::DEPOSIT).external_id.empty()) {
        if (!commit(record, advanced(record, TransferState::DEPOSIT_WAIT))) {
            return StepResult::conflict(record.state);
        }
        return StepResult::proceed(record.state);
    }

    const AssetInfo& output = asset(record.request.destination_asset);

    if (record.deposit_address.empty()) {
        Record next = record;
        next.deposit_address = ledger_->depositAddressFor(output, record.request.destination_chain);
        if (!commit(record, std::move(next))) {
            return StepResult::conflict(record.state);
        }
    }

    if (record.deposit_tx.empty()) {
        const Amount amount = record.stage(Stage::DEPOSIT).requested_amount;
        SignedTransaction signed_tx = chain_->sign(chain_->transferIntent(output, record.deposit_address, amount));

        Record checkpoint = record;
        checkpoint.deposit_tx = std::move(signed_tx);
        StageProgress& stage = checkpoint.stage(Stage::DEPOSIT);
        stage.status = StageStatus::SUBMITTED;
        stage.submitted_at_ms = clock_->nowMs();
        stage.attempts += 1;
        if (!commit(record, std::move(checkpoint))) {
            return StepResult::conflict(record.state);
        }
    }

    const std::string tx_hash = chain_->submit(record.deposit_tx);

    Record next = advanced(record, TransferState::DEPOSIT_WAIT);
    next.stage(Stage::DEPOSIT).external_id = tx_hash;
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    LOG_INFO("[Transfer] {} deposit tx {} -> {}", record.key, tx_hash, record.deposit_address);
    journal(JournalEventType::EXTERNAL_SUBMITTED, record, {
        {"stage", "DEPOSIT"},
        {"tx_hash", tx_hash},
        {"deposit_address", record.deposit_address}
    });
    return StepResult::proceed(record.state);
}

StepResult TransferOrchestrator::onDepositWait(Record& record) {
    const std::string tx_hash = record.stage(Stage::DEPOSIT).external_id;
    const AssetInfo& output = asset(record.request.destination_asset);

    // Chain confirmation first, then the exchange credit.
    if (!record.stage(Stage::DEPOSIT).has_observed) {
        const ChainConfirmation confirmation =
            chain_->confirmationsOf(tx_hash, TransferWatch{output, record.deposit_address});

        if (confirmation.status == ChainTxStatus::REVERTED) {
            return settle(record, TransferState::FAILED, FailureReason::EXTERNAL_REJECTED,
                          "deposit tx " + tx_hash + " reverted");
        }
        if (confirmation.status == ChainTxStatus::NOT_FOUND && !record.deposit_tx.empty()) {
            LOG_WARN("[Transfer] {} deposit tx {} not seen by node, re-broadcasting", record.key, tx_hash);
            chain_->submit(record.deposit_tx);
        }
        if (confirmation.status != ChainTxStatus::SUCCEEDED || confirmation.depth < config_.min_confirmations) {
            if (waitTimedOut(record, config_.deposit_wait_timeout_ms)) {
                return settle(record, TransferState::FAILED, FailureReason::CONFIRMATION_TIMEOUT,
                              "deposit tx " + tx_hash + " unconfirmed");
            }
            return keepPolling(record, Stage::DEPOSIT);
        }

        if (confirmation.observed_amount != record.stage(Stage::DEPOSIT).requested_amount) {
            LOG_WARN("[Transfer] {} deposit tx {} moved {} {}, expected {}", record.key, tx_hash,
                     formatAmount(output.symbol, confirmation.observed_amount), output.symbol,
                     formatAmount(output.symbol, record.stage(Stage::DEPOSIT).requested_amount));
        }

        Record next = record;
        StageProgress& stage = next.stage(Stage::DEPOSIT);
        stage.status = StageStatus::CONFIRMING;
        stage.observed_amount = confirmation.observed_amount;
        stage.has_observed = true;
        if (!commit(record, std::move(next))) {
            return StepResult::conflict(record.state);
        }
        return StepResult::proceed(record.state);
    }

    const LedgerStatus credit = ledger_->depositStatusOf(output, tx_hash);
    if (credit.status == LedgerOperationStatus::FAILED) {
        return settle(record, TransferState::FAILED, FailureReason::EXTERNAL_REJECTED,
                      "deposit " + tx_hash + " rejected by exchange: " + credit.detail);
    }
    if (credit.status == LedgerOperationStatus::PENDING) {
        if (waitTimedOut(record, config_.deposit_wait_timeout_ms)) {
            return settle(record, TransferState::FAILED, FailureReason::CONFIRMATION_TIMEOUT,
                          "deposit " + tx_hash + " not credited");
        }
        return keepPolling(record, Stage::DEPOSIT);
    }

    Record next = record;
    StageProgress& done = next.stage(Stage::DEPOSIT);
    done.status = StageStatus::DONE;
    if (credit.observed_amount != 0) {
        done.observed_amount = credit.observed_amount;
    }
    done.completed_at_ms = clock_->nowMs();
    next.ledger_deposit_id = credit.external_id;
    return settle(record, settled(next, TransferState::SUCCEEDED, FailureReason::NONE, ""));
}

// ===== Cancellation =====

CancelResult TransferOrchestrator::cancel(const std::string& key) {
    for (int i = 0; i < config_.max_conflict_retries; ++i) {
        const auto loaded = store_->get(key);
        if (!loaded) {
            return CancelResult::NOT_FOUND;
        }

        const Record& record = *loaded;
        if (record.isTerminal() || !Machine::isCancellable(record.state)) {
            LOG_INFO("[Transfer] {} cancel refused in {}", key, stateName(record.state));
            return CancelResult::REFUSED;
        }

        Record next = settled(record, TransferState::ABORTED, FailureReason::CANCELLED,
                              std::string("cancelled in ") + stateName(record.state));
        next.updated_at_ms = clock_->nowMs();

        const CasResult result = store_->compareAndSwap(key, record.version, next);
        if (result == CasResult::OK) {
            next.version = record.version + 1;
            LOG_INFO("[Transfer] {} cancelled in {}", key, stateName(record.state));
            journal(JournalEventType::TRANSFER_CANCELLED, next, {{"from", stateName(record.state)}});
            report(next);
            return CancelResult::OK;
        }
        if (result == CasResult::NOT_FOUND) {
            return CancelResult::NOT_FOUND;
        }
        if (result == CasResult::REJECTED) {
            LOG_ERROR("[Transfer] {} cancel rejected by store in {}", key, stateName(record.state));
            return CancelResult::REFUSED;
        }
        LOG_DEBUG("[Transfer] {} cancel lost CAS ({}), re-reading", key, casResultToString(result));
    }
    return CancelResult::REFUSED;
}

ServiceKind TransferOrchestrator::serviceFor(const std::string& key) const {
    const auto loaded = store_->get(key);
    if (!loaded || loaded->isTerminal()) {
        return ServiceKind::NONE;
    }
    return Machine::serviceFor(loaded->state);
}

// ===== Failure handling =====

StepResult TransferOrchestrator::onExternalError(
    Record& record,
    ErrorClass error_class,
    const std::string& message,
    long long retry_after_ms
) {
    if (error_class == ErrorClass::PERMANENT) {
        LOG_ERROR("[Transfer] {} permanent error in {}: {}", record.key, stateName(record.state), message);
        return settle(record, TransferState::FAILED, FailureReason::PERMANENT_ERROR, message);
    }

    const int attempt = record.state_attempts + 1;
    const auto decision = retry_->decide(error_class, attempt, retry_after_ms);
    if (!decision.retry) {
        LOG_ERROR("[Transfer] {} giving up in {} after {} attempts: {}",
                  record.key, stateName(record.state), attempt, message);
        return settle(record, TransferState::FAILED, FailureReason::RETRIES_EXHAUSTED,
                      "after " + std::to_string(attempt) + " attempts: " + message);
    }

    Record next = record;
    next.state_attempts = attempt;
    next.stage(Machine::stageOf(record.state)).attempts += 1;
    next.not_before_ms = clock_->nowMs() + decision.delay_ms;
    if (record.state == TransferState::CONVERT_SUBMIT) {
        next.requotes = 0;
    }
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    LOG_WARN("[Transfer] {} {} error in {} (attempt {}), retry in {} ms: {}",
             record.key, chainshuttle::execution::errorClassToString(error_class),
             stateName(record.state), attempt, decision.delay_ms, message);
    journal(JournalEventType::RETRY_SCHEDULED, record, {
        {"attempt", attempt},
        {"delay_ms", decision.delay_ms},
        {"class", chainshuttle::execution::errorClassToString(error_class)},
        {"error", message}
    });
    return StepResult::waitUntil(record.state, record.not_before_ms);
}

// ===== Persistence helpers =====

bool TransferOrchestrator::commit(Record& record, Record next) {
    next.updated_at_ms = clock_->nowMs();
    const TransferState from = record.state;

    const CasResult result = store_->compareAndSwap(record.key, record.version, next);
    if (result == CasResult::REJECTED) {
        throw RecordRejectedError(std::string("update rejected by store in ") + stateName(from));
    }
    if (result != CasResult::OK) {
        LOG_DEBUG("[Transfer] {} CAS {} at version {}", record.key, casResultToString(result), record.version);
        return false;
    }

    next.version = record.version + 1;
    record = std::move(next);

    if (record.state != from && !record.isTerminal()) {
        LOG_INFO("[Transfer] {} {} -> {}", record.key, stateName(from), stateName(record.state));
        journal(JournalEventType::STATE_CHANGED, record, {
            {"from", stateName(from)},
            {"version", record.version}
        });
    }
    return true;
}

TransferOrchestrator::Record TransferOrchestrator::advanced(const Record& record, TransferState next_state) const {
    Record next = record;
    next.state = next_state;
    next.state_attempts = 0;
    next.state_entered_at_ms = clock_->nowMs();
    next.not_before_ms = 0;
    return next;
}

TransferOrchestrator::Record TransferOrchestrator::settled(
    const Record& record,
    TransferState terminal_state,
    FailureReason reason,
    const std::string& message
) const {
    Record next = record;
    next.state = terminal_state;
    next.outcome = Machine::outcomeFor(terminal_state);
    next.not_before_ms = 0;
    next.state_entered_at_ms = clock_->nowMs();

    if (terminal_state != TransferState::SUCCEEDED) {
        const Stage failing = Machine::stageOf(record.state);
        next.failure.stage = failing;
        next.failure.reason = reason;
        next.failure.message = message;
        next.failure.funds_moved = record.stage(Stage::WITHDRAW).status == StageStatus::DONE;

        StageProgress& stage = next.stage(failing);
        if (terminal_state == TransferState::FAILED && stage.status != StageStatus::DONE) {
            stage.status = StageStatus::FAILED;
        }
    }
    return next;
}

StepResult TransferOrchestrator::settle(Record& record, Record next) {
    if (!commit(record, std::move(next))) {
        return StepResult::conflict(record.state);
    }

    journal(JournalEventType::TRANSFER_SETTLED, record, {
        {"outcome", transferOutcomeToString(record.outcome)},
        {"reason", failureReasonToString(record.failure.reason)},
        {"message", record.failure.message},
        {"funds_moved", record.failure.funds_moved}
    });
    report(record);

    if (record.state == TransferState::SUCCEEDED) {
        const AssetInfo& output = asset(record.request.destination_asset);
        LOG_INFO("[Transfer] {} SUCCEEDED: {} {} credited (deposit {})", record.key,
                 formatAmount(output.symbol, record.stage(Stage::DEPOSIT).observed_amount),
                 output.symbol, record.ledger_deposit_id);
    } else {
        LOG_ERROR("[Transfer] {} {} at {} ({}): {} [withdrawal={} convert_tx={} deposit_tx={} funds_moved={}]",
                  record.key, stateName(record.state), stageToString(record.failure.stage),
                  failureReasonToString(record.failure.reason), record.failure.message,
                  record.stage(Stage::WITHDRAW).external_id, record.convert_tx.hash,
                  record.deposit_tx.hash, record.failure.funds_moved);
    }
    return StepResult::terminal(record.state);
}

StepResult TransferOrchestrator::settle(
    Record& record,
    TransferState terminal_state,
    FailureReason reason,
    const std::string& message
) {
    Record next = settled(record, terminal_state, reason, message);
    if (record.state == TransferState::WITHDRAW_SUBMIT &&
        record.stage(Stage::WITHDRAW).status == StageStatus::SUBMITTED &&
        record.stage(Stage::WITHDRAW).external_id.empty()) {
        attachWithdrawalReference(next);
    }
    return settle(record, std::move(next));
}

void TransferOrchestrator::attachWithdrawalReference(Record& next) {
    const std::string client_id = ledgerClientIdFor(next.key);
    std::string found_id;
    try {
        const auto found = ledger_->findWithdrawal(client_id);
        if (found) {
            found_id = found->external_id;
        }
    } catch (const ExternalCallError& e) {
        LOG_WARN("[Transfer] {} withdrawal lookup by client id {} failed: {}", next.key, client_id, e.what());
    } catch (const std::exception& e) {
        LOG_WARN("[Transfer] {} withdrawal lookup by client id {} failed: {}", next.key, client_id, e.what());
    }

    next.failure.message += " [withdrawal client id " + client_id;
    if (!found_id.empty()) {
        next.stage(Stage::WITHDRAW).external_id = found_id;
        next.failure.message += ", exchange id " + found_id;
        LOG_WARN("[Transfer] {} withdrawal {} exists at the exchange, check it before retrying", next.key, found_id);
    } else {
        next.failure.message += ", not confirmed at the exchange";
    }
    next.failure.message += "]";
}

StepResult TransferOrchestrator::pollAgain(const Record& record) const {
    return StepResult::waitUntil(record.state, clock_->nowMs() + config_.poll_interval_ms);
}

StepResult TransferOrchestrator::keepPolling(Record& record, Stage stage) {
    if (record.stage(stage).status != StageStatus::CONFIRMING) {
        Record next = record;
        next.stage(stage).status = StageStatus::CONFIRMING;
        if (!commit(record, std::move(next))) {
            return StepResult::conflict(record.state);
        }
    }
    return pollAgain(record);
}

bool TransferOrchestrator::waitTimedOut(const Record& record, long long timeout_ms) const {
    return timeout_ms > 0 && clock_->nowMs() - record.state_entered_at_ms >= timeout_ms;
}

// ===== Validation and reporting =====

std::optional<std::string> TransferOrchestrator::validateRequest(const TransferRequest& request) const {
    if (assets_.find(request.source_asset) == assets_.end()) {
        return "unknown source asset " + request.source_asset;
    }
    if (assets_.find(request.destination_asset) == assets_.end()) {
        return "unknown destination asset " + request.destination_asset;
    }
    if (request.source_asset == request.destination_asset) {
        return std::string("source and destination asset are the same");
    }
    if (request.amount == 0) {
        return std::string("amount must be positive");
    }
    if (request.destination_chain.empty()) {
        return std::string("destination chain missing");
    }
    if (toLower(request.destination_account) != toLower(chain_->walletAddress())) {
        return "destination account " + request.destination_account + " is not the signing wallet";
    }
    return std::nullopt;
}

const AssetInfo& TransferOrchestrator::asset(const std::string& symbol) const {
    const auto it = assets_.find(symbol);
    if (it == assets_.end()) {
        throw std::invalid_argument("unknown asset " + symbol);
    }
    return it->second;
}

void TransferOrchestrator::journal(JournalEventType type, const Record& record, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    JournalEvent event;
    event.ts_ms = clock_->nowMs();
    event.type = type;
    event.transfer_key = record.key;
    event.state = stateName(record.state);
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("[Transfer] {} journal append failed", record.key);
    }
}

void TransferOrchestrator::report(const Record& record) const {
    const std::string final_amount = record.state == TransferState::SUCCEEDED
        ? formatAmount(record.request.destination_asset, record.stage(Stage::DEPOSIT).observed_amount)
        : "";
    Logger::getInstance().logTransfer(
        record.key,
        transferOutcomeToString(record.outcome),
        record.request.source_asset,
        formatAmount(record.request.source_asset, record.request.amount),
        record.request.destination_asset,
        final_amount,
        failureReasonToString(record.failure.reason)
    );
}

std::string TransferOrchestrator::formatAmount(const std::string& symbol, const Amount& amount) const {
    const auto it = assets_.find(symbol);
    if (it == assets_.end()) {
        return common::toDecimalString(amount);
    }
    return common::formatUnits(amount, it->second.decimals);
}

} // namespace core
} // namespace chainshuttle
