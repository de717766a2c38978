#include "core/orchestration/TransferRunner.h"
#include "core/orchestration/BudgetedClients.h"
#include "core/model/TransferSchema.h"
#include "core/state/InMemoryTransferRecordStore.h"
#include "fakes/FakeClients.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace chainshuttle;
using namespace chainshuttle::core;
using chainshuttle::testing::FakeChain;
using chainshuttle::testing::FakeLedger;
using chainshuttle::testing::FakeQuoteSource;

namespace {

Amount units(const std::string& text, int decimals) {
    return *common::parseUnits(text, decimals);
}

struct Fixture {
    std::shared_ptr<const IClock> clock = std::make_shared<SystemClock>();
    std::shared_ptr<InMemoryTransferRecordStore> store = std::make_shared<InMemoryTransferRecordStore>();
    std::shared_ptr<FakeLedger> ledger = std::make_shared<FakeLedger>();
    std::shared_ptr<FakeChain> chain = std::make_shared<FakeChain>();
    std::shared_ptr<FakeQuoteSource> quotes = std::make_shared<FakeQuoteSource>(clock);
    std::shared_ptr<TransferOrchestrator> orchestrator;

    Fixture() {
        quotes->default_output = units("0.32", 18);
        chain->swap_output = units("0.319", 18);
        ledger->withdraw_pending_polls = 2;
        chain->pending_polls = 1;
        orchestrator = makeOrchestrator(store, ledger, chain, quotes);
    }

    std::shared_ptr<TransferOrchestrator> makeOrchestrator(
        std::shared_ptr<ITransferRecordStore> records,
        std::shared_ptr<ILedgerClient> ledger_client,
        std::shared_ptr<IChainClient> chain_client,
        std::shared_ptr<IQuoteSource> quote_source
    ) const {
        PipelineConfig pipeline;
        pipeline.poll_interval_ms = 10;

        execution::RetryConfig retry;
        retry.base_delay_ms = 5;
        retry.max_delay_ms = 50;
        retry.jitter_fraction = 0.0;

        std::map<std::string, AssetInfo> assets{
            {"USDC", AssetInfo{"USDC", "0xaf88d065e77c8cc2239327c5edb3a432268e5831", 6}},
            {"ETH", AssetInfo{"ETH", "", 18}},
        };
        return std::make_shared<TransferOrchestrator>(
            pipeline, assets, std::move(records), std::move(ledger_client), std::move(chain_client),
            std::move(quote_source), std::make_shared<execution::RetryPolicy>(retry, 3), clock);
    }

    RunnerConfig runnerConfig(int workers, int max_active) const {
        RunnerConfig config;
        config.worker_threads = workers;
        config.max_active_transfers = max_active;
        config.service_budgets = {
            {ServiceKind::LEDGER, 1},
            {ServiceKind::CHAIN, 2},
            {ServiceKind::QUOTE, 1},
        };
        config.budget_backoff_ms = 2;
        config.error_backoff_ms = 20;
        return config;
    }

    TransferRequest request(const std::string& key) const {
        TransferRequest r;
        r.source_asset = "USDC";
        r.destination_asset = "ETH";
        r.amount = units("1000", 6);
        r.destination_chain = "Arbitrum";
        r.destination_account = chain->walletAddress();
        r.min_output = units("0.30", 18);
        r.deadline_ms = clock->nowMs() + 30 * 60 * 1000;
        r.idempotency_key = key;
        return r;
    }
};

void testManyTransfersUnderBudgets() {
    Fixture f;
    TransferRunner runner(f.runnerConfig(4, 5), f.orchestrator, f.clock);

    constexpr int kTransfers = 12;
    for (int i = 0; i < kTransfers; ++i) {
        runner.submitTransfer(f.request("batch-" + std::to_string(i)));
    }
    // admission beyond the active bound waits in the backlog
    assert(runner.activeCount() == 5);
    assert(runner.backlogCount() == kTransfers - 5);

    // duplicate submission maps onto the admitted record
    const TransferRecord dup = runner.submitTransfer(f.request("batch-0"));
    assert(dup.key == "batch-0");
    assert(runner.activeCount() + runner.backlogCount() == kTransfers);

    runner.start();
    assert(runner.waitForIdle(20000));
    runner.stop();

    for (int i = 0; i < kTransfers; ++i) {
        const auto record = runner.statusOf("batch-" + std::to_string(i));
        assert(record.has_value());
        assert(record->state == TransferState::SUCCEEDED);
        assert(record->stage(Stage::DEPOSIT).observed_amount == units("0.319", 18));
    }
    assert(f.ledger->distinctWithdrawals() == kTransfers);
    assert(f.ledger->withdraw_calls == kTransfers);

    const auto peak = runner.peakInFlight();
    assert(peak.at(ServiceKind::LEDGER) <= 1);
    assert(peak.at(ServiceKind::CHAIN) <= 2);
    assert(peak.at(ServiceKind::QUOTE) <= 1);
    std::cout << "[TEST] runner completed " << kTransfers << " transfers\n";
}

void testCancelFromBacklog() {
    Fixture f;
    TransferRunner runner(f.runnerConfig(2, 1), f.orchestrator, f.clock);

    runner.submitTransfer(f.request("first"));
    runner.submitTransfer(f.request("second"));
    assert(runner.backlogCount() == 1);

    assert(runner.cancel("second") == CancelResult::OK);
    assert(runner.backlogCount() == 0);
    assert(runner.statusOf("second")->state == TransferState::ABORTED);
    assert(runner.cancel("nobody") == CancelResult::NOT_FOUND);

    runner.start();
    assert(runner.waitForIdle(20000));
    runner.stop();

    assert(runner.statusOf("first")->state == TransferState::SUCCEEDED);
    assert(f.ledger->distinctWithdrawals() == 1);
}

void testResumePending() {
    Fixture f;

    // a previous process got this far before stopping
    const TransferRecord admitted = f.store->create(f.request("left-over"), f.clock->nowMs());
    TransferRecord progressed = admitted;
    progressed.state = TransferState::WITHDRAW_SUBMIT;
    assert(f.store->compareAndSwap(admitted.key, admitted.version, progressed) == CasResult::OK);

    const TransferRecord settled_base = f.store->create(f.request("settled"), f.clock->nowMs());
    TransferRecord settled = settled_base;
    settled.state = TransferState::ABORTED;
    settled.outcome = TransferOutcome::ABORTED;
    settled.failure.reason = FailureReason::CANCELLED;
    assert(f.store->compareAndSwap(settled.key, settled_base.version, settled) == CasResult::OK);

    TransferRunner runner(f.runnerConfig(2, 4), f.orchestrator, f.clock);
    assert(runner.resumePending() == 1);
    assert(runner.resumePending() == 0);

    runner.start();
    assert(runner.waitForIdle(20000));
    runner.stop();

    assert(runner.statusOf("left-over")->state == TransferState::SUCCEEDED);
    assert(runner.statusOf("settled")->state == TransferState::ABORTED);
}

// Sits under the budget and measures how many ledger calls really overlap.
class OverlapCountingLedger : public ILedgerClient {
public:
    OverlapCountingLedger(std::shared_ptr<ILedgerClient> inner, int call_ms)
        : inner_(std::move(inner)), call_ms_(call_ms) {}

    std::string withdraw(const AssetInfo& asset, const std::string& chain, const Amount& amount,
                         const std::string& destination, const std::string& client_id) override {
        Overlap overlap(*this);
        return inner_->withdraw(asset, chain, amount, destination, client_id);
    }
    std::optional<LedgerStatus> findWithdrawal(const std::string& client_id) override {
        Overlap overlap(*this);
        return inner_->findWithdrawal(client_id);
    }
    std::string depositAddressFor(const AssetInfo& asset, const std::string& chain) override {
        Overlap overlap(*this);
        return inner_->depositAddressFor(asset, chain);
    }
    LedgerStatus statusOf(const std::string& withdrawal_id) override {
        Overlap overlap(*this);
        return inner_->statusOf(withdrawal_id);
    }
    LedgerStatus depositStatusOf(const AssetInfo& asset, const std::string& tx_hash) override {
        Overlap overlap(*this);
        return inner_->depositStatusOf(asset, tx_hash);
    }

    int peak() const { return peak_.load(); }
    int calls() const { return calls_.load(); }

private:
    struct Overlap {
        explicit Overlap(OverlapCountingLedger& owner) : owner_(owner) {
            const int now = ++owner_.current_;
            ++owner_.calls_;
            int seen = owner_.peak_.load();
            while (now > seen && !owner_.peak_.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(owner_.call_ms_));
        }
        ~Overlap() { --owner_.current_; }
        OverlapCountingLedger& owner_;
    };

    std::shared_ptr<ILedgerClient> inner_;
    int call_ms_;
    std::atomic<int> current_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
};

void testCallBudgetHoldsAcrossStates() {
    Fixture f;
    f.ledger->withdraw_pending_polls = 0;
    f.chain->pending_polls = 0;
    auto counting = std::make_shared<OverlapCountingLedger>(f.ledger, 20);

    RunnerConfig config = f.runnerConfig(8, 8);
    config.service_budgets[ServiceKind::CHAIN] = 8;
    auto budget = std::make_shared<ServiceBudget>(config.service_budgets);

    // deposit states are labelled CHAIN but call the exchange too
    auto orchestrator = f.makeOrchestrator(
        f.store,
        std::make_shared<BudgetedLedgerClient>(counting, budget),
        std::make_shared<BudgetedChainClient>(f.chain, budget),
        std::make_shared<BudgetedQuoteSource>(f.quotes, budget));
    TransferRunner runner(config, orchestrator, f.clock, nullptr, budget);

    constexpr int kTransfers = 8;
    for (int i = 0; i < kTransfers; ++i) {
        runner.submitTransfer(f.request("budget-" + std::to_string(i)));
    }
    runner.start();
    assert(runner.waitForIdle(60000));
    runner.stop();

    for (int i = 0; i < kTransfers; ++i) {
        assert(runner.statusOf("budget-" + std::to_string(i))->state == TransferState::SUCCEEDED);
    }
    // withdraw, status, deposit address and deposit credit per transfer
    assert(counting->calls() >= kTransfers * 4);
    assert(counting->peak() == 1);
    assert(runner.peakCallsInFlight().at(ServiceKind::LEDGER) == 1);
    assert(runner.peakCallsInFlight().at(ServiceKind::CHAIN) <= 8);
    assert(budget->inFlight(ServiceKind::LEDGER) == 0);
    std::cout << "[TEST] per-call ledger budget PASSED\n";
}

// Refuses every write after admission.
class RefusingStore : public ITransferRecordStore {
public:
    explicit RefusingStore(std::shared_ptr<ITransferRecordStore> inner) : inner_(std::move(inner)) {}

    TransferRecord create(const TransferRequest& request, long long now_ms) override {
        return inner_->create(request, now_ms);
    }
    std::optional<TransferRecord> get(const std::string& key) const override {
        return inner_->get(key);
    }
    CasResult compareAndSwap(const std::string&, std::uint64_t, const TransferRecord&) override {
        ++writes;
        return CasResult::REJECTED;
    }
    std::vector<TransferRecord> list() const override {
        return inner_->list();
    }

    std::atomic<int> writes{0};

private:
    std::shared_ptr<ITransferRecordStore> inner_;
};

void testRefusedWritesBackOff() {
    Fixture f;
    auto store = std::make_shared<RefusingStore>(f.store);
    auto orchestrator = f.makeOrchestrator(store, f.ledger, f.chain, f.quotes);

    RunnerConfig config = f.runnerConfig(2, 4);
    config.error_backoff_ms = 50;
    TransferRunner runner(config, orchestrator, f.clock);
    runner.submitTransfer(f.request("refused"));

    runner.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    // still admitted, but stepped once per backoff rather than in a tight loop
    assert(runner.activeCount() == 1);
    runner.stop();

    assert(store->writes.load() >= 1);
    assert(store->writes.load() <= 10);
    assert(runner.statusOf("refused")->state == TransferState::INIT);
    assert(f.ledger->withdraw_calls == 0);
    std::cout << "[TEST] refused writes back off PASSED\n";
}

} // namespace

int main() {
    testManyTransfersUnderBudgets();
    testCancelFromBacklog();
    testResumePending();
    testCallBudgetHoldsAcrossStates();
    testRefusedWritesBackOff();

    std::cout << "[TEST] TransferRunner PASSED\n";
    return 0;
}
