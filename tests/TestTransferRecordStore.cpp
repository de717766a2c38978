#include "core/state/InMemoryTransferRecordStore.h"
#include "core/state/TransferRecordStoreJson.h"
#include "core/model/TransferSchema.h"
#include "common/AmountFormat.h"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

using namespace chainshuttle;
using namespace chainshuttle::core;

namespace {

TransferRequest sampleRequest(const std::string& key) {
    TransferRequest r;
    r.source_asset = "USDC";
    r.destination_asset = "ETH";
    r.amount = *common::parseUnits("1000", 6);
    r.destination_chain = "Arbitrum";
    r.destination_account = "0x1111111111111111111111111111111111111111";
    r.min_output = *common::parseUnits("0.3", 18);
    r.deadline_ms = 1700000000000LL + 1800000;
    r.idempotency_key = key;
    return r;
}

void checkContract(ITransferRecordStore& store, const std::string& label) {
    const TransferRecord created = store.create(sampleRequest("rec-1"), 1000);
    assert(created.key == "rec-1");
    assert(created.state == TransferState::INIT);
    assert(created.outcome == TransferOutcome::NONE);

    assert(!store.get("nope").has_value());
    assert(store.compareAndSwap("nope", 1, created) == CasResult::NOT_FOUND);

    TransferRecord next = created;
    next.state = TransferState::WITHDRAW_SUBMIT;
    assert(store.compareAndSwap("rec-1", created.version, next) == CasResult::OK);

    const TransferRecord stored = *store.get("rec-1");
    assert(stored.version == created.version + 1);
    assert(stored.state == TransferState::WITHDRAW_SUBMIT);

    // stale writer
    assert(store.compareAndSwap("rec-1", created.version, next) == CasResult::VERSION_CONFLICT);

    // the pipeline never moves backwards
    TransferRecord back = stored;
    back.state = TransferState::INIT;
    assert(store.compareAndSwap("rec-1", stored.version, back) == CasResult::REJECTED);

    // a recorded external id never changes
    TransferRecord with_id = stored;
    with_id.state = TransferState::WITHDRAW_WAIT;
    with_id.stage(Stage::WITHDRAW).external_id = "wd-9";
    assert(store.compareAndSwap("rec-1", stored.version, with_id) == CasResult::OK);
    TransferRecord rewrite = *store.get("rec-1");
    rewrite.stage(Stage::WITHDRAW).external_id = "wd-10";
    assert(store.compareAndSwap("rec-1", rewrite.version, rewrite) == CasResult::REJECTED);

    // request content is immutable
    TransferRecord tampered = *store.get("rec-1");
    tampered.request.amount = 1;
    assert(store.compareAndSwap("rec-1", tampered.version, tampered) == CasResult::REJECTED);

    // terminal records accept nothing
    TransferRecord done = *store.get("rec-1");
    done.state = TransferState::FAILED;
    done.outcome = TransferOutcome::FAILED;
    done.failure.reason = FailureReason::PERMANENT_ERROR;
    assert(store.compareAndSwap("rec-1", done.version, done) == CasResult::OK);
    TransferRecord after = *store.get("rec-1");
    after.state_attempts = 3;
    assert(store.compareAndSwap("rec-1", after.version, after) == CasResult::REJECTED);

    // re-admission returns the stored record, conflicting content throws
    const TransferRecord readmitted = store.create(sampleRequest("rec-1"), 2000);
    assert(readmitted.version == after.version);
    assert(readmitted.state == TransferState::FAILED);
    TransferRequest other = sampleRequest("rec-1");
    other.destination_asset = "USDT";
    bool conflicted = false;
    try {
        store.create(other, 3000);
    } catch (const ConflictError&) {
        conflicted = true;
    }
    assert(conflicted);

    bool invalid = false;
    try {
        store.create(sampleRequest("../escape"), 3000);
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);

    std::cout << "[TEST] " << label << " contract ok\n";
}

// Writers racing on one version: exactly one wins; losers re-read and retry.
void checkConcurrentCas(ITransferRecordStore& store, const std::string& label) {
    const TransferRecord base = store.create(sampleRequest("race"), 1000);
    constexpr int kWriters = 8;

    std::atomic<int> first_round_wins{0};
    std::atomic<int> first_round_conflicts{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> writers;

    for (int i = 0; i < kWriters; ++i) {
        writers.emplace_back([&, i]() {
            while (!go) {
                std::this_thread::yield();
            }
            TransferRecord mine = base;
            mine.state_attempts = i + 1;
            const CasResult first = store.compareAndSwap("race", base.version, mine);
            if (first == CasResult::OK) {
                ++first_round_wins;
                return;
            }
            assert(first == CasResult::VERSION_CONFLICT);
            ++first_round_conflicts;

            for (;;) {
                TransferRecord fresh = *store.get("race");
                fresh.state_attempts = i + 1;
                if (store.compareAndSwap("race", fresh.version, fresh) == CasResult::OK) {
                    return;
                }
            }
        });
    }
    go = true;
    for (auto& t : writers) {
        t.join();
    }

    assert(first_round_wins == 1);
    assert(first_round_conflicts == kWriters - 1);
    assert(store.get("race")->version == base.version + kWriters);
    std::cout << "[TEST] " << label << " concurrent CAS ok\n";
}

void checkJsonDurability(const std::filesystem::path& dir) {
    {
        TransferRecordStoreJson store(dir);
        TransferRecord r = store.create(sampleRequest("durable"), 1000);
        TransferRecord next = r;
        next.state = TransferState::CONVERT_SUBMIT;
        next.stage(Stage::WITHDRAW).status = StageStatus::DONE;
        next.stage(Stage::WITHDRAW).external_id = "wd-77";
        next.stage(Stage::WITHDRAW).observed_amount = *common::parseUnits("999.5", 6);
        next.stage(Stage::WITHDRAW).has_observed = true;
        next.quote.router_address = "0x3333333333333333333333333333333333333333";
        next.quote.calldata = "0x83bd37f9";
        next.quote.expected_output = std::numeric_limits<Amount>::max();
        next.quote.expires_at_ms = 5000;
        next.convert_tx.raw = "0x02f8";
        next.convert_tx.hash = "0xabc";
        next.stage(Stage::CONVERT).status = StageStatus::SUBMITTED;
        assert(store.compareAndSwap("durable", r.version, next) == CasResult::OK);
    }

    // garbage next to the records is skipped by list()
    {
        std::ofstream junk(dir / "broken.json");
        junk << "{ not json";
    }

    TransferRecordStoreJson reopened(dir);
    const auto r = reopened.get("durable");
    assert(r.has_value());
    assert(r->version == 2);
    assert(r->state == TransferState::CONVERT_SUBMIT);
    assert(r->stage(Stage::WITHDRAW).external_id == "wd-77");
    assert(r->stage(Stage::WITHDRAW).observed_amount == *common::parseUnits("999.5", 6));
    assert(r->quote.expected_output == std::numeric_limits<Amount>::max());
    assert(r->convert_tx.hash == "0xabc");
    assert(r->convert_tx.raw == "0x02f8");
    assert(r->request.min_output == *common::parseUnits("0.3", 18));

    const auto all = reopened.list();
    assert(all.size() == 1);
    assert(all.front().key == "durable");

    bool threw = false;
    try {
        reopened.get("broken");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[TEST] TransferRecordStoreJson reopen ok\n";
}

} // namespace

int main() {
    {
        InMemoryTransferRecordStore memory;
        checkContract(memory, "InMemoryTransferRecordStore");
        checkConcurrentCas(memory, "InMemoryTransferRecordStore");
    }

    const auto root = std::filesystem::temp_directory_path() / "chainshuttle_test_store";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    {
        TransferRecordStoreJson json(root / "contract");
        checkContract(json, "TransferRecordStoreJson");
        checkConcurrentCas(json, "TransferRecordStoreJson");
    }
    checkJsonDurability(root / "durable");
    std::filesystem::remove_all(root, ec);

    std::cout << "[TEST] TransferRecordStore PASSED\n";
    return 0;
}
