#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/Clock.h"
#include "core/contracts/ITransferJournal.h"
#include "core/orchestration/PipelineConfig.h"
#include "core/orchestration/ServiceBudget.h"
#include "core/orchestration/TransferOrchestrator.h"

namespace chainshuttle {
namespace core {

// Runs many transfers concurrently on a fixed worker pool.
//
// Each admitted transfer is a single step-loop: exactly one worker steps a
// given key at a time. Waiting transfers sit in a wake-time queue; workers
// sleep on a condition variable until the earliest wake-up or new work.
// Steps are gated by the leaf their state calls first, so one slow service
// cannot occupy every worker. The hard per-call cap is the ServiceBudget
// held by the orchestrator's budgeted clients (see BudgetedClients.h); pass
// the same budget here to report its peaks.
class TransferRunner {
public:
    TransferRunner(
        RunnerConfig config,
        std::shared_ptr<TransferOrchestrator> orchestrator,
        std::shared_ptr<const IClock> clock,
        std::shared_ptr<ITransferJournal> journal = nullptr,
        std::shared_ptr<ServiceBudget> call_budget = nullptr
    );
    ~TransferRunner();

    TransferRunner(const TransferRunner&) = delete;
    TransferRunner& operator=(const TransferRunner&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Admits (or re-admits) a request. Throws ConflictError when the key is
    // taken by a different request, std::invalid_argument for a bad key.
    TransferRecord submitTransfer(const TransferRequest& request);

    std::optional<TransferRecord> statusOf(const std::string& key) const;

    CancelResult cancel(const std::string& key);

    // Re-admits every non-terminal record in the store; returns how many.
    size_t resumePending();

    // Blocks until no admitted transfer is left or timeout_ms passes.
    bool waitForIdle(long long timeout_ms);

    size_t activeCount() const;
    size_t backlogCount() const;

    // Highest number of concurrent steps seen per service label, for monitoring.
    std::map<ServiceKind, int> peakInFlight() const;

    // Highest number of concurrent external calls per leaf; empty without a call budget.
    std::map<ServiceKind, int> peakCallsInFlight() const;

private:
    struct Scheduled {
        long long wake_at_ms;
        std::uint64_t seq;
        std::string key;
    };

    struct LaterFirst {
        bool operator()(const Scheduled& a, const Scheduled& b) const {
            if (a.wake_at_ms != b.wake_at_ms) return a.wake_at_ms > b.wake_at_ms;
            return a.seq > b.seq;
        }
    };

    void workerLoop(int worker_id);

    // All of the below expect mutex_ held.
    void admitLocked(const std::string& key);
    void scheduleLocked(const std::string& key, long long wake_at_ms);
    void finishLocked(const std::string& key);
    bool acquireBudgetLocked(ServiceKind service);
    void releaseBudgetLocked(ServiceKind service);

    RunnerConfig config_;
    std::shared_ptr<TransferOrchestrator> orchestrator_;
    std::shared_ptr<const IClock> clock_;
    std::shared_ptr<ITransferJournal> journal_;
    std::shared_ptr<ServiceBudget> call_budget_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::priority_queue<Scheduled, std::vector<Scheduled>, LaterFirst> queue_;
    std::uint64_t next_seq_ = 0;
    std::set<std::string> active_;
    std::set<std::string> in_progress_;
    std::deque<std::string> backlog_;
    std::map<ServiceKind, int> in_flight_;
    std::map<ServiceKind, int> peak_in_flight_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
};

} // namespace core
} // namespace chainshuttle
