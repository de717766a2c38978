#include "core/orchestration/TransferRunner.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "common/Logger.h"
#include "core/model/TransferSchema.h"

namespace chainshuttle {
namespace core {

TransferRunner::TransferRunner(
    RunnerConfig config,
    std::shared_ptr<TransferOrchestrator> orchestrator,
    std::shared_ptr<const IClock> clock,
    std::shared_ptr<ITransferJournal> journal,
    std::shared_ptr<ServiceBudget> call_budget
)
    : config_(std::move(config))
    , orchestrator_(std::move(orchestrator))
    , clock_(std::move(clock))
    , journal_(std::move(journal))
    , call_budget_(std::move(call_budget))
{
    if (!orchestrator_ || !clock_) {
        throw std::invalid_argument("TransferRunner requires an orchestrator and a clock");
    }
    if (config_.worker_threads < 1) {
        config_.worker_threads = 1;
    }
    if (config_.max_active_transfers < 1) {
        config_.max_active_transfers = 1;
    }
}

TransferRunner::~TransferRunner() {
    stop();
}

void TransferRunner::start() {
    if (running_) {
        LOG_WARN("TransferRunner already running");
        return;
    }
    running_ = true;
    for (int i = 0; i < config_.worker_threads; ++i) {
        workers_.emplace_back(&TransferRunner::workerLoop, this, i);
    }
    LOG_INFO("TransferRunner started: {} workers, max {} active transfers",
             config_.worker_threads, config_.max_active_transfers);
}

void TransferRunner::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    LOG_INFO("TransferRunner stopped ({} transfers still admitted)", activeCount() + backlogCount());
}

// ===== Exposed API =====

TransferRecord TransferRunner::submitTransfer(const TransferRequest& request) {
    auto& store = orchestrator_->store();
    const bool existed = store.get(deriveIdempotencyKey(request)).has_value();

    TransferRecord record = store.create(request, clock_->nowMs());
    if (!existed && journal_) {
        JournalEvent event;
        event.ts_ms = clock_->nowMs();
        event.type = JournalEventType::TRANSFER_ADMITTED;
        event.transfer_key = record.key;
        event.state = transferStateToString(record.state);
        event.payload = toJson(record.request);
        if (!journal_->append(event)) {
            LOG_WARN("[Runner] journal append failed for {}", record.key);
        }
    }

    if (record.isTerminal()) {
        LOG_INFO("[Runner] {} already settled: {}", record.key, transferOutcomeToString(record.outcome));
        return record;
    }

    LOG_INFO("[Runner] {} {} ({})", existed ? "re-admitted" : "admitted", record.key,
             transferStateToString(record.state));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        admitLocked(record.key);
    }
    work_cv_.notify_one();
    return record;
}

std::optional<TransferRecord> TransferRunner::statusOf(const std::string& key) const {
    return orchestrator_->store().get(key);
}

CancelResult TransferRunner::cancel(const std::string& key) {
    const CancelResult result = orchestrator_->cancel(key);
    if (result == CancelResult::OK) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto queued = std::find(backlog_.begin(), backlog_.end(), key);
        if (queued != backlog_.end()) {
            backlog_.erase(queued);
            if (active_.empty() && backlog_.empty()) {
                idle_cv_.notify_all();
            }
        } else if (active_.count(key) && !in_progress_.count(key)) {
            // let a worker observe the terminal record now instead of at its next wake-up
            scheduleLocked(key, clock_->nowMs());
        }
    }
    return result;
}

size_t TransferRunner::resumePending() {
    const auto records = orchestrator_->store().list();
    size_t resumed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records) {
            if (record.isTerminal()) continue;
            if (active_.count(record.key)) continue;
            if (std::find(backlog_.begin(), backlog_.end(), record.key) != backlog_.end()) continue;
            admitLocked(record.key);
            ++resumed;
        }
    }
    if (resumed > 0) {
        LOG_INFO("[Runner] resumed {} pending transfers", resumed);
        work_cv_.notify_all();
    }
    return resumed;
}

bool TransferRunner::waitForIdle(long long timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
        return active_.empty() && backlog_.empty();
    });
}

size_t TransferRunner::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

size_t TransferRunner::backlogCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backlog_.size();
}

std::map<ServiceKind, int> TransferRunner::peakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_flight_;
}

std::map<ServiceKind, int> TransferRunner::peakCallsInFlight() const {
    if (!call_budget_) {
        return {};
    }
    return call_budget_->peakInFlight();
}

// ===== Worker =====

void TransferRunner::workerLoop(int worker_id) {
    LOG_DEBUG("[Runner] worker {} up", worker_id);
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (queue_.empty()) {
            work_cv_.wait(lock);
            continue;
        }

        const long long now = clock_->nowMs();
        if (queue_.top().wake_at_ms > now) {
            work_cv_.wait_for(lock, std::chrono::milliseconds(queue_.top().wake_at_ms - now));
            continue;
        }

        const std::string key = queue_.top().key;
        queue_.pop();
        if (in_progress_.count(key) || !active_.count(key)) {
            continue;
        }
        in_progress_.insert(key);

        lock.unlock();
        ServiceKind service = ServiceKind::NONE;
        try {
            service = orchestrator_->serviceFor(key);
        } catch (const std::exception& e) {
            LOG_ERROR("[Runner] {} unreadable: {}", key, e.what());
        }
        lock.lock();

        if (!acquireBudgetLocked(service)) {
            in_progress_.erase(key);
            scheduleLocked(key, clock_->nowMs() + config_.budget_backoff_ms);
            continue;
        }

        lock.unlock();
        StepResult result = StepResult::conflict(TransferState::INIT);
        bool failed = false;
        try {
            result = orchestrator_->step(key);
        } catch (const std::exception& e) {
            // store I/O failure; the record itself is intact
            LOG_ERROR("[Runner] {} step failed: {}", key, e.what());
            failed = true;
        }
        lock.lock();

        releaseBudgetLocked(service);
        in_progress_.erase(key);

        if (failed) {
            scheduleLocked(key, clock_->nowMs() + config_.error_backoff_ms);
            continue;
        }

        switch (result.kind) {
            case StepResult::Kind::CONTINUE:
            case StepResult::Kind::CONFLICT:
                scheduleLocked(key, clock_->nowMs());
                break;
            case StepResult::Kind::WAIT:
                scheduleLocked(key, result.wake_at_ms);
                break;
            case StepResult::Kind::REJECTED:
                // not a race; re-reading right away would hit the same refusal
                scheduleLocked(key, clock_->nowMs() + config_.error_backoff_ms);
                break;
            case StepResult::Kind::TERMINAL:
                LOG_INFO("[Runner] {} settled as {}", key, transferStateToString(result.state));
                finishLocked(key);
                break;
            case StepResult::Kind::NOT_FOUND:
                LOG_WARN("[Runner] {} disappeared from the store", key);
                finishLocked(key);
                break;
        }
    }

    LOG_DEBUG("[Runner] worker {} down", worker_id);
}

// ===== Locked helpers =====

void TransferRunner::admitLocked(const std::string& key) {
    if (active_.count(key)) {
        return;
    }
    if (static_cast<int>(active_.size()) >= config_.max_active_transfers) {
        if (std::find(backlog_.begin(), backlog_.end(), key) == backlog_.end()) {
            backlog_.push_back(key);
        }
        return;
    }
    active_.insert(key);
    scheduleLocked(key, clock_->nowMs());
}

void TransferRunner::scheduleLocked(const std::string& key, long long wake_at_ms) {
    queue_.push(Scheduled{wake_at_ms, next_seq_++, key});
    work_cv_.notify_one();
}

void TransferRunner::finishLocked(const std::string& key) {
    if (active_.erase(key) == 0) {
        return;
    }
    while (!backlog_.empty() && static_cast<int>(active_.size()) < config_.max_active_transfers) {
        const std::string next = backlog_.front();
        backlog_.pop_front();
        admitLocked(next);
    }
    if (active_.empty() && backlog_.empty()) {
        idle_cv_.notify_all();
    }
}

bool TransferRunner::acquireBudgetLocked(ServiceKind service) {
    const auto budget = config_.service_budgets.find(service);
    if (service == ServiceKind::NONE || budget == config_.service_budgets.end() || budget->second <= 0) {
        in_flight_[service] += 1;
    } else if (in_flight_[service] >= budget->second) {
        return false;
    } else {
        in_flight_[service] += 1;
    }
    peak_in_flight_[service] = std::max(peak_in_flight_[service], in_flight_[service]);
    return true;
}

void TransferRunner::releaseBudgetLocked(ServiceKind service) {
    auto it = in_flight_.find(service);
    if (it != in_flight_.end() && it->second > 0) {
        it->second -= 1;
    }
}

} // namespace core
} // namespace chainshuttle
