#pragma once

#include <map>

#include "common/Types.h"

namespace chainshuttle {
namespace core {

// Orchestrator timing and policy
struct PipelineConfig {
    long long poll_interval_ms = 5000;               // between *_WAIT polls
    long long withdraw_wait_timeout_ms = 30 * 60 * 1000;
    long long chain_wait_timeout_ms = 10 * 60 * 1000; // CONVERT_WAIT and approvals
    long long deposit_wait_timeout_ms = 60 * 60 * 1000;
    int min_confirmations = 1;
    int max_requotes = 1;                            // per CONVERT_SUBMIT attempt
    bool unlimited_approval = false;                 // approve 2^256-1 instead of the input amount
    int max_conflict_retries = 8;                    // cancel() re-reads
};

// Runner concurrency limits
struct RunnerConfig {
    int worker_threads = 4;
    int max_active_transfers = 32;
    // max concurrent external calls per leaf; also gates steps by state label
    std::map<ServiceKind, int> service_budgets = {
        {ServiceKind::LEDGER, 2},
        {ServiceKind::CHAIN, 4},
        {ServiceKind::QUOTE, 2},
    };
    long long budget_backoff_ms = 250;               // re-check delay when a budget is full
    long long error_backoff_ms = 5000;               // after an unexpected step failure
};

} // namespace core
} // namespace chainshuttle
