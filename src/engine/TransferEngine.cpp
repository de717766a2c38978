#include "engine/TransferEngine.h"

#include <stdexcept>

#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/orchestration/BudgetedClients.h"
#include "core/state/TransferJournalJsonl.h"
#include "core/state/TransferRecordStoreJson.h"
#include "execution/RetryPolicy.h"
#include "network/BitgetHttpClient.h"
#include "network/BitgetLedgerClient.h"
#include "network/CurlHttpClient.h"
#include "network/EvmRpcChainClient.h"
#include "network/OdosQuoteSource.h"

namespace chainshuttle {
namespace engine {

TransferEngine::TransferEngine(const Config& config)
    : assets_(config.getAssets())
    , wallet_address_(config.getChainConfig().wallet_address)
    , chain_name_(config.getChainConfig().name)
{
    if (wallet_address_.empty()) {
        throw std::runtime_error("chain.wallet_address is not configured");
    }
    if (assets_.empty()) {
        throw std::runtime_error("no assets configured");
    }

    const auto& http_config = config.getHttpConfig();
    http_ = std::make_shared<network::CurlHttpClient>(http_config.proxy, http_config.timeout_seconds);
    clock_ = std::make_shared<SystemClock>();

    const auto& storage = config.getStorageConfig();
    store_ = std::make_shared<core::TransferRecordStoreJson>(
        utils::PathUtils::resolveRelativePath(storage.records_dir));
    journal_ = std::make_shared<core::TransferJournalJsonl>(
        utils::PathUtils::resolveRelativePath(storage.journal_path));

    auto bitget = std::make_shared<network::BitgetHttpClient>(config.getBitgetConfig(), http_);
    auto ledger = std::make_shared<network::BitgetLedgerClient>(bitget, assets_);
    auto chain = std::make_shared<network::EvmRpcChainClient>(config.getChainConfig(), http_);
    auto quotes = std::make_shared<network::OdosQuoteSource>(
        config.getOdosConfig(), config.getChainConfig().chain_id, http_, clock_);
    auto retry = std::make_shared<execution::RetryPolicy>(config.getRetryConfig());

    // every leaf call holds a slot of its own service, whichever state makes it
    call_budget_ = std::make_shared<core::ServiceBudget>(config.getRunnerConfig().service_budgets);

    orchestrator_ = std::make_shared<core::TransferOrchestrator>(
        config.getPipelineConfig(),
        assets_,
        store_,
        std::make_shared<core::BudgetedLedgerClient>(ledger, call_budget_),
        std::make_shared<core::BudgetedChainClient>(chain, call_budget_),
        std::make_shared<core::BudgetedQuoteSource>(quotes, call_budget_),
        retry,
        clock_,
        journal_
    );
    runner_ = std::make_unique<core::TransferRunner>(
        config.getRunnerConfig(), orchestrator_, clock_, journal_, call_budget_);

    LOG_INFO("TransferEngine ready: wallet {} on {}, {} assets, records in {}",
             wallet_address_, chain_name_, assets_.size(), storage.records_dir);
}

TransferEngine::~TransferEngine() {
    stop();
}

void TransferEngine::start() {
    runner_->start();
    runner_->resumePending();
}

void TransferEngine::stop() {
    if (runner_) {
        runner_->stop();
    }
}

} // namespace engine
} // namespace chainshuttle
