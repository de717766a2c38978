#pragma once

#include <map>
#include <memory>
#include <string>

#include "common/Config.h"
#include "core/orchestration/TransferOrchestrator.h"
#include "core/orchestration/TransferRunner.h"
#include "network/IHttpClient.h"

namespace chainshuttle {
namespace engine {

// Owns the production wiring: curl transport, Bitget ledger, EVM chain and
// Odos quotes behind one call budget, JSON record store, JSONL journal,
// orchestrator and runner.
class TransferEngine {
public:
    explicit TransferEngine(const Config& config);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void start();
    void stop();
    bool isRunning() const { return runner_->isRunning(); }

    core::TransferRunner& runner() { return *runner_; }
    core::TransferOrchestrator& orchestrator() { return *orchestrator_; }
    core::ITransferRecordStore& store() { return *store_; }
    const std::map<std::string, AssetInfo>& assets() const { return assets_; }
    const std::string& walletAddress() const { return wallet_address_; }
    const std::string& chainName() const { return chain_name_; }

private:
    std::map<std::string, AssetInfo> assets_;
    std::string wallet_address_;
    std::string chain_name_;

    std::shared_ptr<network::IHttpClient> http_;
    std::shared_ptr<const IClock> clock_;
    std::shared_ptr<core::ITransferRecordStore> store_;
    std::shared_ptr<core::ITransferJournal> journal_;
    std::shared_ptr<core::ServiceBudget> call_budget_;
    std::shared_ptr<core::TransferOrchestrator> orchestrator_;
    std::unique_ptr<core::TransferRunner> runner_;
};

} // namespace engine
} // namespace chainshuttle
