#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/contracts/IChainClient.h"
#include "core/contracts/ILedgerClient.h"
#include "core/contracts/IQuoteSource.h"
#include "core/orchestration/ServiceBudget.h"

namespace chainshuttle {
namespace core {

// Decorators that hold a ServiceBudget slot around every remote call of the
// wrapped client. Whatever state a step is in, each leaf call is charged to
// the leaf it actually reaches.

class BudgetedLedgerClient : public ILedgerClient {
public:
    BudgetedLedgerClient(std::shared_ptr<ILedgerClient> inner, std::shared_ptr<ServiceBudget> budget);

    std::string withdraw(
        const AssetInfo& asset,
        const std::string& chain,
        const Amount& amount,
        const std::string& destination_address,
        const std::string& client_id
    ) override;
    std::optional<LedgerStatus> findWithdrawal(const std::string& client_id) override;
    std::string depositAddressFor(const AssetInfo& asset, const std::string& chain) override;
    LedgerStatus statusOf(const std::string& withdrawal_id) override;
    LedgerStatus depositStatusOf(const AssetInfo& asset, const std::string& tx_hash) override;

private:
    std::shared_ptr<ILedgerClient> inner_;
    std::shared_ptr<ServiceBudget> budget_;
};

// walletAddress() and the intent builders are local and stay unbudgeted.
class BudgetedChainClient : public IChainClient {
public:
    BudgetedChainClient(std::shared_ptr<IChainClient> inner, std::shared_ptr<ServiceBudget> budget);

    std::string walletAddress() const override;
    TransactionIntent transferIntent(
        const AssetInfo& asset,
        const std::string& recipient,
        const Amount& amount
    ) const override;
    TransactionIntent approvalIntent(
        const AssetInfo& asset,
        const std::string& spender,
        const Amount& amount
    ) const override;

    SignedTransaction sign(const TransactionIntent& intent) override;
    std::string submit(const SignedTransaction& tx) override;
    ChainConfirmation confirmationsOf(const std::string& tx_hash, const TransferWatch& watch) override;
    Amount balanceOf(const std::string& account, const AssetInfo& asset) override;
    Amount allowance(const std::string& owner, const AssetInfo& asset, const std::string& spender) override;

private:
    std::shared_ptr<IChainClient> inner_;
    std::shared_ptr<ServiceBudget> budget_;
};

class BudgetedQuoteSource : public IQuoteSource {
public:
    BudgetedQuoteSource(std::shared_ptr<IQuoteSource> inner, std::shared_ptr<ServiceBudget> budget);

    QuotePlan quote(
        const AssetInfo& input,
        const AssetInfo& output,
        const Amount& amount,
        const std::string& user_address
    ) override;

private:
    std::shared_ptr<IQuoteSource> inner_;
    std::shared_ptr<ServiceBudget> budget_;
};

} // namespace core
} // namespace chainshuttle
