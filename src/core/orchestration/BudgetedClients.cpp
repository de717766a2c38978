#include "core/orchestration/BudgetedClients.h"

#include <stdexcept>
#include <utility>

namespace chainshuttle {
namespace core {

namespace {

template <typename T>
std::shared_ptr<T> required(std::shared_ptr<T> inner, const std::shared_ptr<ServiceBudget>& budget, const char* what) {
    if (!inner || !budget) {
        throw std::invalid_argument(std::string(what) + " requires a client and a budget");
    }
    return inner;
}

} // namespace

// ===== Ledger =====

BudgetedLedgerClient::BudgetedLedgerClient(std::shared_ptr<ILedgerClient> inner, std::shared_ptr<ServiceBudget> budget)
    : inner_(required(std::move(inner), budget, "BudgetedLedgerClient"))
    , budget_(std::move(budget))
{
}

std::string BudgetedLedgerClient::withdraw(
    const AssetInfo& asset,
    const std::string& chain,
    const Amount& amount,
    const std::string& destination_address,
    const std::string& client_id
) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::LEDGER);
    return inner_->withdraw(asset, chain, amount, destination_address, client_id);
}

std::optional<LedgerStatus> BudgetedLedgerClient::findWithdrawal(const std::string& client_id) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::LEDGER);
    return inner_->findWithdrawal(client_id);
}

std::string BudgetedLedgerClient::depositAddressFor(const AssetInfo& asset, const std::string& chain) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::LEDGER);
    return inner_->depositAddressFor(asset, chain);
}

LedgerStatus BudgetedLedgerClient::statusOf(const std::string& withdrawal_id) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::LEDGER);
    return inner_->statusOf(withdrawal_id);
}

LedgerStatus BudgetedLedgerClient::depositStatusOf(const AssetInfo& asset, const std::string& tx_hash) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::LEDGER);
    return inner_->depositStatusOf(asset, tx_hash);
}

// ===== Chain =====

BudgetedChainClient::BudgetedChainClient(std::shared_ptr<IChainClient> inner, std::shared_ptr<ServiceBudget> budget)
    : inner_(required(std::move(inner), budget, "BudgetedChainClient"))
    , budget_(std::move(budget))
{
}

std::string BudgetedChainClient::walletAddress() const {
    return inner_->walletAddress();
}

TransactionIntent BudgetedChainClient::transferIntent(
    const AssetInfo& asset,
    const std::string& recipient,
    const Amount& amount
) const {
    return inner_->transferIntent(asset, recipient, amount);
}

TransactionIntent BudgetedChainClient::approvalIntent(
    const AssetInfo& asset,
    const std::string& spender,
    const Amount& amount
) const {
    return inner_->approvalIntent(asset, spender, amount);
}

SignedTransaction BudgetedChainClient::sign(const TransactionIntent& intent) {
    // nonce and fee lookups go to the node
    ServiceBudget::Slot slot(*budget_, ServiceKind::CHAIN);
    return inner_->sign(intent);
}

std::string BudgetedChainClient::submit(const SignedTransaction& tx) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::CHAIN);
    return inner_->submit(tx);
}

ChainConfirmation BudgetedChainClient::confirmationsOf(const std::string& tx_hash, const TransferWatch& watch) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::CHAIN);
    return inner_->confirmationsOf(tx_hash, watch);
}

Amount BudgetedChainClient::balanceOf(const std::string& account, const AssetInfo& asset) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::CHAIN);
    return inner_->balanceOf(account, asset);
}

Amount BudgetedChainClient::allowance(const std::string& owner, const AssetInfo& asset, const std::string& spender) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::CHAIN);
    return inner_->allowance(owner, asset, spender);
}

// ===== Quotes =====

BudgetedQuoteSource::BudgetedQuoteSource(std::shared_ptr<IQuoteSource> inner, std::shared_ptr<ServiceBudget> budget)
    : inner_(required(std::move(inner), budget, "BudgetedQuoteSource"))
    , budget_(std::move(budget))
{
}

QuotePlan BudgetedQuoteSource::quote(
    const AssetInfo& input,
    const AssetInfo& output,
    const Amount& amount,
    const std::string& user_address
) {
    ServiceBudget::Slot slot(*budget_, ServiceKind::QUOTE);
    return inner_->quote(input, output, amount, user_address);
}

} // namespace core
} // namespace chainshuttle
