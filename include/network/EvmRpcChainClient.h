#pragma once

#include <atomic>
#include <memory>

#include "core/contracts/IChainClient.h"
#include "execution/RateLimiter.h"
#include "network/IHttpClient.h"
#include "network/NetworkConfig.h"

namespace chainshuttle {
namespace network {

// IChainClient over EVM JSON-RPC. Reads go to the node; signing goes to an
// external signer (eth_signTransaction), so no key material lives here.
class EvmRpcChainClient : public core::IChainClient {
public:
    EvmRpcChainClient(ChainConfig config, std::shared_ptr<IHttpClient> http);

    std::string walletAddress() const override { return config_.wallet_address; }

    core::TransactionIntent transferIntent(
        const AssetInfo& asset,
        const std::string& recipient,
        const Amount& amount
    ) const override;

    core::TransactionIntent approvalIntent(
        const AssetInfo& asset,
        const std::string& spender,
        const Amount& amount
    ) const override;

    core::SignedTransaction sign(const core::TransactionIntent& intent) override;
    std::string submit(const core::SignedTransaction& tx) override;
    core::ChainConfirmation confirmationsOf(const std::string& tx_hash, const core::TransferWatch& watch) override;
    Amount balanceOf(const std::string& account, const AssetInfo& asset) override;
    Amount allowance(const std::string& owner, const AssetInfo& asset, const std::string& spender) override;

    // eth_feeHistory over 5 blocks, mean of the non-zero 20th-percentile rewards.
    Amount priorityFee();

private:
    nlohmann::json rpcCall(const std::string& url, const std::string& method, const nlohmann::json& params);
    Amount quantity(const nlohmann::json& value, const std::string& what) const;
    Amount balanceAt(const std::string& account, const AssetInfo& asset, const std::string& block_tag);
    Amount observedAmount(const nlohmann::json& receipt, const core::TransferWatch& watch);

    ChainConfig config_;
    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;
    std::atomic<long long> next_request_id_{1};
};

} // namespace network
} // namespace chainshuttle
