#include "network/EvmRpcChainClient.h"

#include <algorithm>
#include <cctype>
#include <limits>

#include "common/AmountFormat.h"
#include "common/Logger.h"
#include "execution/ErrorClassifier.h"
#include "network/EvmAbi.h"

namespace chainshuttle {
namespace network {

namespace {
using execution::ErrorClass;
using execution::ExternalCallError;

// Multiplier applied in integer permille to keep fee math exact.
Amount scaled(const Amount& value, double factor) {
    const auto permille = static_cast<unsigned long long>(std::max(0.0, factor) * 1000.0 + 0.5);
    return value * permille / 1000;
}

std::string lowerHex(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string stringOf(const nlohmann::json& node, const char* key) {
    if (!node.is_object() || !node.contains(key) || !node[key].is_string()) {
        return "";
    }
    return node[key].get<std::string>();
}
} // namespace

EvmRpcChainClient::EvmRpcChainClient(ChainConfig config, std::shared_ptr<IHttpClient> http)
    : config_(std::move(config))
    , http_(std::move(http))
    , rate_limiter_(std::make_shared<execution::RateLimiter>(
          std::map<std::string, int>{{"rpc", config_.rate_limit_per_second}}, config_.rate_limit_per_second))
{
    if (!http_) {
        throw std::invalid_argument("EvmRpcChainClient requires an http transport");
    }
}

nlohmann::json EvmRpcChainClient::rpcCall(const std::string& url, const std::string& method, const nlohmann::json& params) {
    rate_limiter_->acquire("rpc");

    nlohmann::json request;
    request["jsonrpc"] = "2.0";
    request["id"] = next_request_id_.fetch_add(1);
    request["method"] = method;
    request["params"] = params;

    auto response = http_->post(url, request.dump(), {{"Content-Type", "application/json"}});
    const long long retry_after_ms = execution::ErrorClassifier::parseRetryAfterMs(response.header("Retry-After"));
    if (response.isRateLimited()) {
        rate_limiter_->handleRateLimitError(retry_after_ms);
    }
    if (!response.isSuccess()) {
        throw ExternalCallError(execution::ErrorClassifier::classifyHttpStatus(response.status_code),
            method + " HTTP " + std::to_string(response.status_code), retry_after_ms);
    }

    nlohmann::json reply;
    try {
        reply = response.json();
    } catch (const nlohmann::json::exception& e) {
        throw ExternalCallError(ErrorClass::TRANSIENT, method + " returned invalid JSON: " + e.what());
    }
    if (!reply.is_object()) {
        throw ExternalCallError(ErrorClass::TRANSIENT, method + " returned a non-object reply");
    }

    if (reply.contains("error") && !reply["error"].is_null()) {
        const auto& error = reply["error"];
        const int code = error.is_object() && error.contains("code") && error["code"].is_number_integer()
            ? error["code"].get<int>() : 0;
        const std::string message = stringOf(error, "message");
        throw ExternalCallError(execution::ErrorClassifier::classifyRpcError(code, message),
            method + ": " + message, retry_after_ms);
    }
    return reply.contains("result") ? reply["result"] : nlohmann::json();
}

Amount EvmRpcChainClient::quantity(const nlohmann::json& value, const std::string& what) const {
    if (value.is_string()) {
        const auto parsed = common::fromHexQuantity(value.get<std::string>());
        if (parsed) {
            return *parsed;
        }
    }
    throw ExternalCallError(ErrorClass::TRANSIENT, "malformed quantity for " + what + ": " + value.dump());
}

core::TransactionIntent EvmRpcChainClient::transferIntent(
    const AssetInfo& asset,
    const std::string& recipient,
    const Amount& amount
) const {
    core::TransactionIntent intent;
    if (asset.isNative()) {
        intent.to = recipient;
        intent.data = "0x";
        intent.value = amount;
    } else {
        intent.to = asset.token_address;
        intent.data = evm::encodeTransfer(recipient, amount);
    }
    return intent;
}

core::TransactionIntent EvmRpcChainClient::approvalIntent(
    const AssetInfo& asset,
    const std::string& spender,
    const Amount& amount
) const {
    if (asset.isNative()) {
        throw std::invalid_argument("native asset " + asset.symbol + " needs no approval");
    }
    core::TransactionIntent intent;
    intent.to = asset.token_address;
    intent.data = evm::encodeApprove(spender, amount);
    return intent;
}

Amount EvmRpcChainClient::priorityFee() {
    const auto history = rpcCall(config_.rpc_url, "eth_feeHistory",
                                 nlohmann::json::array({"0x5", "latest", nlohmann::json::array({20.0})}));
    Amount sum = 0;
    unsigned count = 0;
    if (history.is_object() && history.contains("reward") && history["reward"].is_array()) {
        for (const auto& block : history["reward"]) {
            if (!block.is_array() || block.empty()) {
                continue;
            }
            const Amount reward = quantity(block[0], "reward");
            if (reward != 0) {
                sum += reward;
                ++count;
            }
        }
    }
    // round(sum / n)
    const Amount divisor = std::max(1u, count);
    return (sum + divisor / 2) / divisor;
}

core::SignedTransaction EvmRpcChainClient::sign(const core::TransactionIntent& intent) {
    if (!evm::normalizeAddress(config_.wallet_address)) {
        throw ExternalCallError(ErrorClass::PERMANENT, "chain.wallet_address is not configured");
    }
    if (!evm::normalizeAddress(intent.to)) {
        throw ExternalCallError(ErrorClass::PERMANENT, "invalid transaction target: " + intent.to);
    }

    nlohmann::json call;
    call["from"] = config_.wallet_address;
    call["to"] = intent.to;
    call["data"] = intent.data.empty() ? "0x" : intent.data;
    call["value"] = common::toHexQuantity(intent.value);

    const Amount nonce = quantity(
        rpcCall(config_.rpc_url, "eth_getTransactionCount", nlohmann::json::array({config_.wallet_address, "pending"})),
        "nonce");
    const Amount gas_estimate = quantity(rpcCall(config_.rpc_url, "eth_estimateGas", nlohmann::json::array({call})), "gas");
    const Amount gas_price = quantity(rpcCall(config_.rpc_url, "eth_gasPrice", nlohmann::json::array()), "gasPrice");

    nlohmann::json tx = call;
    tx["nonce"] = common::toHexQuantity(nonce);
    tx["gas"] = common::toHexQuantity(scaled(gas_estimate, config_.gas_limit_multiplier));
    tx["chainId"] = common::toHexQuantity(Amount(config_.chain_id));

    if (config_.eip1559) {
        Amount priority = priorityFee();
        const Amount max_fee = gas_price + scaled(priority, 1.05 * config_.gas_price_multiplier);
        if (priority > max_fee) {
            priority = scaled(max_fee, 0.95);
        }
        tx["type"] = "0x2";
        tx["maxFeePerGas"] = common::toHexQuantity(max_fee);
        tx["maxPriorityFeePerGas"] = common::toHexQuantity(priority);
    } else {
        tx["gasPrice"] = common::toHexQuantity(scaled(gas_price, 1.2 * config_.gas_price_multiplier));
    }

    const auto signed_reply = rpcCall(config_.signer_url, "eth_signTransaction", nlohmann::json::array({tx}));

    core::SignedTransaction signed_tx;
    signed_tx.raw = stringOf(signed_reply, "raw");
    if (signed_reply.is_object() && signed_reply.contains("tx")) {
        signed_tx.hash = lowerHex(stringOf(signed_reply["tx"], "hash"));
    }
    if (signed_tx.raw.empty() || signed_tx.hash.empty()) {
        throw ExternalCallError(ErrorClass::PERMANENT, "signer reply lacks raw transaction or hash");
    }

    LOG_INFO("[Chain] signed tx {} nonce={} to={}", signed_tx.hash, common::toDecimalString(nonce), intent.to);
    return signed_tx;
}

std::string EvmRpcChainClient::submit(const core::SignedTransaction& tx) {
    try {
        const auto result = rpcCall(config_.rpc_url, "eth_sendRawTransaction", nlohmann::json::array({tx.raw}));
        const std::string node_hash = result.is_string() ? lowerHex(result.get<std::string>()) : "";
        if (!node_hash.empty() && node_hash != lowerHex(tx.hash)) {
            LOG_WARN("[Chain] node reported hash {} for signed tx {}", node_hash, tx.hash);
        }
    } catch (const ExternalCallError& e) {
        if (!execution::ErrorClassifier::isAlreadyKnown(e.what())) {
            throw;
        }
        LOG_INFO("[Chain] tx {} already known to the node: {}", tx.hash, e.what());
    }
    return tx.hash;
}

core::ChainConfirmation EvmRpcChainClient::confirmationsOf(const std::string& tx_hash, const core::TransferWatch& watch) {
    core::ChainConfirmation confirmation;

    const auto receipt = rpcCall(config_.rpc_url, "eth_getTransactionReceipt", nlohmann::json::array({tx_hash}));
    if (receipt.is_null()) {
        const auto pending = rpcCall(config_.rpc_url, "eth_getTransactionByHash", nlohmann::json::array({tx_hash}));
        confirmation.status = pending.is_null() ? core::ChainTxStatus::NOT_FOUND : core::ChainTxStatus::PENDING;
        return confirmation;
    }

    const Amount block = quantity(receipt.value("blockNumber", nlohmann::json()), "blockNumber");
    const Amount head = quantity(rpcCall(config_.rpc_url, "eth_blockNumber", nlohmann::json::array()), "blockNumber");
    confirmation.depth = head >= block ? Amount(head - block + 1).convert_to<long long>() : 1;

    const std::string status = stringOf(receipt, "status");
    if (status == "0x1") {
        confirmation.status = core::ChainTxStatus::SUCCEEDED;
        confirmation.observed_amount = observedAmount(receipt, watch);
    } else {
        confirmation.status = core::ChainTxStatus::REVERTED;
    }
    return confirmation;
}

Amount EvmRpcChainClient::observedAmount(const nlohmann::json& receipt, const core::TransferWatch& watch) {
    if (watch.recipient.empty()) {
        return 0;
    }

    if (!watch.asset.isNative()) {
        const std::string recipient_topic = evm::addressTopic(watch.recipient);
        Amount total = 0;
        if (receipt.contains("logs") && receipt["logs"].is_array()) {
            for (const auto& log : receipt["logs"]) {
                if (!evm::sameAddress(stringOf(log, "address"), watch.asset.token_address)) {
                    continue;
                }
                if (!log.contains("topics") || !log["topics"].is_array() || log["topics"].size() < 3) {
                    continue;
                }
                const auto& topics = log["topics"];
                if (!topics[0].is_string() || lowerHex(topics[0].get<std::string>()) != evm::kTransferTopic) {
                    continue;
                }
                if (!topics[2].is_string() || lowerHex(topics[2].get<std::string>()) != recipient_topic) {
                    continue;
                }
                const auto value = evm::decodeUint256(stringOf(log, "data"));
                if (value) {
                    total += *value;
                }
            }
        }
        return total;
    }

    const std::string tx_hash = stringOf(receipt, "transactionHash");
    const auto tx = rpcCall(config_.rpc_url, "eth_getTransactionByHash", nlohmann::json::array({tx_hash}));
    if (!tx.is_object()) {
        throw ExternalCallError(ErrorClass::TRANSIENT, "mined transaction not returned: " + tx_hash);
    }

    const Amount value = quantity(tx.value("value", nlohmann::json("0x0")), "value");
    if (evm::sameAddress(stringOf(tx, "to"), watch.recipient)) {
        return value;
    }
    if (!evm::sameAddress(watch.recipient, config_.wallet_address)) {
        return 0;
    }

    // Native proceeds of a contract call: balance delta across the block,
    // with the wallet's own gas and value spend added back.
    const Amount block = quantity(receipt.value("blockNumber", nlohmann::json()), "blockNumber");
    const Amount after = balanceAt(watch.recipient, watch.asset, common::toHexQuantity(block));
    const Amount before = block > 0 ? balanceAt(watch.recipient, watch.asset, common::toHexQuantity(block - 1)) : Amount(0);

    Amount spent = 0;
    if (evm::sameAddress(stringOf(tx, "from"), config_.wallet_address)) {
        const Amount gas_used = quantity(receipt.value("gasUsed", nlohmann::json("0x0")), "gasUsed");
        const nlohmann::json price_field = receipt.contains("effectiveGasPrice")
            ? receipt["effectiveGasPrice"] : tx.value("gasPrice", nlohmann::json("0x0"));
        spent = gas_used * quantity(price_field, "effectiveGasPrice") + value;
    }

    const Amount credited = after + spent;
    return credited > before ? credited - before : Amount(0);
}

Amount EvmRpcChainClient::balanceAt(const std::string& account, const AssetInfo& asset, const std::string& block_tag) {
    if (asset.isNative()) {
        return quantity(rpcCall(config_.rpc_url, "eth_getBalance", nlohmann::json::array({account, block_tag})), "balance");
    }

    nlohmann::json call;
    call["to"] = asset.token_address;
    call["data"] = evm::encodeBalanceOf(account);
    const auto result = rpcCall(config_.rpc_url, "eth_call", nlohmann::json::array({call, block_tag}));
    const auto decoded = result.is_string() ? evm::decodeUint256(result.get<std::string>()) : std::nullopt;
    if (!decoded) {
        throw ExternalCallError(ErrorClass::PERMANENT, "balanceOf failed for token " + asset.token_address);
    }
    return *decoded;
}

Amount EvmRpcChainClient::balanceOf(const std::string& account, const AssetInfo& asset) {
    return balanceAt(account, asset, "latest");
}

Amount EvmRpcChainClient::allowance(const std::string& owner, const AssetInfo& asset, const std::string& spender) {
    if (asset.isNative()) {
        return std::numeric_limits<Amount>::max();
    }

    nlohmann::json call;
    call["to"] = asset.token_address;
    call["data"] = evm::encodeAllowance(owner, spender);
    const auto result = rpcCall(config_.rpc_url, "eth_call", nlohmann::json::array({call, "latest"}));
    const auto decoded = result.is_string() ? evm::decodeUint256(result.get<std::string>()) : std::nullopt;
    if (!decoded) {
        throw ExternalCallError(ErrorClass::PERMANENT, "allowance failed for token " + asset.token_address);
    }
    return *decoded;
}

} // namespace network
} // namespace chainshuttle
