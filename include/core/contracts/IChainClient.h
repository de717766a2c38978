#pragma once

#include <string>

#include "common/Types.h"
#include "core/model/TransferTypes.h"

namespace chainshuttle {
namespace core {

// Unsigned call the wallet should make; the client fills nonce, gas and fees.
struct TransactionIntent {
    std::string to;
    std::string data;      // 0x-prefixed calldata, "0x" for plain value transfers
    Amount value = 0;
};

// Which incoming asset movement to measure when a transaction confirms.
struct TransferWatch {
    AssetInfo asset;
    std::string recipient;
};

enum class ChainTxStatus {
    NOT_FOUND,
    PENDING,
    SUCCEEDED,
    REVERTED
};

struct ChainConfirmation {
    ChainTxStatus status = ChainTxStatus::NOT_FOUND;
    long long depth = 0;
    Amount observed_amount = 0;
};

// Distributed ledger access for the non-custodial wallet.
class IChainClient {
public:
    virtual ~IChainClient() = default;

    virtual std::string walletAddress() const = 0;

    // Wallet -> recipient movement of `asset` (ERC-20 transfer or plain value).
    virtual TransactionIntent transferIntent(
        const AssetInfo& asset,
        const std::string& recipient,
        const Amount& amount
    ) const = 0;

    virtual TransactionIntent approvalIntent(
        const AssetInfo& asset,
        const std::string& spender,
        const Amount& amount
    ) const = 0;

    // Signing happens once per intent; the signed envelope is stored and
    // re-broadcast verbatim, which keeps submit idempotent.
    virtual SignedTransaction sign(const TransactionIntent& intent) = 0;

    virtual std::string submit(const SignedTransaction& tx) = 0;

    virtual ChainConfirmation confirmationsOf(const std::string& tx_hash, const TransferWatch& watch) = 0;

    virtual Amount balanceOf(const std::string& account, const AssetInfo& asset) = 0;

    virtual Amount allowance(const std::string& owner, const AssetInfo& asset, const std::string& spender) = 0;
};

} // namespace core
} // namespace chainshuttle
