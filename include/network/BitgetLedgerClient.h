#pragma once

#include <map>
#include <memory>

#include "core/contracts/ILedgerClient.h"
#include "network/BitgetHttpClient.h"

namespace chainshuttle {
namespace network {

// ILedgerClient over the Bitget spot wallet API.
class BitgetLedgerClient : public core::ILedgerClient {
public:
    BitgetLedgerClient(std::shared_ptr<BitgetHttpClient> client, std::map<std::string, AssetInfo> assets);

    std::string withdraw(
        const AssetInfo& asset,
        const std::string& chain,
        const Amount& amount,
        const std::string& destination_address,
        const std::string& client_id
    ) override;

    std::optional<core::LedgerStatus> findWithdrawal(const std::string& client_id) override;
    std::string depositAddressFor(const AssetInfo& asset, const std::string& chain) override;
    core::LedgerStatus statusOf(const std::string& withdrawal_id) override;
    core::LedgerStatus depositStatusOf(const AssetInfo& asset, const std::string& tx_hash) override;

private:
    std::string exchangeChain(const std::string& chain) const;
    int decimalsFor(const std::string& coin) const;

    std::shared_ptr<BitgetHttpClient> client_;
    std::map<std::string, AssetInfo> assets_;
};

} // namespace network
} // namespace chainshuttle
