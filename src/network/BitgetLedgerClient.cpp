#include "network/BitgetLedgerClient.h"

#include <algorithm>
#include <cctype>

#include "common/AmountFormat.h"
#include "common/Logger.h"
#include "execution/ExternalCallError.h"
#include "execution/ExternalStatusMapper.h"

namespace chainshuttle {
namespace network {

namespace {
std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string textField(const nlohmann::json& row, const char* key) {
    if (!row.is_object() || !row.contains(key) || row[key].is_null()) {
        return "";
    }
    return row[key].is_string() ? row[key].get<std::string>() : row[key].dump();
}

// History endpoints answer with either an array or {"list": [...]}.
const nlohmann::json& rowsOf(const nlohmann::json& data) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    if (data.is_array()) {
        return data;
    }
    if (data.is_object() && data.contains("list") && data["list"].is_array()) {
        return data["list"];
    }
    return kEmpty;
}
} // namespace

BitgetLedgerClient::BitgetLedgerClient(std::shared_ptr<BitgetHttpClient> client, std::map<std::string, AssetInfo> assets)
    : client_(std::move(client))
    , assets_(std::move(assets)) {}

std::string BitgetLedgerClient::exchangeChain(const std::string& chain) const {
    const auto& aliases = client_->config().chain_aliases;
    auto it = aliases.find(chain);
    return it != aliases.end() ? it->second : toUpper(chain);
}

int BitgetLedgerClient::decimalsFor(const std::string& coin) const {
    auto it = assets_.find(coin);
    if (it == assets_.end()) {
        throw execution::ExternalCallError(execution::ErrorClass::PERMANENT, "unknown coin in exchange record: " + coin);
    }
    return it->second.decimals;
}

std::string BitgetLedgerClient::withdraw(
    const AssetInfo& asset,
    const std::string& chain,
    const Amount& amount,
    const std::string& destination_address,
    const std::string& client_id
) {
    const std::string size = common::formatUnits(amount, asset.decimals);

    // Refuse early when the account cannot cover the withdrawal.
    const auto assets = client_->getAccountAssets(asset.symbol);
    for (const auto& row : rowsOf(assets)) {
        if (textField(row, "coin") != asset.symbol) {
            continue;
        }
        const auto available = common::parseUnits(textField(row, "available"), asset.decimals);
        if (available && *available < amount) {
            throw execution::ExternalCallError(execution::ErrorClass::PERMANENT,
                "insufficient balance: " + textField(row, "available") + " " + asset.symbol +
                " available, withdrawing " + size);
        }
    }

    LOG_INFO("[Bitget] withdraw {} {} via {} clientOid={}", size, asset.symbol, exchangeChain(chain), client_id);
    const auto data = client_->withdraw(asset.symbol, exchangeChain(chain), size, destination_address, client_id);
    const std::string order_id = textField(data, "orderId");
    if (order_id.empty()) {
        // Accepted without an id; the next attempt resolves it through findWithdrawal.
        throw execution::ExternalCallError(execution::ErrorClass::TRANSIENT, "withdrawal accepted without orderId");
    }
    return order_id;
}

std::optional<core::LedgerStatus> BitgetLedgerClient::findWithdrawal(const std::string& client_id) {
    const auto data = client_->getWithdrawalHistory({{"clientOid", client_id}});
    for (const auto& row : rowsOf(data)) {
        if (textField(row, "clientOid") == client_id) {
            return execution::ExternalStatusMapper::fromWithdrawRecord(row, decimalsFor(textField(row, "coin")));
        }
    }
    return std::nullopt;
}

std::string BitgetLedgerClient::depositAddressFor(const AssetInfo& asset, const std::string& chain) {
    const auto data = client_->getDepositAddress(asset.symbol, exchangeChain(chain));
    const std::string address = textField(data, "address");
    if (address.empty()) {
        throw execution::ExternalCallError(execution::ErrorClass::PERMANENT,
            "no deposit address for " + asset.symbol + " on " + exchangeChain(chain));
    }
    return address;
}

core::LedgerStatus BitgetLedgerClient::statusOf(const std::string& withdrawal_id) {
    const auto data = client_->getWithdrawalHistory({{"orderId", withdrawal_id}});
    for (const auto& row : rowsOf(data)) {
        if (textField(row, "orderId") == withdrawal_id) {
            return execution::ExternalStatusMapper::fromWithdrawRecord(row, decimalsFor(textField(row, "coin")));
        }
    }

    core::LedgerStatus pending;
    pending.external_id = withdrawal_id;
    pending.detail = "not listed yet";
    return pending;
}

core::LedgerStatus BitgetLedgerClient::depositStatusOf(const AssetInfo& asset, const std::string& tx_hash) {
    const auto data = client_->getDepositHistory({{"coin", asset.symbol}});
    const std::string wanted = toLower(tx_hash);
    for (const auto& row : rowsOf(data)) {
        if (toLower(textField(row, "tradeId")) == wanted) {
            return execution::ExternalStatusMapper::fromDepositRecord(row, asset.decimals);
        }
    }

    core::LedgerStatus pending;
    pending.chain_tx_hash = tx_hash;
    pending.detail = "deposit not credited yet";
    return pending;
}

} // namespace network
} // namespace chainshuttle
