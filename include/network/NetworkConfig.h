#pragma once

#include <map>
#include <string>

namespace chainshuttle {
namespace network {

struct HttpConfig {
    std::string proxy;               // HTTP_PROXY
    long timeout_seconds = 30;
};

struct BitgetConfig {
    std::string base_url = "https://api.bitget.com";
    std::string api_key;             // BITGET_API_KEY
    std::string api_secret;          // BITGET_API_SECRET
    std::string passphrase;          // BITGET_API_PASSPHRASE
    std::map<std::string, std::string> chain_aliases;   // "Arbitrum" -> "ARBITRUMONE"
    long long history_lookback_ms = 7LL * 24 * 60 * 60 * 1000;
    std::map<std::string, int> rate_limits = {{"withdraw", 1}, {"wallet", 10}, {"default", 10}};
};

struct ChainConfig {
    std::string name = "Arbitrum";
    std::string rpc_url = "https://arb1.arbitrum.io/rpc";
    std::string signer_url = "http://127.0.0.1:8550";   // CHAIN_SIGNER_URL overrides
    long long chain_id = 42161;
    bool eip1559 = true;
    double gas_price_multiplier = 1.0;
    double gas_limit_multiplier = 1.2;
    std::string wallet_address;
    std::string explorer = "https://arbiscan.io";
    int rate_limit_per_second = 20;
};

struct OdosConfig {
    std::string base_url = "https://api.odos.xyz";
    double slippage_percent = 0.5;
    long long quote_ttl_ms = 60000;
    int rate_limit_per_second = 2;
};

} // namespace network
} // namespace chainshuttle
