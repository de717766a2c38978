#pragma once

#include "network/IHttpClient.h"
#include "network/NetworkConfig.h"
#include "execution/RateLimiter.h"
#include <memory>

namespace chainshuttle {
namespace network {

// Signed Bitget v2 REST calls. Every failure surfaces as a classified
// execution::ExternalCallError; success returns the envelope's "data".
class BitgetHttpClient {
public:
    BitgetHttpClient(BitgetConfig config, std::shared_ptr<IHttpClient> http);

    nlohmann::json get(
        const std::string& path,
        const std::map<std::string, std::string>& params,
        const std::string& group = "wallet"
    );

    nlohmann::json post(
        const std::string& path,
        const nlohmann::json& body,
        const std::string& group = "wallet"
    );

    // Wallet endpoints
    nlohmann::json withdraw(
        const std::string& coin,
        const std::string& chain,
        const std::string& size,
        const std::string& address,
        const std::string& client_oid
    );
    nlohmann::json getDepositAddress(const std::string& coin, const std::string& chain);
    nlohmann::json getAccountAssets(const std::string& coin);
    nlohmann::json getWithdrawalHistory(const std::map<std::string, std::string>& filters);
    nlohmann::json getDepositHistory(const std::map<std::string, std::string>& filters);

    const BitgetConfig& config() const { return config_; }

private:
    BitgetConfig config_;
    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;

    std::map<std::string, std::string> authHeaders(
        const std::string& method,
        const std::string& request_path,
        const std::string& body
    ) const;

    nlohmann::json unwrap(const HttpResponse& response, const std::string& what);
    std::map<std::string, std::string> historyWindow(std::map<std::string, std::string> filters) const;
};

} // namespace network
} // namespace chainshuttle
