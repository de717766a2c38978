#pragma once

#include <memory>

#include "common/Clock.h"
#include "core/contracts/IQuoteSource.h"
#include "execution/RateLimiter.h"
#include "network/IHttpClient.h"
#include "network/NetworkConfig.h"

namespace chainshuttle {
namespace network {

// Odos smart order router: /sor/quote/v2 for a path, /sor/assemble for calldata.
class OdosQuoteSource : public core::IQuoteSource {
public:
    OdosQuoteSource(OdosConfig config, long long chain_id, std::shared_ptr<IHttpClient> http, std::shared_ptr<const IClock> clock);

    core::QuotePlan quote(
        const AssetInfo& input,
        const AssetInfo& output,
        const Amount& amount,
        const std::string& user_address
    ) override;

private:
    nlohmann::json postJson(const std::string& path, const nlohmann::json& body);

    OdosConfig config_;
    long long chain_id_;
    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<const IClock> clock_;
    std::shared_ptr<execution::RateLimiter> rate_limiter_;
};

} // namespace network
} // namespace chainshuttle
