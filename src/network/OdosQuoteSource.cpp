#include "network/OdosQuoteSource.h"

#include <sstream>

#include "common/AmountFormat.h"
#include "common/Logger.h"
#include "execution/ErrorClassifier.h"
#include "network/EvmAbi.h"

namespace chainshuttle {
namespace network {

namespace {
using execution::ErrorClass;
using execution::ExternalCallError;

std::string routerToken(const AssetInfo& asset) {
    return asset.isNative() ? evm::kZeroAddress : asset.token_address;
}

// Odos sends base-unit amounts as decimal strings, occasionally as numbers.
Amount decimalAmount(const nlohmann::json& node, const std::string& what) {
    std::string text;
    if (node.is_string()) {
        text = node.get<std::string>();
    } else if (node.is_number_unsigned() || node.is_number_integer()) {
        text = node.dump();
    }
    const auto parsed = common::fromDecimalString(text);
    if (!parsed) {
        throw ExternalCallError(ErrorClass::TRANSIENT, "malformed " + what + " in aggregator reply: " + node.dump());
    }
    return *parsed;
}
} // namespace

OdosQuoteSource::OdosQuoteSource(OdosConfig config, long long chain_id, std::shared_ptr<IHttpClient> http, std::shared_ptr<const IClock> clock)
    : config_(std::move(config))
    , chain_id_(chain_id)
    , http_(std::move(http))
    , clock_(std::move(clock))
    , rate_limiter_(std::make_shared<execution::RateLimiter>(
          std::map<std::string, int>{{"sor", config_.rate_limit_per_second}}, config_.rate_limit_per_second))
{
    if (!http_ || !clock_) {
        throw std::invalid_argument("OdosQuoteSource requires an http transport and a clock");
    }
}

nlohmann::json OdosQuoteSource::postJson(const std::string& path, const nlohmann::json& body) {
    rate_limiter_->acquire("sor");

    auto response = http_->post(config_.base_url + path, body.dump(), {{"Content-Type", "application/json"}});
    const long long retry_after_ms = execution::ErrorClassifier::parseRetryAfterMs(response.header("Retry-After"));
    if (response.isRateLimited()) {
        rate_limiter_->handleRateLimitError(retry_after_ms);
    }
    if (!response.isSuccess()) {
        const auto error_class = execution::ErrorClassifier::classifyHttpStatus(response.status_code);
        LOG_WARN("[Odos] {} HTTP {}: {}", path, response.status_code, response.body.substr(0, 256));
        throw ExternalCallError(error_class,
            "aggregator " + path + " HTTP " + std::to_string(response.status_code), retry_after_ms);
    }

    try {
        auto reply = response.json();
        if (!reply.is_object()) {
            throw ExternalCallError(ErrorClass::TRANSIENT, "aggregator " + path + " returned a non-object reply");
        }
        return reply;
    } catch (const nlohmann::json::exception& e) {
        throw ExternalCallError(ErrorClass::TRANSIENT, "aggregator " + path + " returned invalid JSON: " + e.what());
    }
}

core::QuotePlan OdosQuoteSource::quote(
    const AssetInfo& input,
    const AssetInfo& output,
    const Amount& amount,
    const std::string& user_address
) {
    if (amount == 0) {
        throw ExternalCallError(ErrorClass::PERMANENT, "cannot quote a zero input amount");
    }

    nlohmann::json quote_request;
    quote_request["chainId"] = chain_id_;
    quote_request["inputTokens"] = nlohmann::json::array({
        {{"tokenAddress", routerToken(input)}, {"amount", common::toDecimalString(amount)}}
    });
    quote_request["outputTokens"] = nlohmann::json::array({
        {{"tokenAddress", routerToken(output)}, {"proportion", 1}}
    });
    quote_request["slippageLimitPercent"] = config_.slippage_percent;
    quote_request["userAddr"] = user_address;
    quote_request["compact"] = true;

    const auto quoted = postJson("/sor/quote/v2", quote_request);
    const std::string path_id = quoted.value("pathId", std::string());
    if (path_id.empty()) {
        throw ExternalCallError(ErrorClass::TRANSIENT, "aggregator quote without pathId");
    }

    nlohmann::json assemble_request;
    assemble_request["pathId"] = path_id;
    assemble_request["userAddr"] = user_address;
    assemble_request["simulate"] = false;

    const auto assembled = postJson("/sor/assemble", assemble_request);
    if (!assembled.contains("transaction") || !assembled["transaction"].is_object()) {
        throw ExternalCallError(ErrorClass::TRANSIENT, "aggregator assemble without transaction");
    }
    const auto& transaction = assembled["transaction"];

    core::QuotePlan plan;
    plan.path_id = path_id;
    plan.router_address = transaction.value("to", std::string());
    plan.calldata = transaction.value("data", std::string());
    plan.value = decimalAmount(transaction.value("value", nlohmann::json("0")), "transaction.value");
    plan.input_amount = amount;

    if (assembled.contains("outputTokens") && assembled["outputTokens"].is_array() &&
        !assembled["outputTokens"].empty()) {
        plan.expected_output = decimalAmount(assembled["outputTokens"][0].value("amount", nlohmann::json()), "outputTokens.amount");
    } else if (quoted.contains("outAmounts") && quoted["outAmounts"].is_array() && !quoted["outAmounts"].empty()) {
        plan.expected_output = decimalAmount(quoted["outAmounts"][0], "outAmounts");
    } else {
        throw ExternalCallError(ErrorClass::TRANSIENT, "aggregator reply without output amount");
    }

    if (quoted.contains("priceImpact") && quoted["priceImpact"].is_number()) {
        plan.price_impact = quoted["priceImpact"].get<double>();
    }
    plan.expires_at_ms = clock_->nowMs() + config_.quote_ttl_ms;

    if (!evm::normalizeAddress(plan.router_address) || plan.calldata.size() < 10) {
        throw ExternalCallError(ErrorClass::TRANSIENT, "aggregator assembled an unusable transaction");
    }

    LOG_INFO("[Odos] {} {} -> {} {} (impact {:.3f}%, path {})",
             common::formatUnits(amount, input.decimals), input.symbol,
             common::formatUnits(plan.expected_output, output.decimals), output.symbol,
             plan.price_impact, path_id);
    return plan;
}

} // namespace network
} // namespace chainshuttle
