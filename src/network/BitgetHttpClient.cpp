#include "network/BitgetHttpClient.h"
#include "network/BitgetSigner.h"
#include "execution/ErrorClassifier.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>

namespace chainshuttle {
namespace network {
namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "access-key", "access-sign", "access-passphrase", "passphrase",
        "api_key", "secret", "signature", "address", "toaddress"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

std::string sanitizeForLog(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        maskSensitiveJson(j);
        return j.dump();
    } catch (const nlohmann::json::exception&) {
        return text.substr(0, 256);
    }
}

std::string nowMsString() {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count());
}
}

BitgetHttpClient::BitgetHttpClient(BitgetConfig config, std::shared_ptr<IHttpClient> http)
    : config_(std::move(config))
    , http_(std::move(http))
    , rate_limiter_(std::make_shared<execution::RateLimiter>(config_.rate_limits, 10))
{
    if (!http_) {
        throw std::invalid_argument("BitgetHttpClient requires an http transport");
    }
}

std::map<std::string, std::string> BitgetHttpClient::authHeaders(
    const std::string& method,
    const std::string& request_path,
    const std::string& body
) const {
    const std::string timestamp = nowMsString();

    std::map<std::string, std::string> headers;
    headers["ACCESS-KEY"] = config_.api_key;
    headers["ACCESS-SIGN"] = BitgetSigner::sign(config_.api_secret, timestamp, method, request_path, body);
    headers["ACCESS-PASSPHRASE"] = config_.passphrase;
    headers["ACCESS-TIMESTAMP"] = timestamp;
    headers["Content-Type"] = "application/json";
    headers["Accept"] = "application/json";
    headers["locale"] = "en-US";
    return headers;
}

nlohmann::json BitgetHttpClient::get(
    const std::string& path,
    const std::map<std::string, std::string>& params,
    const std::string& group
) {
    if (config_.api_key.empty() || config_.api_secret.empty()) {
        throw execution::ExternalCallError(execution::ErrorClass::PERMANENT, "missing Bitget API credentials");
    }
    rate_limiter_->acquire(group);

    std::string request_path = path;
    if (!params.empty()) {
        request_path += "?" + BitgetSigner::buildQueryString(params);
    }

    LOG_DEBUG("[Bitget] GET {}", path);
    auto response = http_->get(config_.base_url + request_path, authHeaders("GET", request_path, ""));
    return unwrap(response, "GET " + path);
}

nlohmann::json BitgetHttpClient::post(
    const std::string& path,
    const nlohmann::json& body,
    const std::string& group
) {
    if (config_.api_key.empty() || config_.api_secret.empty()) {
        throw execution::ExternalCallError(execution::ErrorClass::PERMANENT, "missing Bitget API credentials");
    }
    rate_limiter_->acquire(group);

    const std::string payload = body.dump();
    LOG_DEBUG("[Bitget] POST {}", path);
    auto response = http_->post(config_.base_url + path, payload, authHeaders("POST", path, payload));
    return unwrap(response, "POST " + path);
}

nlohmann::json BitgetHttpClient::unwrap(const HttpResponse& response, const std::string& what) {
    const long long retry_after_ms = execution::ErrorClassifier::parseRetryAfterMs(response.header("Retry-After"));
    if (response.isRateLimited()) {
        rate_limiter_->handleRateLimitError(retry_after_ms);
    }

    nlohmann::json envelope;
    try {
        envelope = response.json();
    } catch (const nlohmann::json::exception&) {
        const auto error_class = execution::ErrorClassifier::classifyHttpStatus(
            response.isSuccess() ? 502 : response.status_code);
        LOG_WARN("[Bitget] {} returned non-JSON body (HTTP {})", what, response.status_code);
        throw execution::ExternalCallError(error_class,
            what + " HTTP " + std::to_string(response.status_code) + ": unparseable body", retry_after_ms);
    }

    if (!envelope.is_object()) {
        throw execution::ExternalCallError(
            execution::ErrorClassifier::classifyHttpStatus(response.isSuccess() ? 502 : response.status_code),
            what + " returned an unexpected envelope", retry_after_ms);
    }

    const std::string code = envelope.contains("code") && envelope["code"].is_string()
        ? envelope["code"].get<std::string>()
        : (envelope.contains("code") ? envelope["code"].dump() : "");
    const std::string msg = envelope.contains("msg") && envelope["msg"].is_string()
        ? envelope["msg"].get<std::string>()
        : "";

    if (response.isSuccess() && code == "00000") {
        return envelope.contains("data") ? envelope["data"] : nlohmann::json();
    }

    const auto error_class = execution::ErrorClassifier::classifyExchangeError(response.status_code, code, msg);
    const std::string safe_body = sanitizeForLog(response.body);
    LOG_ERROR("[Bitget] {} failed: HTTP {} code={} class={} body={}",
              what, response.status_code, code, execution::errorClassToString(error_class), safe_body);
    throw execution::ExternalCallError(error_class,
        what + " failed: HTTP " + std::to_string(response.status_code) + " code=" + code + " " + msg,
        retry_after_ms);
}

std::map<std::string, std::string> BitgetHttpClient::historyWindow(std::map<std::string, std::string> filters) const {
    const long long now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
    filters.emplace("startTime", std::to_string(now_ms - config_.history_lookback_ms));
    filters.emplace("endTime", std::to_string(now_ms + 60000));
    filters.emplace("limit", "100");
    return filters;
}

nlohmann::json BitgetHttpClient::withdraw(
    const std::string& coin,
    const std::string& chain,
    const std::string& size,
    const std::string& address,
    const std::string& client_oid
) {
    if (coin.empty() || chain.empty() || size.empty() || address.empty()) {
        throw execution::ExternalCallError(execution::ErrorClass::PERMANENT, "missing withdrawal parameters");
    }

    nlohmann::json body;
    body["coin"] = coin;
    body["transferType"] = "on_chain";
    body["chain"] = chain;
    body["size"] = size;
    body["address"] = address;
    if (!client_oid.empty()) {
        body["clientOid"] = client_oid;
    }
    return post("/api/v2/spot/wallet/withdrawal", body, "withdraw");
}

nlohmann::json BitgetHttpClient::getDepositAddress(const std::string& coin, const std::string& chain) {
    std::map<std::string, std::string> params;
    params["coin"] = coin;
    if (!chain.empty()) {
        params["chain"] = chain;
    }
    return get("/api/v2/spot/wallet/deposit-address", params);
}

nlohmann::json BitgetHttpClient::getAccountAssets(const std::string& coin) {
    std::map<std::string, std::string> params;
    if (!coin.empty()) {
        params["coin"] = coin;
    }
    return get("/api/v2/spot/account/assets", params, "default");
}

nlohmann::json BitgetHttpClient::getWithdrawalHistory(const std::map<std::string, std::string>& filters) {
    return get("/api/v2/spot/wallet/withdraw-list", historyWindow(filters));
}

nlohmann::json BitgetHttpClient::getDepositHistory(const std::map<std::string, std::string>& filters) {
    return get("/api/v2/spot/wallet/deposit-list", historyWindow(filters));
}

} // namespace network
} // namespace chainshuttle
