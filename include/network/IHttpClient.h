#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace chainshuttle {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isServerError() const { return status_code >= 500; }

    // Case-insensitive header lookup; empty when absent.
    std::string header(const std::string& name) const;

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// Plain HTTP transport. Transport failures throw execution::ExternalCallError
// (TRANSIENT); HTTP error statuses are returned for the caller to classify.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& headers = {}
    ) = 0;

    virtual HttpResponse post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers = {}
    ) = 0;
};

} // namespace network
} // namespace chainshuttle
