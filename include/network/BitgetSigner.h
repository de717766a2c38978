#pragma once

#include <string>
#include <map>

namespace chainshuttle {
namespace network {

// Bitget API v2 request signing
class BitgetSigner {
public:
    // base64(HMAC-SHA256(secret, timestamp + METHOD + request_path + body))
    // request_path includes "?" + sorted query for GET requests.
    static std::string sign(
        const std::string& secret_key,
        const std::string& timestamp,
        const std::string& method,
        const std::string& request_path,
        const std::string& body = ""
    );

    // "a=1&b=2" in key order, unencoded (the form the signature covers).
    static std::string buildQueryString(const std::map<std::string, std::string>& params);

    static std::string base64Encode(const std::string& data);
};

} // namespace network
} // namespace chainshuttle
