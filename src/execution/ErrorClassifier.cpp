#include "execution/ErrorClassifier.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace chainshuttle {
namespace execution {

namespace {
std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Bitget codes that will not succeed on retry.
const std::set<std::string>& permanentExchangeCodes() {
    static const std::set<std::string> codes = {
        "43012",   // insufficient balance
    };
    return codes;
}
}

ErrorClass ErrorClassifier::classifyHttpStatus(int status_code) {
    if (status_code == 429) {
        return ErrorClass::RATE_LIMITED;
    }
    if (status_code == 0 || status_code == 408 || status_code >= 500) {
        return ErrorClass::TRANSIENT;
    }
    if (status_code >= 400) {
        return ErrorClass::PERMANENT;
    }
    return ErrorClass::TRANSIENT;
}

ErrorClass ErrorClassifier::classifyExchangeError(int status_code, const std::string& code, const std::string& message) {
    if (status_code == 429 || code == "429") {
        return ErrorClass::RATE_LIMITED;
    }
    if (permanentExchangeCodes().count(code) > 0) {
        return ErrorClass::PERMANENT;
    }

    const std::string lowered = toLower(message);
    if (containsAny(lowered, {"insufficient", "invalid address", "address is invalid",
                              "not support", "unsupported", "does not exist", "not exist"})) {
        return ErrorClass::PERMANENT;
    }
    if (containsAny(lowered, {"too many requests", "frequency", "rate limit"})) {
        return ErrorClass::RATE_LIMITED;
    }
    if (status_code >= 200 && status_code < 300) {
        // Rejected with a business code we do not know: fail fast for a human to inspect.
        return ErrorClass::PERMANENT;
    }
    return classifyHttpStatus(status_code);
}

ErrorClass ErrorClassifier::classifyRpcError(int code, const std::string& message) {
    const std::string lowered = toLower(message);
    if (containsAny(lowered, {"insufficient funds", "execution reverted", "invalid sender"})) {
        return ErrorClass::PERMANENT;
    }
    if (code == 429 || code == -32005 || containsAny(lowered, {"rate limit", "too many requests"})) {
        return ErrorClass::RATE_LIMITED;
    }
    return ErrorClass::TRANSIENT;
}

bool ErrorClassifier::isAlreadyKnown(const std::string& message) {
    const std::string lowered = toLower(message);
    return containsAny(lowered, {"already known", "known transaction", "nonce too low", "already imported"});
}

long long ErrorClassifier::parseRetryAfterMs(const std::string& header_value) {
    if (header_value.empty()) {
        return 0;
    }
    long long seconds = 0;
    for (char c : header_value) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return 0;
        }
        seconds = seconds * 10 + (c - '0');
        if (seconds > 86400) {
            return 86400LL * 1000;
        }
    }
    return seconds * 1000;
}

} // namespace execution
} // namespace chainshuttle
