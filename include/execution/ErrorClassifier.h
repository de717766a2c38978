#pragma once

#include <string>

#include "execution/ExternalCallError.h"

namespace chainshuttle {
namespace execution {

// Maps raw leaf-system failures onto TRANSIENT / PERMANENT / RATE_LIMITED.
class ErrorClassifier {
public:
    // status_code 0 means the request never produced a response (transport error).
    static ErrorClass classifyHttpStatus(int status_code);

    // Bitget business error (code != "00000").
    static ErrorClass classifyExchangeError(int status_code, const std::string& code, const std::string& message);

    // JSON-RPC error object from a node or signer.
    static ErrorClass classifyRpcError(int code, const std::string& message);

    // Broadcast answers that mean the same signed transaction is already in the pool or mined.
    static bool isAlreadyKnown(const std::string& message);

    // Retry-After header in seconds; 0 when absent or unparseable.
    static long long parseRetryAfterMs(const std::string& header_value);
};

} // namespace execution
} // namespace chainshuttle
