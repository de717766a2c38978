#pragma once

#include <stdexcept>
#include <string>

namespace chainshuttle {
namespace execution {

enum class ErrorClass {
    TRANSIENT,      // network, timeout, 5xx: retry with backoff
    PERMANENT,      // invalid input, unsupported asset, insufficient funds: fail fast
    RATE_LIMITED    // retry honouring retry_after_ms when the server sent one
};

inline const char* errorClassToString(ErrorClass error_class) {
    switch (error_class) {
        case ErrorClass::TRANSIENT: return "TRANSIENT";
        case ErrorClass::PERMANENT: return "PERMANENT";
        case ErrorClass::RATE_LIMITED: return "RATE_LIMITED";
    }
    return "TRANSIENT";
}

// Thrown by leaf clients; everything a leaf client throws is classified.
class ExternalCallError : public std::runtime_error {
public:
    ExternalCallError(ErrorClass error_class, const std::string& message, long long retry_after_ms = 0)
        : std::runtime_error(message)
        , error_class_(error_class)
        , retry_after_ms_(retry_after_ms) {}

    ErrorClass errorClass() const { return error_class_; }
    long long retryAfterMs() const { return retry_after_ms_; }

private:
    ErrorClass error_class_;
    long long retry_after_ms_;
};

} // namespace execution
} // namespace chainshuttle
