#pragma once

#include <string>
#include <chrono>

#include <boost/multiprecision/cpp_int.hpp>

namespace chainshuttle {

using Timestamp = std::chrono::system_clock::time_point;

// Asset amounts in base units (wei, 1e-6 USDC, ...)
using Amount = boost::multiprecision::uint256_t;

// Asset as known to both the exchange and the chain.
struct AssetInfo {
    std::string symbol;          // exchange coin code, e.g. "USDC"
    std::string token_address;   // ERC-20 contract, empty for the chain's native asset
    int decimals = 18;

    bool isNative() const { return token_address.empty(); }
};

// The leaf systems the runner budgets calls against.
enum class ServiceKind { NONE, LEDGER, CHAIN, QUOTE };

inline const char* serviceKindToString(ServiceKind kind) {
    switch (kind) {
        case ServiceKind::NONE: return "none";
        case ServiceKind::LEDGER: return "ledger";
        case ServiceKind::CHAIN: return "chain";
        case ServiceKind::QUOTE: return "quote";
    }
    return "none";
}

} // namespace chainshuttle
