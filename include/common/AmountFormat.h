#pragma once
// ===================================================================
// Fixed-point amount helpers
//
// Exchanges speak decimal strings ("999.5"), JSON-RPC speaks hex
// quantities ("0x3b9aca00"), the core speaks base units (Amount).
// ===================================================================

#include <optional>
#include <string>

#include "common/Types.h"

namespace chainshuttle {
namespace common {

// "999.5" with 6 decimals -> 999500000. Rejects signs, exponents and
// more fractional digits than the asset carries.
std::optional<Amount> parseUnits(const std::string& text, int decimals);

// 999500000 with 6 decimals -> "999.5" (trailing zeros trimmed, "0" for zero)
std::string formatUnits(const Amount& amount, int decimals);

// Base-10 string of base units, used for persistence.
std::string toDecimalString(const Amount& amount);
std::optional<Amount> fromDecimalString(const std::string& text);

// JSON-RPC quantity encoding: "0x" prefix, no leading zeros, "0x0" for zero.
std::string toHexQuantity(const Amount& amount);
std::optional<Amount> fromHexQuantity(const std::string& text);

// Fixed-width 32-byte big-endian hex word without prefix (ABI encoding).
std::string toAbiWord(const Amount& amount);

// Lossy; for logging only.
double toApproxDouble(const Amount& amount, int decimals);

} // namespace common
} // namespace chainshuttle
