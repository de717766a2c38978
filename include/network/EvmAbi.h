#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace chainshuttle {
namespace network {

// Minimal ERC-20 ABI encoding. All hex strings are 0x-prefixed unless noted.
namespace evm {

constexpr const char* kSelectorTransfer = "a9059cbb";
constexpr const char* kSelectorApprove = "095ea7b3";
constexpr const char* kSelectorBalanceOf = "70a08231";
constexpr const char* kSelectorAllowance = "dd62ed3e";

// keccak256("Transfer(address,address,uint256)")
constexpr const char* kTransferTopic = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

constexpr const char* kZeroAddress = "0x0000000000000000000000000000000000000000";

// Lowercase, 0x + 40 hex digits; nullopt for anything else.
std::optional<std::string> normalizeAddress(const std::string& address);

bool sameAddress(const std::string& lhs, const std::string& rhs);

// 32-byte word (no prefix) holding the address right-aligned.
std::string addressWord(const std::string& address);

// 0x-prefixed 32-byte topic for an indexed address.
std::string addressTopic(const std::string& address);

std::string encodeTransfer(const std::string& recipient, const Amount& amount);
std::string encodeApprove(const std::string& spender, const Amount& amount);
std::string encodeBalanceOf(const std::string& owner);
std::string encodeAllowance(const std::string& owner, const std::string& spender);

// Single uint256 return value / log data word.
std::optional<Amount> decodeUint256(const std::string& hex);

} // namespace evm
} // namespace network
} // namespace chainshuttle
