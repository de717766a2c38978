#include "network/EvmAbi.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "common/AmountFormat.h"

namespace chainshuttle {
namespace network {
namespace evm {

std::optional<std::string> normalizeAddress(const std::string& address) {
    if (address.size() != 42 || address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return std::nullopt;
    }
    std::string out = "0x";
    for (size_t i = 2; i < address.size(); ++i) {
        const auto c = static_cast<unsigned char>(address[i]);
        if (!std::isxdigit(c)) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool sameAddress(const std::string& lhs, const std::string& rhs) {
    const auto a = normalizeAddress(lhs);
    const auto b = normalizeAddress(rhs);
    return a && b && *a == *b;
}

std::string addressWord(const std::string& address) {
    const auto normalized = normalizeAddress(address);
    if (!normalized) {
        throw std::invalid_argument("not an EVM address: " + address);
    }
    return std::string(24, '0') + normalized->substr(2);
}

std::string addressTopic(const std::string& address) {
    return "0x" + addressWord(address);
}

std::string encodeTransfer(const std::string& recipient, const Amount& amount) {
    return std::string("0x") + kSelectorTransfer + addressWord(recipient) + common::toAbiWord(amount);
}

std::string encodeApprove(const std::string& spender, const Amount& amount) {
    return std::string("0x") + kSelectorApprove + addressWord(spender) + common::toAbiWord(amount);
}

std::string encodeBalanceOf(const std::string& owner) {
    return std::string("0x") + kSelectorBalanceOf + addressWord(owner);
}

std::string encodeAllowance(const std::string& owner, const std::string& spender) {
    return std::string("0x") + kSelectorAllowance + addressWord(owner) + addressWord(spender);
}

std::optional<Amount> decodeUint256(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 64) {
        return std::nullopt;
    }
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return Amount(0);
    }
    return common::fromHexQuantity("0x" + digits.substr(first));
}

} // namespace evm
} // namespace network
} // namespace chainshuttle
