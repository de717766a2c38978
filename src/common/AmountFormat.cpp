#include "common/AmountFormat.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace chainshuttle {
namespace common {

namespace {
const Amount kMaxAmount = std::numeric_limits<Amount>::max();

bool appendDigit(Amount& value, unsigned digit, unsigned base) {
    if (value > (kMaxAmount - digit) / base) {
        return false;
    }
    value = value * base + digit;
    return true;
}

int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Amount pow10(int exponent) {
    Amount out = 1;
    for (int i = 0; i < exponent; ++i) {
        out *= 10;
    }
    return out;
}

std::string toHexDigits(Amount value) {
    if (value == 0) {
        return "0";
    }
    static const char* kDigits = "0123456789abcdef";
    std::string out;
    while (value > 0) {
        out.push_back(kDigits[static_cast<unsigned>(value & 0xF)]);
        value >>= 4;
    }
    std::reverse(out.begin(), out.end());
    return out;
}
} // namespace

std::optional<Amount> parseUnits(const std::string& text, int decimals) {
    if (text.empty() || decimals < 0 || decimals > 77) {
        return std::nullopt;
    }

    const auto dot = text.find('.');
    const std::string whole = text.substr(0, dot);
    const std::string frac = (dot == std::string::npos) ? std::string() : text.substr(dot + 1);

    if (whole.empty() && frac.empty()) {
        return std::nullopt;
    }
    if (static_cast<int>(frac.size()) > decimals) {
        // Tolerate trailing zeros beyond precision ("1.500000000" for 6 decimals)
        const auto significant = frac.find_last_not_of('0');
        if (significant != std::string::npos && static_cast<int>(significant) >= decimals) {
            return std::nullopt;
        }
    }

    Amount value = 0;
    for (char c : whole) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (!appendDigit(value, static_cast<unsigned>(c - '0'), 10)) {
            return std::nullopt;
        }
    }
    for (int i = 0; i < decimals; ++i) {
        const char c = (i < static_cast<int>(frac.size())) ? frac[static_cast<size_t>(i)] : '0';
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (!appendDigit(value, static_cast<unsigned>(c - '0'), 10)) {
            return std::nullopt;
        }
    }
    for (size_t i = static_cast<size_t>(decimals); i < frac.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(frac[i]))) {
            return std::nullopt;
        }
    }
    return value;
}

std::string formatUnits(const Amount& amount, int decimals) {
    if (decimals <= 0) {
        return toDecimalString(amount);
    }
    const Amount scale = pow10(decimals);
    const Amount whole = amount / scale;
    std::string frac = toDecimalString(amount % scale);
    frac.insert(0, static_cast<size_t>(decimals) - frac.size(), '0');
    frac.erase(frac.find_last_not_of('0') + 1);

    std::string out = toDecimalString(whole);
    if (!frac.empty()) {
        out += "." + frac;
    }
    return out;
}

std::string toDecimalString(const Amount& amount) {
    return amount.str();
}

std::optional<Amount> fromDecimalString(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    Amount value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (!appendDigit(value, static_cast<unsigned>(c - '0'), 10)) {
            return std::nullopt;
        }
    }
    return value;
}

std::string toHexQuantity(const Amount& amount) {
    return "0x" + toHexDigits(amount);
}

std::optional<Amount> fromHexQuantity(const std::string& text) {
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }
    Amount value = 0;
    for (size_t i = 2; i < text.size(); ++i) {
        const int digit = hexDigitValue(text[i]);
        if (digit < 0) {
            return std::nullopt;
        }
        if (!appendDigit(value, static_cast<unsigned>(digit), 16)) {
            return std::nullopt;
        }
    }
    return value;
}

std::string toAbiWord(const Amount& amount) {
    std::string digits = toHexDigits(amount);
    digits.insert(0, 64 - digits.size(), '0');
    return digits;
}

double toApproxDouble(const Amount& amount, int decimals) {
    try {
        return std::stod(formatUnits(amount, decimals));
    } catch (const std::exception&) {
        return 0.0;
    }
}

} // namespace common
} // namespace chainshuttle
