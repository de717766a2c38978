#include "common/AmountFormat.h"
#include "network/EvmAbi.h"

#include <cassert>
#include <iostream>
#include <limits>

using namespace chainshuttle;
using namespace chainshuttle::common;

int main() {
    {
        assert(*parseUnits("999.5", 6) == Amount(999500000));
        assert(*parseUnits("1000", 6) == Amount(1000000000));
        assert(*parseUnits(".5", 1) == Amount(5));
        assert(*parseUnits("1.500000000", 6) == Amount(1500000));
        assert(*parseUnits("0.319", 18) == *fromDecimalString("319000000000000000"));
        assert(!parseUnits("1.0000001", 6));
        assert(!parseUnits("-1", 6));
        assert(!parseUnits("1e6", 6));
        assert(!parseUnits("", 6));
        assert(!parseUnits(".", 6));
    }

    {
        assert(formatUnits(Amount(999500000), 6) == "999.5");
        assert(formatUnits(Amount(0), 6) == "0");
        assert(formatUnits(Amount(5), 6) == "0.000005");
        assert(formatUnits(Amount(42), 0) == "42");
    }

    {
        const Amount max = std::numeric_limits<Amount>::max();
        const std::string text = toDecimalString(max);
        assert(*fromDecimalString(text) == max);
        assert(!fromDecimalString(text + "0"));
        assert(!fromDecimalString("12a"));

        assert(toHexQuantity(Amount(0)) == "0x0");
        assert(toHexQuantity(Amount(1000000000)) == "0x3b9aca00");
        assert(*fromHexQuantity("0x3B9ACA00") == Amount(1000000000));
        assert(!fromHexQuantity("0x"));
        assert(!fromHexQuantity("3b9aca00"));
        assert(toAbiWord(Amount(255)) == std::string(62, '0') + "ff");
    }

    {
        using namespace chainshuttle::network::evm;
        assert(*normalizeAddress("0xAF88d065e77c8cC2239327C5EDb3A432268e5831") ==
               "0xaf88d065e77c8cc2239327c5edb3a432268e5831");
        assert(!normalizeAddress("0xaf88"));
        assert(!normalizeAddress("0xzz88d065e77c8cC2239327C5EDb3A432268e5831"));
        assert(sameAddress("0xAF88d065e77c8cC2239327C5EDb3A432268e5831",
                           "0xaf88d065e77c8cc2239327c5edb3a432268e5831"));

        const std::string data = encodeTransfer("0x2222222222222222222222222222222222222222", Amount(1000000));
        assert(data.size() == 2 + 8 + 64 + 64);
        assert(data.substr(0, 10) == "0xa9059cbb");
        assert(data.substr(10, 64) == std::string(24, '0') + std::string(40, '2'));
        assert(data.substr(74) == std::string(59, '0') + "f4240");

        assert(*decodeUint256("0x" + std::string(62, '0') + "0a") == Amount(10));
        assert(!decodeUint256("0x"));
        assert(!decodeUint256("0x" + std::string(65, '1')));
    }

    std::cout << "[TEST] AmountFormat PASSED\n";
    return 0;
}
