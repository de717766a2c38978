#pragma once

#include "common/Types.h"
#include "core/model/TransferTypes.h"

namespace chainshuttle {
namespace core {

// On-chain liquidity aggregator, consulted as an opaque quote source.
class IQuoteSource {
public:
    virtual ~IQuoteSource() = default;

    virtual QuotePlan quote(
        const AssetInfo& input,
        const AssetInfo& output,
        const Amount& amount,
        const std::string& user_address
    ) = 0;
};

} // namespace core
} // namespace chainshuttle
