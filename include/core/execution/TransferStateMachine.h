#pragma once

#include <optional>
#include <string>

#include "common/Types.h"
#include "core/model/TransferTypes.h"

namespace chainshuttle {
namespace core {
namespace execution {

// Static shape of the WITHDRAW -> CONVERT -> DEPOSIT pipeline.
class TransferStateMachine {
public:
    // Happy-path successor; terminal states map to themselves.
    static TransferState nextOnSuccess(TransferState state);

    static Stage stageOf(TransferState state);

    static bool isTerminal(TransferState state);

    // Only before any irreversible external submission of the current stage.
    static bool isCancellable(TransferState state);

    // Leaf system the state's step calls first; used for runner budgets.
    static ServiceKind serviceFor(TransferState state);

    static TransferOutcome outcomeFor(TransferState state);

    // Monotonic position in the pipeline; terminal states rank highest.
    static int rank(TransferState state);

    // Why `next` may not replace `stored`, or nullopt when it may.
    static std::optional<std::string> validateUpdate(
        const TransferRecord& stored,
        const TransferRecord& next
    );
};

} // namespace execution
} // namespace core
} // namespace chainshuttle
