#include "common/Config.h"
#include "common/Logger.h"
#include "core/model/TransferSchema.h"
#include "engine/TransferEngine.h"

#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: chainshuttle-cancel <transfer_key> [config_path]\n";
        return 1;
    }

    const std::string key = argv[1];

    try {
        auto& cfg = chainshuttle::Config::getInstance();
        cfg.load(argc > 2 ? argv[2] : "config/config.json");
        chainshuttle::Logger::getInstance().initialize(cfg.getLoggingConfig().dir, cfg.getLoggingConfig().level);

        chainshuttle::engine::TransferEngine engine(cfg);
        const auto record = engine.store().get(key);
        if (!record) {
            std::cerr << "No transfer " << key << "\n";
            return 1;
        }

        std::cout << "Current state: " << chainshuttle::core::transferStateToString(record->state) << "\n";
        if (record->isTerminal()) {
            std::cout << "Transfer already settled; no cancel needed\n";
            return 0;
        }

        const auto result = engine.orchestrator().cancel(key);
        std::cout << "Cancel result: " << chainshuttle::core::cancelResultToString(result) << "\n";
        return result == chainshuttle::core::CancelResult::OK ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Cancel failed: " << e.what() << "\n";
        return 1;
    }
}
