#include "common/AmountFormat.h"
#include "common/Config.h"
#include "common/Logger.h"
#include "core/model/TransferSchema.h"
#include "engine/TransferEngine.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace chainshuttle;

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  chainshuttle submit --from <ASSET> --to <ASSET> --amount <decimal>\n"
        << "                      [--min-output <decimal>] [--deadline-minutes <n>]\n"
        << "                      [--key <idempotency key>] [--nonce <text>] [--detach]\n"
        << "  chainshuttle status <key>\n"
        << "  chainshuttle cancel <key>\n"
        << "  chainshuttle resume\n"
        << "  chainshuttle list\n"
        << "Options: --config <path> (default config/config.json)\n";
}

// "--name value" pairs after the command; flags without a value map to "1".
std::map<std::string, std::string> parseOptions(int argc, char* argv[], int first) {
    std::map<std::string, std::string> options;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            options["_positional"] = arg;
            continue;
        }
        const std::string name = arg.substr(2);
        if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
            options[name] = argv[++i];
        } else {
            options[name] = "1";
        }
    }
    return options;
}

std::string optionOr(const std::map<std::string, std::string>& options, const std::string& name,
                     const std::string& fallback = "") {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

const AssetInfo& requireAsset(const engine::TransferEngine& engine, const std::string& symbol) {
    auto it = engine.assets().find(symbol);
    if (it == engine.assets().end()) {
        throw std::invalid_argument("unknown asset " + symbol);
    }
    return it->second;
}

void printRecord(const core::TransferRecord& record) {
    std::cout << core::toJson(record).dump(2) << std::endl;
}

// Runs the engine until every admitted transfer settled or Ctrl+C.
void runUntilIdle(engine::TransferEngine& engine) {
    while (!g_interrupted) {
        if (engine.runner().waitForIdle(1000)) {
            return;
        }
    }
    LOG_WARN("Interrupted: {} transfers stay pending and resume on next start",
             engine.runner().activeCount() + engine.runner().backlogCount());
}

int commandSubmit(engine::TransferEngine& engine, const std::map<std::string, std::string>& options) {
    const std::string from = optionOr(options, "from");
    const std::string to = optionOr(options, "to");
    const std::string amount_text = optionOr(options, "amount");
    if (from.empty() || to.empty() || amount_text.empty()) {
        printUsage();
        return 2;
    }

    const AssetInfo& source = requireAsset(engine, from);
    const AssetInfo& destination = requireAsset(engine, to);

    core::TransferRequest request;
    request.source_asset = from;
    request.destination_asset = to;
    request.destination_chain = engine.chainName();
    request.destination_account = engine.walletAddress();
    request.idempotency_key = optionOr(options, "key");
    request.nonce = optionOr(options, "nonce");

    const auto amount = common::parseUnits(amount_text, source.decimals);
    if (!amount || *amount == 0) {
        std::cerr << "Invalid amount: " << amount_text << "\n";
        return 2;
    }
    request.amount = *amount;

    const std::string min_output_text = optionOr(options, "min-output", "0");
    const auto min_output = common::parseUnits(min_output_text, destination.decimals);
    if (!min_output) {
        std::cerr << "Invalid min output: " << min_output_text << "\n";
        return 2;
    }
    request.min_output = *min_output;

    const std::string deadline_text = optionOr(options, "deadline-minutes");
    if (!deadline_text.empty()) {
        const long long minutes = std::stoll(deadline_text);
        const long long now = SystemClock().nowMs();
        request.deadline_ms = now + minutes * 60 * 1000;
    }
    if (request.idempotency_key.empty() && request.nonce.empty()) {
        // without a caller key, identical requests would collapse into one transfer
        request.nonce = std::to_string(SystemClock().nowMs());
    }

    engine.start();
    const core::TransferRecord record = engine.runner().submitTransfer(request);
    std::cout << "Transfer key: " << record.key << std::endl;

    if (optionOr(options, "detach") != "1") {
        runUntilIdle(engine);
    }
    engine.stop();

    const auto final_record = engine.runner().statusOf(record.key);
    if (final_record) {
        printRecord(*final_record);
        return final_record->state == core::TransferState::SUCCEEDED ? 0 : 1;
    }
    return 1;
}

int commandStatus(engine::TransferEngine& engine, const std::string& key) {
    const auto record = engine.runner().statusOf(key);
    if (!record) {
        std::cerr << "No transfer " << key << "\n";
        return 1;
    }
    printRecord(*record);
    return 0;
}

int commandCancel(engine::TransferEngine& engine, const std::string& key) {
    const core::CancelResult result = engine.runner().cancel(key);
    std::cout << "Cancel " << key << ": " << core::cancelResultToString(result) << std::endl;
    return result == core::CancelResult::OK ? 0 : 1;
}

int commandList(engine::TransferEngine& engine) {
    for (const auto& record : engine.store().list()) {
        std::cout << record.key << "  " << core::transferStateToString(record.state)
                  << "  " << record.request.source_asset << "->" << record.request.destination_asset;
        if (record.failure.reason != core::FailureReason::NONE) {
            std::cout << "  " << core::failureReasonToString(record.failure.reason);
        }
        std::cout << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 2;
    }

    const std::string command = argv[1];
    const auto options = parseOptions(argc, argv, 2);

    try {
        auto& config = Config::getInstance();
        config.load(optionOr(options, "config", "config/config.json"));

        const auto& logging = config.getLoggingConfig();
        Logger::getInstance().initialize(logging.dir, logging.level);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        engine::TransferEngine engine(config);

        if (command == "submit") {
            return commandSubmit(engine, options);
        }
        if (command == "status" || command == "cancel") {
            const std::string key = optionOr(options, "_positional");
            if (key.empty()) {
                printUsage();
                return 2;
            }
            return command == "status" ? commandStatus(engine, key) : commandCancel(engine, key);
        }
        if (command == "resume") {
            engine.start();
            runUntilIdle(engine);
            engine.stop();
            return commandList(engine);
        }
        if (command == "list") {
            return commandList(engine);
        }

        printUsage();
        return 2;
    } catch (const core::ConflictError& e) {
        std::cerr << "Rejected: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }
}
