#include "common/Config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
bool throwsRuntime(const nlohmann::json& root) {
    try {
        chainshuttle::Config::getInstance().loadFromJson(root);
    } catch (const std::runtime_error& e) {
        std::cout << "[TEST] rejected as expected: " << e.what() << std::endl;
        return true;
    }
    return false;
}
}

int main() {
    using namespace chainshuttle;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // 1. Missing file keeps defaults
    config.load("/nonexistent/chainshuttle/config.json");
    assert(config.getPipelineConfig().poll_interval_ms == 5000);
    assert(config.getRetryConfig().max_attempts == 5);
    assert(config.getRunnerConfig().service_budgets.at(ServiceKind::CHAIN) == 4);
    assert(config.getAssets().empty());
    assert(config.getStorageConfig().records_dir == "state/transfers");

    // 2. Parsed values
    const nlohmann::json root = nlohmann::json::parse(R"({
        "pipeline": { "poll_interval_ms": 250, "max_requotes": 3, "unlimited_approval": true },
        "retry": { "base_delay_ms": 100, "max_attempts": 7, "jitter_fraction": 0.0 },
        "runner": { "worker_threads": 2, "service_budgets": { "ledger": 1, "quote": 5 } },
        "bitget": { "chain_aliases": { "Arbitrum": "ARBITRUMONE" } },
        "chain": { "name": "Arbitrum", "chain_id": 42161,
                   "wallet_address": "0xAbCdEf0000000000000000000000000000000001" },
        "assets": {
            "USDC": { "token_address": "0xaf88d065e77c8cC2239327C5EDb3A432268e5831", "decimals": 6 },
            "ETH": { "token_address": "native", "decimals": 18 }
        },
        "storage": { "records_dir": "/tmp/chainshuttle-records" },
        "logging": { "level": "debug" }
    })");
    config.loadFromJson(root);

    assert(config.getPipelineConfig().poll_interval_ms == 250);
    assert(config.getPipelineConfig().max_requotes == 3);
    assert(config.getPipelineConfig().unlimited_approval);
    assert(config.getPipelineConfig().min_confirmations == 1);
    assert(config.getRetryConfig().base_delay_ms == 100);
    assert(config.getRetryConfig().max_attempts == 7);
    assert(config.getRunnerConfig().worker_threads == 2);
    assert(config.getRunnerConfig().service_budgets.at(ServiceKind::LEDGER) == 1);
    assert(config.getRunnerConfig().service_budgets.at(ServiceKind::QUOTE) == 5);
    assert(config.getRunnerConfig().service_budgets.at(ServiceKind::CHAIN) == 4);
    assert(config.getBitgetConfig().chain_aliases.at("Arbitrum") == "ARBITRUMONE");

    const auto& assets = config.getAssets();
    assert(assets.size() == 2);
    assert(assets.at("USDC").token_address == "0xaf88d065e77c8cc2239327c5edb3a432268e5831");
    assert(assets.at("USDC").decimals == 6);
    assert(assets.at("ETH").isNative());
    assert(config.getStorageConfig().records_dir == "/tmp/chainshuttle-records");
    assert(config.getStorageConfig().journal_path == "state/journal.jsonl");
    assert(config.getLogLevel() == "debug");

    // 3. Reload resets previous values
    config.loadFromJson(nlohmann::json::object());
    assert(config.getPipelineConfig().poll_interval_ms == 5000);
    assert(config.getAssets().empty());

    // 4. Invalid values
    assert(throwsRuntime(nlohmann::json::parse(R"({"retry": {"multiplier": 0.5}})")));
    assert(throwsRuntime(nlohmann::json::parse(R"({"pipeline": {"poll_interval_ms": 0}})")));
    assert(throwsRuntime(nlohmann::json::parse(R"({"runner": {"service_budgets": {"bank": 1}}})")));
    assert(throwsRuntime(nlohmann::json::parse(R"({"assets": {"USDC": {"token_address": "0x12"}}})")));
    assert(throwsRuntime(nlohmann::json::parse(R"({"chain": {"wallet_address": "wallet"}})")));
    assert(throwsRuntime(nlohmann::json::parse(R"({"pipeline": {"poll_interval_ms": "fast"}})")));
    assert(throwsRuntime(nlohmann::json::parse("[]")));

    // 5. Malformed file
    const auto bad_path = std::filesystem::temp_directory_path() / "chainshuttle_bad_config.json";
    {
        std::ofstream out(bad_path);
        out << "{ \"pipeline\": ";
    }
    bool threw = false;
    try {
        config.load(bad_path.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::error_code ec;
    std::filesystem::remove(bad_path, ec);

    // 6. Credentials and overrides from the environment
    setenv("BITGET_API_KEY", " key-1 ", 1);
    setenv("BITGET_API_SECRET", "secret-1", 1);
    setenv("BITGET_API_PASSPHRASE", "pass-1", 1);
    setenv("CHAIN_SIGNER_URL", "http://signer.local:9000", 1);
    config.loadFromJson(nlohmann::json::object());
    assert(config.hasExchangeCredentials());
    assert(config.getBitgetConfig().api_key == "key-1");
    assert(config.getChainConfig().signer_url == "http://signer.local:9000");

    unsetenv("BITGET_API_PASSPHRASE");
    config.loadFromJson(nlohmann::json::object());
    assert(!config.hasExchangeCredentials());
    unsetenv("BITGET_API_KEY");
    unsetenv("BITGET_API_SECRET");
    unsetenv("CHAIN_SIGNER_URL");

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
