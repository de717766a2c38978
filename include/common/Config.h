#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/orchestration/PipelineConfig.h"
#include "execution/RetryPolicy.h"
#include "network/NetworkConfig.h"

namespace chainshuttle {

struct StorageConfig {
    std::string records_dir = "state/transfers";
    std::string journal_path = "state/journal.jsonl";
};

struct LoggingConfig {
    std::string dir = "logs";
    std::string level = "info";
};

// Process configuration: config.json plus credentials from the environment.
// main() copies the sections out into the constructors; nothing below the
// CLI reads this singleton.
class Config {
public:
    static Config& getInstance();

    // Resets to defaults, then applies the file (missing file keeps the
    // defaults) and the environment. Throws std::runtime_error when the
    // file exists but is not valid configuration.
    void load(const std::string& config_path);

    // Same as load() for an already parsed document; environment still applies.
    void loadFromJson(const nlohmann::json& root);

    const core::PipelineConfig& getPipelineConfig() const { return pipeline_; }
    const execution::RetryConfig& getRetryConfig() const { return retry_; }
    const core::RunnerConfig& getRunnerConfig() const { return runner_; }
    const network::HttpConfig& getHttpConfig() const { return http_; }
    const network::BitgetConfig& getBitgetConfig() const { return bitget_; }
    const network::ChainConfig& getChainConfig() const { return chain_; }
    const network::OdosConfig& getOdosConfig() const { return odos_; }
    const std::map<std::string, AssetInfo>& getAssets() const { return assets_; }
    const StorageConfig& getStorageConfig() const { return storage_; }
    const LoggingConfig& getLoggingConfig() const { return logging_; }
    std::string getLogLevel() const { return logging_.level; }

    bool hasExchangeCredentials() const {
        return !bitget_.api_key.empty() && !bitget_.api_secret.empty() && !bitget_.passphrase.empty();
    }

private:
    Config() = default;

    void resetDefaults();
    void applyEnvironment();

    core::PipelineConfig pipeline_;
    execution::RetryConfig retry_;
    core::RunnerConfig runner_;
    network::HttpConfig http_;
    network::BitgetConfig bitget_;
    network::ChainConfig chain_;
    network::OdosConfig odos_;
    std::map<std::string, AssetInfo> assets_;
    StorageConfig storage_;
    LoggingConfig logging_;
};

} // namespace chainshuttle
