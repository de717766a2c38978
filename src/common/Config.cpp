#include "common/Config.h"
#include "common/PathUtils.h"
#include "network/EvmAbi.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace chainshuttle {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
#ifdef _WIN32
    char* value = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value, &len, name) != 0 || value == nullptr || len == 0) {
        if (value != nullptr) {
            free(value);
        }
        return "";
    }
    std::string out = trimCopy(value);
    free(value);
    return out;
#else
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
#endif
}

ServiceKind serviceKindFromString(const std::string& name) {
    if (name == "ledger") return ServiceKind::LEDGER;
    if (name == "chain") return ServiceKind::CHAIN;
    if (name == "quote") return ServiceKind::QUOTE;
    throw std::runtime_error("unknown service in runner.service_budgets: " + name);
}

void requirePositive(long long value, const char* field) {
    if (value <= 0) {
        throw std::runtime_error(std::string(field) + " must be positive");
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetDefaults() {
    pipeline_ = core::PipelineConfig();
    retry_ = execution::RetryConfig();
    runner_ = core::RunnerConfig();
    http_ = network::HttpConfig();
    bitget_ = network::BitgetConfig();
    chain_ = network::ChainConfig();
    odos_ = network::OdosConfig();
    assets_.clear();
    storage_ = StorageConfig();
    logging_ = LoggingConfig();
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config file: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults" << std::endl;
        resetDefaults();
        applyEnvironment();
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open config file: " + config_path.string());
    }

    nlohmann::json root;
    try {
        file >> root;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(root);
    std::cout << "Config loaded: " << assets_.size() << " assets, chain " << chain_.name
              << " (" << chain_.chain_id << ")" << std::endl;
}

void Config::loadFromJson(const nlohmann::json& root) {
    resetDefaults();
    if (!root.is_object()) {
        throw std::runtime_error("config root must be a JSON object");
    }

    try {
        if (root.contains("pipeline")) {
            const auto& p = root["pipeline"];
            pipeline_.poll_interval_ms = p.value("poll_interval_ms", pipeline_.poll_interval_ms);
            pipeline_.withdraw_wait_timeout_ms = p.value("withdraw_wait_timeout_ms", pipeline_.withdraw_wait_timeout_ms);
            pipeline_.chain_wait_timeout_ms = p.value("chain_wait_timeout_ms", pipeline_.chain_wait_timeout_ms);
            pipeline_.deposit_wait_timeout_ms = p.value("deposit_wait_timeout_ms", pipeline_.deposit_wait_timeout_ms);
            pipeline_.min_confirmations = p.value("min_confirmations", pipeline_.min_confirmations);
            pipeline_.max_requotes = p.value("max_requotes", pipeline_.max_requotes);
            pipeline_.unlimited_approval = p.value("unlimited_approval", pipeline_.unlimited_approval);
            pipeline_.max_conflict_retries = p.value("max_conflict_retries", pipeline_.max_conflict_retries);
            requirePositive(pipeline_.poll_interval_ms, "pipeline.poll_interval_ms");
        }

        if (root.contains("retry")) {
            const auto& r = root["retry"];
            retry_.base_delay_ms = r.value("base_delay_ms", retry_.base_delay_ms);
            retry_.multiplier = r.value("multiplier", retry_.multiplier);
            retry_.max_delay_ms = r.value("max_delay_ms", retry_.max_delay_ms);
            retry_.max_attempts = r.value("max_attempts", retry_.max_attempts);
            retry_.jitter_fraction = r.value("jitter_fraction", retry_.jitter_fraction);
            requirePositive(retry_.base_delay_ms, "retry.base_delay_ms");
            requirePositive(retry_.max_attempts, "retry.max_attempts");
            if (retry_.multiplier < 1.0) {
                throw std::runtime_error("retry.multiplier must be >= 1");
            }
            if (retry_.jitter_fraction < 0.0 || retry_.jitter_fraction >= 1.0) {
                throw std::runtime_error("retry.jitter_fraction must be in [0, 1)");
            }
        }

        if (root.contains("runner")) {
            const auto& r = root["runner"];
            runner_.worker_threads = r.value("worker_threads", runner_.worker_threads);
            runner_.max_active_transfers = r.value("max_active_transfers", runner_.max_active_transfers);
            runner_.budget_backoff_ms = r.value("budget_backoff_ms", runner_.budget_backoff_ms);
            runner_.error_backoff_ms = r.value("error_backoff_ms", runner_.error_backoff_ms);
            if (r.contains("service_budgets")) {
                for (auto it = r["service_budgets"].begin(); it != r["service_budgets"].end(); ++it) {
                    runner_.service_budgets[serviceKindFromString(it.key())] = it.value().get<int>();
                }
            }
            requirePositive(runner_.worker_threads, "runner.worker_threads");
            requirePositive(runner_.max_active_transfers, "runner.max_active_transfers");
        }

        if (root.contains("http")) {
            const auto& h = root["http"];
            http_.proxy = h.value("proxy", http_.proxy);
            http_.timeout_seconds = h.value("timeout_seconds", http_.timeout_seconds);
        }

        if (root.contains("bitget")) {
            const auto& b = root["bitget"];
            bitget_.base_url = b.value("base_url", bitget_.base_url);
            bitget_.history_lookback_ms = b.value("history_lookback_ms", bitget_.history_lookback_ms);
            if (b.contains("chain_aliases")) {
                bitget_.chain_aliases = b["chain_aliases"].get<std::map<std::string, std::string>>();
            }
            if (b.contains("rate_limits")) {
                for (auto it = b["rate_limits"].begin(); it != b["rate_limits"].end(); ++it) {
                    bitget_.rate_limits[it.key()] = it.value().get<int>();
                }
            }
            if (!trimCopy(b.value("api_key", "")).empty() || !trimCopy(b.value("api_secret", "")).empty()) {
                std::cout << "Warning: bitget api keys in the config file are ignored; "
                          << "use BITGET_API_KEY / BITGET_API_SECRET / BITGET_API_PASSPHRASE" << std::endl;
            }
        }

        if (root.contains("chain")) {
            const auto& c = root["chain"];
            chain_.name = c.value("name", chain_.name);
            chain_.rpc_url = c.value("rpc_url", chain_.rpc_url);
            chain_.signer_url = c.value("signer_url", chain_.signer_url);
            chain_.chain_id = c.value("chain_id", chain_.chain_id);
            chain_.eip1559 = c.value("eip1559", chain_.eip1559);
            chain_.gas_price_multiplier = c.value("gas_price_multiplier", chain_.gas_price_multiplier);
            chain_.gas_limit_multiplier = c.value("gas_limit_multiplier", chain_.gas_limit_multiplier);
            chain_.wallet_address = trimCopy(c.value("wallet_address", chain_.wallet_address));
            chain_.explorer = c.value("explorer", chain_.explorer);
            chain_.rate_limit_per_second = c.value("rate_limit_per_second", chain_.rate_limit_per_second);
            if (!chain_.wallet_address.empty() && !network::evm::normalizeAddress(chain_.wallet_address)) {
                throw std::runtime_error("chain.wallet_address is not an address: " + chain_.wallet_address);
            }
            if (chain_.gas_price_multiplier <= 0.0 || chain_.gas_limit_multiplier < 1.0) {
                throw std::runtime_error("chain gas multipliers out of range");
            }
        }

        if (root.contains("odos")) {
            const auto& o = root["odos"];
            odos_.base_url = o.value("base_url", odos_.base_url);
            odos_.slippage_percent = o.value("slippage_percent", odos_.slippage_percent);
            odos_.quote_ttl_ms = o.value("quote_ttl_ms", odos_.quote_ttl_ms);
            odos_.rate_limit_per_second = o.value("rate_limit_per_second", odos_.rate_limit_per_second);
            if (odos_.slippage_percent <= 0.0 || odos_.slippage_percent > 50.0) {
                throw std::runtime_error("odos.slippage_percent out of range");
            }
        }

        if (root.contains("assets")) {
            const auto& a = root["assets"];
            if (!a.is_object()) {
                throw std::runtime_error("assets must be an object keyed by symbol");
            }
            for (auto it = a.begin(); it != a.end(); ++it) {
                AssetInfo info;
                info.symbol = it.key();
                info.decimals = it.value().value("decimals", 18);
                std::string token = trimCopy(it.value().value("token_address", ""));
                if (token == "native") {
                    token.clear();
                }
                if (!token.empty()) {
                    const auto normalized = network::evm::normalizeAddress(token);
                    if (!normalized) {
                        throw std::runtime_error("assets." + info.symbol + ".token_address is not an address");
                    }
                    token = *normalized;
                }
                info.token_address = token;
                if (info.decimals < 0 || info.decimals > 36) {
                    throw std::runtime_error("assets." + info.symbol + ".decimals out of range");
                }
                assets_[info.symbol] = info;
            }
        }

        if (root.contains("storage")) {
            const auto& s = root["storage"];
            storage_.records_dir = s.value("records_dir", storage_.records_dir);
            storage_.journal_path = s.value("journal_path", storage_.journal_path);
        }

        if (root.contains("logging")) {
            const auto& l = root["logging"];
            logging_.dir = l.value("dir", logging_.dir);
            logging_.level = l.value("level", logging_.level);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("invalid config value: ") + e.what());
    }

    applyEnvironment();
}

void Config::applyEnvironment() {
    bitget_.api_key = readEnvVar("BITGET_API_KEY");
    bitget_.api_secret = readEnvVar("BITGET_API_SECRET");
    bitget_.passphrase = readEnvVar("BITGET_API_PASSPHRASE");
    if (!hasExchangeCredentials()) {
        std::cout << "Warning: BITGET_API_KEY / BITGET_API_SECRET / BITGET_API_PASSPHRASE not fully set" << std::endl;
    }

    const std::string signer = readEnvVar("CHAIN_SIGNER_URL");
    if (!signer.empty()) {
        chain_.signer_url = signer;
    }

    const std::string proxy = readEnvVar("HTTP_PROXY");
    if (!proxy.empty()) {
        http_.proxy = proxy;
    }
}

} // namespace chainshuttle
