#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace chainshuttle {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    const std::filesystem::path logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logs_path.string() + "/chainshuttle.log", 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        transfer_logger_ = spdlog::daily_logger_mt("transfer", logs_path.string() + "/transfers.log");
        transfer_logger_->set_pattern("%Y-%m-%dT%H:%M:%S,%v");
        transfer_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::logTransfer(const std::string& key, const std::string& outcome,
                         const std::string& source_asset, const std::string& source_amount,
                         const std::string& destination_asset, const std::string& final_amount,
                         const std::string& reason) {
    if (transfer_logger_) {
        std::ostringstream oss;
        oss << key << "," << outcome << ","
            << source_asset << "," << source_amount << ","
            << destination_asset << "," << final_amount << ","
            << reason;
        transfer_logger_->info(oss.str());
    }
}

} // namespace chainshuttle
