#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace dcabot {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    if (initialized_) return;

    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "dcabot.log").string(), 1024 * 1024 * 10, 3
        );

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::from_str(level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        trade_logger_ = spdlog::daily_logger_mt("trade", (logs_path / "trades.log").string());
        trade_logger_->set_pattern("%Y-%m-%d %H:%M:%S,%v");
        trade_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized (level={})", level);
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::flush() {
    if (main_logger_) {
        main_logger_->flush();
    }
    if (trade_logger_) {
        trade_logger_->flush();
    }
}

void Logger::logTrade(const std::string& symbol, const std::string& side,
                      double price, double quantity,
                      const std::string& order_id, const std::string& tag) {
    if (trade_logger_) {
        std::ostringstream oss;
        oss << symbol << "," << side << ","
            << std::fixed << std::setprecision(8) << price << ","
            << std::fixed << std::setprecision(8) << quantity << ","
            << order_id << "," << tag;
        trade_logger_->info(oss.str());
    }
}

} // namespace dcabot
