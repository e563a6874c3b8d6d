#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace dcabot {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");
    void setLevel(const std::string& level);
    void flush();

    // initialize() 이전 호출은 무시 (단위 테스트)
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // 체결된 주문 CSV 기록: symbol,side,price,quantity,order_id,tag
    void logTrade(const std::string& symbol, const std::string& side,
                  double price, double quantity,
                  const std::string& order_id, const std::string& tag);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) dcabot::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) dcabot::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) dcabot::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) dcabot::Logger::getInstance().error(__VA_ARGS__)

} // namespace dcabot
