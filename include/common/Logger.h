#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace adaptiverisk {

class Logger {
public:
    static Logger& getInstance();
    // console_output=false keeps stdout clean for machine-readable output.
    void initialize(const std::string& log_dir = "logs",
                    const std::string& level = "info",
                    bool console_output = true);

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

    // One CSV row per executed fill in trades.log.
    void logTrade(const std::string& symbol, const std::string& side,
                  double price, double quantity, double cash_after);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) adaptiverisk::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) adaptiverisk::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) adaptiverisk::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) adaptiverisk::Logger::getInstance().error(__VA_ARGS__)

} // namespace adaptiverisk
