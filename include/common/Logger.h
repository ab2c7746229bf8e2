#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace gridradar {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs");
    void setLevel(const std::string& level);
    
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
    
    // One line per raised alert: market,kind,zone,low,high,score
    void logAlert(const std::string& market, const std::string& kind,
                  const std::string& zone, double low, double high, double score);
    
private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> alert_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) gridradar::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) gridradar::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) gridradar::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) gridradar::Logger::getInstance().error(__VA_ARGS__)

} // namespace gridradar
