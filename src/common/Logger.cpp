#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace gridradar {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir) {
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
            logs_path.string() + "/gridradar.log", 1024 * 1024 * 10, 3
        );
        
        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(spdlog::level::info);
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);
        
        alert_logger_ = spdlog::daily_logger_mt("alerts", logs_path.string() + "/alerts.log");
        alert_logger_->set_pattern("%Y-%m-%dT%H:%M:%S,%v");
        
        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());
        
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::setLevel(const std::string& level) {
    if (main_logger_) {
        main_logger_->set_level(spdlog::level::from_str(level));
    }
}

void Logger::logAlert(const std::string& market, const std::string& kind,
                      const std::string& zone, double low, double high, double score) {
    if (alert_logger_) {
        std::ostringstream oss;
        oss << market << "," << kind << "," << zone << ","
            << std::fixed << std::setprecision(8) << low << ","
            << std::fixed << std::setprecision(8) << high << ","
            << std::fixed << std::setprecision(1) << score;
        alert_logger_->info(oss.str());
        alert_logger_->flush();
    }
}

} // namespace gridradar
