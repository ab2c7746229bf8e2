#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "analytics/MarketScanner.h"
#include "engine/EngineConfig.h"
#include "network/PionexClient.h"
#include "strategy/StrategyConfig.h"

namespace gridradar {

struct PathsConfig {
    std::string state_file = "state/grid_state.json";
    std::string cooldown_file = "state/cooldowns.json";
    std::string log_dir = "logs";
};

struct TelegramConfig {
    bool enabled = true;
    std::string base_url = "https://api.telegram.org";
    int timeout_seconds = 10;
    std::string bot_token;      // TELEGRAM_TOKEN
    std::string chat_id;        // TELEGRAM_CHAT_ID
};

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // Applies one parsed document on top of the current values
    void apply(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getExchangeBaseUrl() const { return exchange_base_url_; }
    int getHttpTimeoutSeconds() const { return http_timeout_seconds_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    analytics::UniverseConfig getUniverseConfig() const { return universe_config_; }
    strategy::SignalAnalyzerConfig getSignalConfig() const { return signal_config_; }
    network::PionexClientConfig getPionexConfig() const { return pionex_config_; }
    PathsConfig getPaths() const { return paths_; }
    TelegramConfig getTelegramConfig() const { return telegram_config_; }

    void setDryRun(bool v) { engine_config_.dry_run = v; }
    void setForceSummary(bool v) { engine_config_.force_summary = v; }

    // Back to built-in defaults; tests load several documents in one process
    void reset();

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string exchange_base_url_ = "https://api.pionex.com";
    int http_timeout_seconds_ = 10;

    engine::EngineConfig engine_config_;
    analytics::UniverseConfig universe_config_;
    strategy::SignalAnalyzerConfig signal_config_;
    network::PionexClientConfig pionex_config_;
    PathsConfig paths_;
    TelegramConfig telegram_config_;
};

} // namespace gridradar
