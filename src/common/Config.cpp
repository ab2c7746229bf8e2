#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace gridradar {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

template <typename Set>
void readStringSet(const nlohmann::json& section, const char* key, Set& out) {
    if (!section.contains(key) || !section[key].is_array()) {
        return;
    }
    Set values;
    for (const auto& item : section[key]) {
        if (item.is_string()) {
            values.insert(values.end(), trimCopy(item.get<std::string>()));
        }
    }
    out = values;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    exchange_base_url_ = "https://api.pionex.com";
    http_timeout_seconds_ = 10;
    engine_config_ = engine::EngineConfig();
    universe_config_ = analytics::UniverseConfig();
    signal_config_ = strategy::SignalAnalyzerConfig();
    pionex_config_ = network::PionexClientConfig();
    paths_ = PathsConfig();
    telegram_config_ = TelegramConfig();
}

void Config::load(const std::string& path) {
    // Credentials never come from the file
    telegram_config_.bot_token = readEnvVar("TELEGRAM_TOKEN");
    telegram_config_.chat_id = readEnvVar("TELEGRAM_CHAT_ID");

    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cout << "Config loaded: voting="
                  << strategy::votingPolicyToString(signal_config_.zone.voting_policy)
                  << ", top=" << universe_config_.top_candidates << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }

    if (telegram_config_.enabled &&
        (telegram_config_.bot_token.empty() || telegram_config_.chat_id.empty())) {
        std::cout << "Warning: TELEGRAM_TOKEN or TELEGRAM_CHAT_ID is empty; alerts go to the log only." << std::endl;
    }
}

void Config::apply(const nlohmann::json& j) {
    log_level_ = j.value("log_level", log_level_);

    if (j.contains("telegram")) {
        const auto& t = j["telegram"];
        if (!trimCopy(t.value("bot_token", "")).empty()) {
            std::cout << "Warning: telegram.bot_token in config is ignored. Use TELEGRAM_TOKEN." << std::endl;
        }
        telegram_config_.enabled = t.value("enabled", telegram_config_.enabled);
        telegram_config_.base_url = t.value("base_url", telegram_config_.base_url);
        telegram_config_.timeout_seconds = t.value("timeout_seconds", telegram_config_.timeout_seconds);
        engine_config_.max_message_length = t.value("max_message_length", engine_config_.max_message_length);
    }

    if (j.contains("scanner")) {
        const auto& s = j["scanner"];
        exchange_base_url_ = s.value("base_url", exchange_base_url_);
        http_timeout_seconds_ = s.value("timeout_seconds", http_timeout_seconds_);

        pionex_config_.market_type = s.value("market_type", pionex_config_.market_type);
        pionex_config_.max_retries = s.value("max_retries", pionex_config_.max_retries);
        pionex_config_.retry_backoff_ms = s.value("retry_backoff_ms", pionex_config_.retry_backoff_ms);

        universe_config_.price_min = s.value("price_min", universe_config_.price_min);
        universe_config_.volume_min = s.value("volume_min", universe_config_.volume_min);
        universe_config_.quick_interval = s.value("quick_interval", universe_config_.quick_interval);
        universe_config_.quick_limit = s.value("quick_limit", universe_config_.quick_limit);
        universe_config_.top_candidates = s.value("top_candidates", universe_config_.top_candidates);
        universe_config_.request_delay_ms = s.value("kline_delay_ms", universe_config_.request_delay_ms);
        readStringSet(s, "wrapped", universe_config_.wrapped);
        readStringSet(s, "stable", universe_config_.stable);
        readStringSet(s, "excluded", universe_config_.excluded);
        readStringSet(s, "leveraged_suffixes", universe_config_.leveraged_suffixes);

        engine_config_.request_delay_ms = s.value("analyze_delay_ms", engine_config_.request_delay_ms);
        engine_config_.dry_run = s.value("dry_run", engine_config_.dry_run);
        engine_config_.force_summary = s.value("force_summary", engine_config_.force_summary);
        engine_config_.alert_continuing = s.value("alert_continuing", engine_config_.alert_continuing);
    }

    if (j.contains("signal")) {
        const auto& s = j["signal"];
        auto& sig = signal_config_;
        sig.coarse_interval = s.value("coarse_interval", sig.coarse_interval);
        sig.coarse_limit = s.value("coarse_limit", sig.coarse_limit);
        sig.fine_interval = s.value("fine_interval", sig.fine_interval);
        sig.fine_limit = s.value("fine_limit", sig.fine_limit);
        sig.vol_threshold_pct = s.value("vol_threshold_pct", sig.vol_threshold_pct);

        sig.indicators.rsi_period = s.value("rsi_period", sig.indicators.rsi_period);
        sig.indicators.bollinger_period = s.value("bollinger_period", sig.indicators.bollinger_period);
        sig.indicators.bollinger_k = s.value("bollinger_k", sig.indicators.bollinger_k);
        sig.indicators.macd_fast = s.value("macd_fast", sig.indicators.macd_fast);
        sig.indicators.macd_slow = s.value("macd_slow", sig.indicators.macd_slow);
        sig.indicators.macd_signal = s.value("macd_signal", sig.indicators.macd_signal);
        sig.indicators.std_dev_period = s.value("std_dev_period", sig.indicators.std_dev_period);

        sig.zone.min_samples = s.value("min_samples", sig.zone.min_samples);
        sig.zone.position_threshold = s.value("position_threshold", sig.zone.position_threshold);
        sig.zone.rsi_oversold = s.value("rsi_oversold", sig.zone.rsi_oversold);
        sig.zone.rsi_overbought = s.value("rsi_overbought", sig.zone.rsi_overbought);
        sig.zone.voting_policy = strategy::votingPolicyFromString(
            s.value("voting_policy", std::string(strategy::votingPolicyToString(sig.zone.voting_policy))));

        sig.cooldown.base_seconds = s.value("cooldown_base_seconds", sig.cooldown.base_seconds);
        sig.cooldown.seconds_per_excess_unit =
            s.value("cooldown_seconds_per_unit", sig.cooldown.seconds_per_excess_unit);
    }

    if (j.contains("grid")) {
        const auto& g = j["grid"];
        auto& grid = signal_config_.grid;
        grid.spacing_target_pct = g.value("spacing_target_pct", grid.spacing_target_pct);
        grid.spacing_min_pct = g.value("spacing_min_pct", grid.spacing_min_pct);
        grid.spacing_max_pct = g.value("spacing_max_pct", grid.spacing_max_pct);
        grid.cycle_max_days = g.value("cycle_max_days", grid.cycle_max_days);
        grid.stop_buffer = g.value("stop_buffer", grid.stop_buffer);
        grid.widen_factor = g.value("widen_factor", grid.widen_factor);
        grid.min_grid_count = g.value("min_grid_count", grid.min_grid_count);
        grid.max_grid_count = g.value("max_grid_count", grid.max_grid_count);

        // GridPlanner clamps against these bounds, which must stay ordered
        if (grid.spacing_min_pct > grid.spacing_max_pct) {
            std::cout << "Warning: grid.spacing_min_pct > grid.spacing_max_pct; swapping." << std::endl;
            std::swap(grid.spacing_min_pct, grid.spacing_max_pct);
        }
        if (grid.min_grid_count > grid.max_grid_count) {
            std::cout << "Warning: grid.min_grid_count > grid.max_grid_count; swapping." << std::endl;
            std::swap(grid.min_grid_count, grid.max_grid_count);
        }
        grid.high_vol_min_grid_count = std::clamp(
            grid.high_vol_min_grid_count, grid.min_grid_count, grid.max_grid_count);
    }

    if (j.contains("paths")) {
        const auto& p = j["paths"];
        paths_.state_file = p.value("state_file", paths_.state_file);
        paths_.cooldown_file = p.value("cooldown_file", paths_.cooldown_file);
        paths_.log_dir = p.value("log_dir", paths_.log_dir);
    }
}

} // namespace gridradar
