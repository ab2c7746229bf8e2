#include "common/Config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    using namespace gridradar;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // Missing file keeps the defaults
    config.reset();
    config.load("/nonexistent/gridradar/config.json");
    assert(config.getSignalConfig().zone.voting_policy == strategy::VotingPolicy::RELAXED);
    assert(config.getSignalConfig().coarse_interval == "60M");
    assert(config.getUniverseConfig().top_candidates == 30);
    assert(config.getEngineConfig().max_message_length == 4000);
    assert(config.getPaths().state_file == "state/grid_state.json");

    const auto dir = std::filesystem::temp_directory_path() / "gridradar_test_config";
    std::filesystem::create_directories(dir);
    const auto path = dir / "config.json";
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({
            "log_level": "debug",
            "scanner": {"top_candidates": 12, "stable": ["USDT", "FDUSD"], "alert_continuing": true},
            "signal": {"voting_policy": "strict", "vol_threshold_pct": 4.5, "rsi_oversold": 30},
            "grid": {"cycle_max_days": 3.0},
            "paths": {"state_file": "/tmp/gridradar/state.json"},
            "telegram": {"bot_token": "ignored", "max_message_length": 3500}
        })";
    }

    setenv("TELEGRAM_TOKEN", " 123:abc ", 1);
    setenv("TELEGRAM_CHAT_ID", "42", 1);

    config.reset();
    config.load(path.string());

    assert(config.getLogLevel() == "debug");
    assert(config.getUniverseConfig().top_candidates == 12);
    assert(config.getUniverseConfig().stable.count("FDUSD") == 1);
    assert(config.getUniverseConfig().stable.count("USDC") == 0);
    assert(config.getUniverseConfig().wrapped.count("WBTC") == 1);
    assert(config.getEngineConfig().alert_continuing);
    assert(config.getEngineConfig().max_message_length == 3500);

    const auto signal = config.getSignalConfig();
    assert(signal.zone.voting_policy == strategy::VotingPolicy::STRICT);
    assert(signal.vol_threshold_pct == 4.5);
    assert(signal.zone.rsi_oversold == 30.0);
    assert(signal.zone.rsi_overbought == 65.0);
    assert(signal.grid.cycle_max_days == 3.0);
    assert(signal.grid.spacing_target_pct == 0.75);

    assert(config.getPaths().state_file == "/tmp/gridradar/state.json");
    assert(config.getPaths().cooldown_file == "state/cooldowns.json");

    // Credentials come from the environment only
    assert(config.getTelegramConfig().bot_token == "123:abc");
    assert(config.getTelegramConfig().chat_id == "42");

    // Inverted bounds are swapped rather than handed to the planner
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"grid": {"spacing_min_pct": 2.0, "spacing_max_pct": 0.5,
                            "min_grid_count": 50, "max_grid_count": 8}})";
    }
    config.reset();
    config.load(path.string());
    {
        const auto grid = config.getSignalConfig().grid;
        assert(grid.spacing_min_pct == 0.5 && grid.spacing_max_pct == 2.0);
        assert(grid.min_grid_count == 8 && grid.max_grid_count == 50);
        assert(grid.high_vol_min_grid_count == 10);
    }
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"grid": {"max_grid_count": 6}})";
    }
    config.reset();
    config.load(path.string());
    assert(config.getSignalConfig().grid.high_vol_min_grid_count == 6);

    // Malformed JSON never throws out of load
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ broken";
    }
    config.reset();
    config.load(path.string());
    assert(config.getUniverseConfig().top_candidates == 30);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
