#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "analytics/MarketScanner.h"
#include "core/state/CooldownStoreJson.h"
#include "core/state/GridStateStoreJson.h"
#include "engine/ScanEngine.h"
#include "network/HttpClient.h"
#include "network/PionexClient.h"
#include "notify/AlertFormatter.h"
#include "notify/LogAlertSink.h"
#include "notify/TelegramNotifier.h"
#include "strategy/CooldownTracker.h"
#include "strategy/SignalAnalyzer.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace gridradar;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    bool dry_run = false;
    bool force_summary = false;
    bool show_help = false;
};

void printUsage() {
    std::cout << "Usage: gridradar [--config <path>] [--dry-run] [--force-summary]\n"
              << "  --config <path>   config file (default: config/config.json)\n"
              << "  --dry-run         log alerts only; state and cooldown files are not written\n"
              << "  --force-summary   send a summary even when nothing changed\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--force-summary") {
            options.force_summary = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::filesystem::path resolvePath(const std::string& path) {
    if (std::filesystem::path(path).is_absolute()) {
        return path;
    }
    return utils::PathUtils::resolveRelativePath(path);
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 1;
    }
    if (options.show_help) {
        printUsage();
        return 0;
    }

    auto& config = Config::getInstance();
    config.load(options.config_path);
    if (options.dry_run) {
        config.setDryRun(true);
    }
    if (options.force_summary) {
        config.setForceSummary(true);
    }

    const auto paths = config.getPaths();
    try {
        Logger::getInstance().initialize(resolvePath(paths.log_dir).string());
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    Logger::getInstance().setLevel(config.getLogLevel());

    const auto engine_config = config.getEngineConfig();
    const auto telegram_config = config.getTelegramConfig();

    std::shared_ptr<core::IAlertSink> sink;
    if (engine_config.dry_run || !telegram_config.enabled ||
        telegram_config.bot_token.empty() || telegram_config.chat_id.empty()) {
        sink = std::make_shared<notify::LogAlertSink>();
    } else {
        auto telegram_http = std::make_shared<network::HttpClient>(
            telegram_config.base_url, telegram_config.timeout_seconds);
        sink = std::make_shared<notify::TelegramNotifier>(
            telegram_http, telegram_config.bot_token, telegram_config.chat_id);
    }

    try {
        LOG_INFO("GridRadar scan starting (dry_run={}, force_summary={})",
                 engine_config.dry_run, engine_config.force_summary);

        auto http = std::make_shared<network::HttpClient>(
            config.getExchangeBaseUrl(), config.getHttpTimeoutSeconds());
        auto provider = std::make_shared<network::PionexClient>(http, config.getPionexConfig());

        auto cooldown_store = std::make_shared<core::CooldownStoreJson>(resolvePath(paths.cooldown_file));
        if (!cooldown_store->load()) {
            LOG_WARN("Cooldown file unreadable; starting with empty cooldowns");
        }

        const auto signal_config = config.getSignalConfig();
        auto cooldown = std::make_shared<strategy::CooldownTracker>(cooldown_store, signal_config.cooldown);
        auto analyzer = std::make_shared<strategy::SignalAnalyzer>(provider, cooldown, signal_config);
        auto universe = std::make_shared<analytics::MarketScanner>(provider, config.getUniverseConfig());
        auto state_store = std::make_shared<core::GridStateStoreJson>(resolvePath(paths.state_file));

        engine::ScanEngine scan_engine(
            engine_config, universe, analyzer, state_store, sink,
            engine::StateTransitionEngine(signal_config.grid));

        auto report = scan_engine.runScan(std::chrono::system_clock::now());

        if (!engine_config.dry_run && !cooldown_store->save()) {
            LOG_ERROR("Failed to save cooldowns");
        }

        if (!engine_config.dry_run && !report.state_saved) {
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Scan failed: {}", e.what());
        if (!sink->send(notify::AlertFormatter::formatFailure(e.what()))) {
            LOG_ERROR("Failure alert could not be delivered");
        }
        return 1;
    }
}
