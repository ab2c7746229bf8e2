#include "engine/ScanEngine.h"
#include "common/Logger.h"
#include "notify/AlertFormatter.h"
#include <chrono>
#include <stdexcept>
#include <thread>

namespace gridradar {
namespace engine {

namespace {
bool isHeld(const Transition& transition) {
    return transition.signal && transition.signal->cooldown_held;
}
}

ScanEngine::ScanEngine(
    const EngineConfig& config,
    std::shared_ptr<analytics::MarketScanner> universe,
    std::shared_ptr<strategy::SignalAnalyzer> analyzer,
    std::shared_ptr<core::IGridStateStore> state_store,
    std::shared_ptr<core::IAlertSink> alert_sink,
    const StateTransitionEngine& transitions)
    : config_(config)
    , universe_(std::move(universe))
    , analyzer_(std::move(analyzer))
    , state_store_(std::move(state_store))
    , alert_sink_(std::move(alert_sink))
    , transitions_(transitions)
{
    if (!universe_ || !analyzer_ || !state_store_ || !alert_sink_) {
        throw std::invalid_argument("ScanEngine requires universe, analyzer, state store and alert sink");
    }
}

ScanReport ScanEngine::runScan(Timestamp now) {
    ScanReport report;

    auto previous = state_store_->load().value_or(core::GridStateMap{});
    LOG_INFO("Previous state: {} instruments", previous.size());

    auto symbols = universe_->discoverCandidates();
    report.candidates = symbols.size();

    std::vector<strategy::GridSignal> signals;
    for (size_t i = 0; i < symbols.size(); ++i) {
        const auto& symbol = symbols[i];
        if (i > 0 && config_.request_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.request_delay_ms));
        }
        try {
            auto signal = analyzer_->analyzeMarket(symbol, now);
            if (signal) {
                LOG_INFO("{}: {} zone, score {:.1f} ({}{})", symbol, zoneToString(signal->zone),
                         signal->score, strategy::resolutionToString(signal->resolution),
                         signal->cooldown_held ? ", cooling down" : "");
                if (signal->cooldown_held) {
                    report.held++;
                }
                signals.push_back(*signal);
            }
        } catch (const std::exception& e) {
            LOG_WARN("Skip {}: {}", symbol, e.what());
        }
    }
    report.signals = signals.size() - report.held;

    report.result = transitions_.apply(previous, signals, now);
    recordAlerts(report.result);

    deliver(buildMessages(report.result), now, report);

    if (config_.dry_run) {
        LOG_INFO("Dry run: state not written ({} instruments)", report.result.next_state.size());
    } else {
        report.state_saved = state_store_->save(report.result.next_state);
        if (!report.state_saved) {
            LOG_ERROR("Failed to save grid state");
        }
    }

    LOG_INFO("Scan finished: {} candidates, {} signals ({} cooling down), {} alerts sent, {} failed",
             report.candidates, report.signals, report.held, report.alerts_sent, report.alerts_failed);
    return report;
}

std::vector<std::string> ScanEngine::buildMessages(const TransitionResult& result) const {
    std::vector<std::string> messages;
    for (const auto& transition : result.transitions) {
        if (transition.kind == TransitionKind::CONTINUING) {
            if (config_.alert_continuing && !isHeld(transition)) {
                messages.push_back(notify::AlertFormatter::formatContinuing(transition));
            }
            continue;
        }
        messages.push_back(notify::AlertFormatter::formatTransition(transition));
    }
    for (const auto& warning : result.warnings) {
        messages.push_back(notify::AlertFormatter::formatWarning(warning));
    }
    return messages;
}

void ScanEngine::deliver(const std::vector<std::string>& messages, Timestamp now, ScanReport& report) {
    std::vector<std::string> batch;
    if (messages.empty()) {
        if (!config_.force_summary) {
            LOG_INFO("No valid entries.");
            return;
        }
        batch.push_back(notify::AlertFormatter::formatNoOpportunities(now));
    } else {
        batch.push_back(notify::AlertFormatter::formatHeader(now));
        batch.insert(batch.end(), messages.begin(), messages.end());
    }

    for (const auto& chunk : notify::AlertFormatter::chunkMessages(batch, config_.max_message_length)) {
        if (alert_sink_->send(chunk)) {
            report.alerts_sent++;
        } else {
            report.alerts_failed++;
        }
    }
}

void ScanEngine::recordAlerts(const TransitionResult& result) const {
    for (const auto& transition : result.transitions) {
        if (transition.kind == TransitionKind::CONTINUING &&
            (!config_.alert_continuing || isHeld(transition))) {
            continue;
        }
        const auto kind = transitionKindToString(transition.kind);
        if (transition.signal) {
            Logger::getInstance().logAlert(transition.market, kind,
                zoneToString(transition.signal->zone),
                transition.signal->plan.low, transition.signal->plan.high, transition.signal->score);
        } else if (transition.previous) {
            Logger::getInstance().logAlert(transition.market, kind,
                zoneToString(transition.previous->zone),
                transition.previous->low, transition.previous->high, 0.0);
        }
    }
    for (const auto& warning : result.warnings) {
        Logger::getInstance().logAlert(warning.market, "CycleWarning",
            zoneToString(warning.entry.zone), warning.entry.low, warning.entry.high, 0.0);
    }
}

} // namespace engine
} // namespace gridradar
