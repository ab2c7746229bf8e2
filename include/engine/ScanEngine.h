#pragma once

#include "analytics/MarketScanner.h"
#include "core/contracts/IAlertSink.h"
#include "core/contracts/IGridStateStore.h"
#include "engine/EngineConfig.h"
#include "engine/StateTransitionEngine.h"
#include "strategy/SignalAnalyzer.h"
#include <memory>
#include <string>
#include <vector>

namespace gridradar {
namespace engine {

struct ScanReport {
    std::size_t candidates = 0;
    std::size_t signals = 0;
    std::size_t held = 0;           // qualified, but inside their cooldown window
    std::size_t alerts_sent = 0;
    std::size_t alerts_failed = 0;
    bool state_saved = false;
    TransitionResult result;
};

// One full pass: previous state -> universe -> per-instrument analysis ->
// transitions -> alerts -> replaced state
class ScanEngine {
public:
    ScanEngine(const EngineConfig& config,
               std::shared_ptr<analytics::MarketScanner> universe,
               std::shared_ptr<strategy::SignalAnalyzer> analyzer,
               std::shared_ptr<core::IGridStateStore> state_store,
               std::shared_ptr<core::IAlertSink> alert_sink,
               const StateTransitionEngine& transitions = StateTransitionEngine());

    // Throws when the universe cannot be fetched; single instrument failures
    // only drop that instrument
    ScanReport runScan(Timestamp now);

    // Alert texts for one scan, in transition order followed by cycle warnings
    std::vector<std::string> buildMessages(const TransitionResult& result) const;

private:
    void deliver(const std::vector<std::string>& messages, Timestamp now, ScanReport& report);
    void recordAlerts(const TransitionResult& result) const;

    EngineConfig config_;
    std::shared_ptr<analytics::MarketScanner> universe_;
    std::shared_ptr<strategy::SignalAnalyzer> analyzer_;
    std::shared_ptr<core::IGridStateStore> state_store_;
    std::shared_ptr<core::IAlertSink> alert_sink_;
    StateTransitionEngine transitions_;
};

} // namespace engine
} // namespace gridradar
