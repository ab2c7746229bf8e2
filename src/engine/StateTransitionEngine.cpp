#include "engine/StateTransitionEngine.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <set>

namespace gridradar {
namespace engine {

namespace {
constexpr double kSecondsPerDay = 86400.0;
constexpr double kMinWarningWindowSeconds = 3600.0;
constexpr double kWarningWindowFraction = 0.10;
}

const char* transitionKindToString(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::NEW: return "New";
        case TransitionKind::CONTINUING: return "Continuing";
        case TransitionKind::FLIPPED: return "Flipped";
        case TransitionKind::EXITED_BY_RANGE: return "ExitedByRange";
        case TransitionKind::EXITED_NO_LONGER_QUALIFIES: return "ExitedNoLongerQualifies";
    }
    return "New";
}

StateTransitionEngine::StateTransitionEngine(const strategy::GridPlannerConfig& config)
    : planner_(config) {}

TransitionResult StateTransitionEngine::apply(
    const core::GridStateMap& previous,
    const std::vector<strategy::GridSignal>& signals,
    Timestamp now) const
{
    TransitionResult result;
    std::set<std::string> seen;

    for (const auto& signal : signals) {
        if (!seen.insert(signal.market).second) {
            LOG_WARN("Duplicate signal for {} ignored", signal.market);
            continue;
        }

        auto prev_it = previous.find(signal.market);
        if (signal.cooldown_held && prev_it == previous.end()) {
            LOG_DEBUG("{} held by cooldown, not tracked yet", signal.market);
            continue;
        }

        Transition transition;
        transition.market = signal.market;
        transition.signal = signal;
        transition.reference_price = signal.price;

        if (prev_it == previous.end()) {
            transition.kind = TransitionKind::NEW;
            result.next_state[signal.market] = seedEntry(signal, now);
            result.transitions.push_back(std::move(transition));
            continue;
        }

        const core::GridStateEntry& prev = prev_it->second;
        transition.previous = prev;

        if (signal.cooldown_held) {
            transition.kind = TransitionKind::CONTINUING;
            result.next_state[signal.market] = prev;
        } else if (prev.zone != signal.zone) {
            // The cycle estimate is recomputed on a flip, so its clock restarts
            transition.kind = TransitionKind::FLIPPED;
            result.next_state[signal.market] = seedEntry(signal, now);
        } else if (planner_.isOutsideRange({prev.low, prev.high}, signal.price)) {
            transition.kind = TransitionKind::EXITED_BY_RANGE;
            // New entry spans the old range pushed past the breach and the fresh plan
            auto widened = planner_.widenRange({prev.low, prev.high}, signal.price);
            core::GridStateEntry entry = seedEntry(signal, now);
            entry.low = std::min(entry.low, widened.low);
            entry.high = std::max(entry.high, widened.high);
            transition.tracked_range = strategy::PriceRange{entry.low, entry.high};
            result.next_state[signal.market] = entry;
        } else {
            transition.kind = TransitionKind::CONTINUING;
            core::GridStateEntry carried = prev;
            carried.zone = signal.zone;
            carried.low = signal.plan.low;
            carried.high = signal.plan.high;
            result.next_state[signal.market] = carried;
        }
        result.transitions.push_back(std::move(transition));
    }

    for (const auto& [market, prev] : previous) {
        if (seen.count(market) > 0) {
            continue;
        }
        Transition transition;
        transition.market = market;
        transition.kind = TransitionKind::EXITED_NO_LONGER_QUALIFIES;
        transition.previous = prev;
        transition.reference_price = (prev.low + prev.high) / 2.0;
        result.transitions.push_back(std::move(transition));
    }

    for (auto& [market, entry] : result.next_state) {
        if (!isCycleWarningDue(entry, now)) {
            continue;
        }
        entry.warned = true;
        CycleWarning warning;
        warning.market = market;
        warning.entry = entry;
        warning.remaining_hours = remainingCycleSeconds(entry, now) / 3600.0;
        result.warnings.push_back(warning);
    }

    return result;
}

double StateTransitionEngine::remainingCycleSeconds(const core::GridStateEntry& entry, Timestamp now) {
    const double total = entry.cycle_days * kSecondsPerDay;
    const double elapsed = std::chrono::duration<double>(now - entry.start_time).count();
    return total - elapsed;
}

double StateTransitionEngine::warningWindowSeconds(double cycle_days) {
    return std::max(kMinWarningWindowSeconds, cycle_days * kSecondsPerDay * kWarningWindowFraction);
}

bool StateTransitionEngine::isCycleWarningDue(const core::GridStateEntry& entry, Timestamp now) {
    if (entry.warned || entry.cycle_days <= 0.0) {
        return false;
    }
    return remainingCycleSeconds(entry, now) <= warningWindowSeconds(entry.cycle_days);
}

core::GridStateEntry StateTransitionEngine::seedEntry(const strategy::GridSignal& signal, Timestamp now) {
    core::GridStateEntry entry;
    entry.zone = signal.zone;
    entry.low = signal.plan.low;
    entry.high = signal.plan.high;
    entry.start_time = now;
    entry.warned = false;
    entry.cycle_days = signal.plan.cycle_days;
    return entry;
}

} // namespace engine
} // namespace gridradar
