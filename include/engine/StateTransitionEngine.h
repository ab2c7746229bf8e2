#pragma once

#include "core/model/GridState.h"
#include "strategy/GridPlanner.h"
#include "strategy/GridSignal.h"
#include <optional>
#include <string>
#include <vector>

namespace gridradar {
namespace engine {

enum class TransitionKind {
    NEW,
    CONTINUING,
    FLIPPED,
    EXITED_BY_RANGE,            // still qualifies, but price left the recorded range
    EXITED_NO_LONGER_QUALIFIES  // no signal this scan
};

const char* transitionKindToString(TransitionKind kind);

struct Transition {
    std::string market;
    TransitionKind kind = TransitionKind::NEW;
    std::optional<strategy::GridSignal> signal;     // empty for EXITED_NO_LONGER_QUALIFIES
    std::optional<core::GridStateEntry> previous;   // empty for NEW
    double reference_price = 0.0;                   // signal price, or midpoint of the last range
    std::optional<strategy::PriceRange> tracked_range;  // EXITED_BY_RANGE: stored range after widening
};

struct CycleWarning {
    std::string market;
    core::GridStateEntry entry;
    double remaining_hours = 0.0;   // negative once the estimate is overdue
};

struct TransitionResult {
    core::GridStateMap next_state;
    std::vector<Transition> transitions;
    std::vector<CycleWarning> warnings;
};

// Diffs one scan's accepted signals against the previous persisted state
class StateTransitionEngine {
public:
    explicit StateTransitionEngine(const strategy::GridPlannerConfig& config = strategy::GridPlannerConfig());

    // `previous` is not modified; the returned next_state replaces it as a whole.
    // Signals held by the cooldown keep a tracked entry as it was and are
    // dropped for untracked instruments.
    TransitionResult apply(const core::GridStateMap& previous,
                           const std::vector<strategy::GridSignal>& signals,
                           Timestamp now) const;

    // Seconds left before the estimated cycle completes (negative when overdue)
    static double remainingCycleSeconds(const core::GridStateEntry& entry, Timestamp now);

    // max(1 hour, 10% of the total cycle)
    static double warningWindowSeconds(double cycle_days);

    static bool isCycleWarningDue(const core::GridStateEntry& entry, Timestamp now);

private:
    static core::GridStateEntry seedEntry(const strategy::GridSignal& signal, Timestamp now);

    strategy::GridPlanner planner_;
};

} // namespace engine
} // namespace gridradar
