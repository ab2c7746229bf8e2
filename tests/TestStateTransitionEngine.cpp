#include "engine/StateTransitionEngine.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <string>
#include <iostream>

using namespace gridradar;
using engine::StateTransitionEngine;
using engine::TransitionKind;

namespace {
strategy::GridSignal makeSignal(const std::string& market, Zone zone, double price,
                                double low, double high, double cycle_days = 1.5) {
    strategy::GridSignal signal;
    signal.market = market;
    signal.zone = zone;
    signal.price = price;
    signal.plan.low = low;
    signal.plan.high = high;
    signal.plan.spacing_pct = 1.0;
    signal.plan.grid_count = 20;
    signal.plan.cycle_days = cycle_days;
    signal.score = 50.0;
    return signal;
}

core::GridStateEntry makeEntry(Zone zone, double low, double high, Timestamp start,
                               double cycle_days = 1.5, bool warned = false) {
    core::GridStateEntry entry;
    entry.zone = zone;
    entry.low = low;
    entry.high = high;
    entry.start_time = start;
    entry.cycle_days = cycle_days;
    entry.warned = warned;
    return entry;
}

const engine::Transition* findTransition(const engine::TransitionResult& result, const std::string& market) {
    for (const auto& t : result.transitions) {
        if (t.market == market) return &t;
    }
    return nullptr;
}
}

int main() {
    std::cout << "[TEST] Starting StateTransitionEngine Test..." << std::endl;

    StateTransitionEngine transitions;
    const Timestamp t0 = fromEpochSeconds(1700000000);
    const Timestamp now = t0 + std::chrono::hours(2);

    // A and B tracked; scan yields B and C
    core::GridStateMap previous;
    previous["A"] = makeEntry(Zone::LONG, 10.0, 12.0, t0);
    previous["B"] = makeEntry(Zone::LONG, 100.0, 120.0, t0);

    std::vector<strategy::GridSignal> signals{
        makeSignal("B", Zone::LONG, 101.0, 99.0, 121.0),
        makeSignal("C", Zone::SHORT, 50.0, 40.0, 52.0),
    };
    auto result = transitions.apply(previous, signals, now);

    assert(result.transitions.size() == 3);
    assert(findTransition(result, "A")->kind == TransitionKind::EXITED_NO_LONGER_QUALIFIES);
    assert(!findTransition(result, "A")->signal.has_value());
    assert(findTransition(result, "A")->reference_price == 11.0);
    assert(findTransition(result, "B")->kind == TransitionKind::CONTINUING);
    assert(findTransition(result, "C")->kind == TransitionKind::NEW);
    assert(!findTransition(result, "C")->previous.has_value());

    assert(result.next_state.size() == 2);
    assert(result.next_state.count("A") == 0);
    // Continuing keeps the clock and refreshes the range
    assert(result.next_state["B"].start_time == t0);
    assert(result.next_state["B"].low == 99.0 && result.next_state["B"].high == 121.0);
    assert(result.next_state["C"].start_time == now);
    assert(result.next_state["C"].zone == Zone::SHORT);
    assert(!result.next_state["C"].warned);
    assert(result.warnings.empty());

    // previous is untouched
    assert(previous.size() == 2 && previous["B"].low == 100.0);

    // Flip resets the entry
    core::GridStateMap flipped_prev;
    flipped_prev["X"] = makeEntry(Zone::LONG, 100.0, 120.0, t0, 1.5, true);
    auto flipped = transitions.apply(flipped_prev,
        {makeSignal("X", Zone::SHORT, 119.0, 100.0, 120.0, 1.2)}, now);
    assert(flipped.transitions.size() == 1);
    assert(flipped.transitions[0].kind == TransitionKind::FLIPPED);
    assert(flipped.transitions[0].previous->zone == Zone::LONG);
    assert(flipped.next_state["X"].zone == Zone::SHORT);
    assert(flipped.next_state["X"].start_time == now);
    assert(!flipped.next_state["X"].warned);
    assert(flipped.next_state["X"].cycle_days == 1.2);

    // Same zone but price beyond the 1% buffer of the recorded range
    core::GridStateMap range_prev;
    range_prev["Y"] = makeEntry(Zone::LONG, 100.0, 120.0, t0);
    auto exited = transitions.apply(range_prev,
        {makeSignal("Y", Zone::LONG, 98.0, 90.0, 110.0)}, now);
    assert(exited.transitions[0].kind == TransitionKind::EXITED_BY_RANGE);
    assert(exited.next_state["Y"].low == 90.0 && exited.next_state["Y"].high == 120.0);
    assert(exited.next_state["Y"].start_time == now);
    assert(exited.transitions[0].tracked_range->high == 120.0);

    // Breached low side moves out by 5% when the plan does not already cover it
    auto widened = transitions.apply(range_prev,
        {makeSignal("Y", Zone::LONG, 98.0, 96.0, 110.0)}, now);
    assert(widened.transitions[0].kind == TransitionKind::EXITED_BY_RANGE);
    assert(std::abs(widened.next_state["Y"].low - 95.0) < 1e-9);
    assert(widened.next_state["Y"].high == 120.0);
    assert(std::abs(widened.transitions[0].tracked_range->low - 95.0) < 1e-9);

    // Breach on the high side
    auto above = transitions.apply(range_prev,
        {makeSignal("Y", Zone::LONG, 130.0, 110.0, 131.0)}, now);
    assert(above.transitions[0].kind == TransitionKind::EXITED_BY_RANGE);
    assert(above.next_state["Y"].low == 100.0);
    assert(above.next_state["Y"].high == 131.0);

    // Inside the buffer is still Continuing
    auto inside = transitions.apply(range_prev,
        {makeSignal("Y", Zone::LONG, 99.5, 95.0, 120.0)}, now);
    assert(inside.transitions[0].kind == TransitionKind::CONTINUING);

    // Cycle warning fires once within max(1h, 10%) of completion
    core::GridStateMap cycle_prev;
    cycle_prev["Z"] = makeEntry(Zone::LONG, 100.0, 120.0, t0, 1.0);
    const Timestamp early = t0 + std::chrono::hours(20);
    const Timestamp late = t0 + std::chrono::hours(22);      // 2h left, window 2.4h

    auto not_yet = transitions.apply(cycle_prev, {makeSignal("Z", Zone::LONG, 101.0, 100.0, 120.0)}, early);
    assert(not_yet.warnings.empty());
    assert(!not_yet.next_state["Z"].warned);

    auto warned = transitions.apply(cycle_prev, {makeSignal("Z", Zone::LONG, 101.0, 100.0, 120.0)}, late);
    assert(warned.warnings.size() == 1);
    assert(warned.warnings[0].market == "Z");
    assert(warned.warnings[0].remaining_hours > 1.9 && warned.warnings[0].remaining_hours < 2.1);
    assert(warned.next_state["Z"].warned);

    auto again = transitions.apply(warned.next_state,
        {makeSignal("Z", Zone::LONG, 101.0, 100.0, 120.0)}, late + std::chrono::hours(1));
    assert(again.warnings.empty());
    assert(again.next_state["Z"].warned);

    // Window floor of one hour for short cycles
    assert(StateTransitionEngine::warningWindowSeconds(0.1) == 3600.0);
    assert(std::abs(StateTransitionEngine::warningWindowSeconds(2.0) - 17280.0) < 1e-6);

    // Cooldown-held signals keep a tracked entry exactly as it was
    {
        core::GridStateMap held_prev;
        held_prev["H"] = makeEntry(Zone::LONG, 100.0, 120.0, t0, 1.5, true);

        auto same = makeSignal("H", Zone::LONG, 130.0, 110.0, 135.0);
        same.cooldown_held = true;
        auto flip = makeSignal("F", Zone::SHORT, 50.0, 45.0, 55.0);
        flip.cooldown_held = true;
        held_prev["F"] = makeEntry(Zone::LONG, 40.0, 60.0, t0);
        auto fresh = makeSignal("N", Zone::LONG, 10.0, 9.0, 11.0);
        fresh.cooldown_held = true;

        auto held = transitions.apply(held_prev, {same, flip, fresh}, now);
        assert(held.transitions.size() == 2);
        assert(findTransition(held, "H")->kind == TransitionKind::CONTINUING);
        assert(findTransition(held, "F")->kind == TransitionKind::CONTINUING);
        assert(findTransition(held, "N") == nullptr);
        assert(held.next_state.size() == 2 && held.next_state.count("N") == 0);
        assert(held.next_state["H"].low == 100.0 && held.next_state["H"].high == 120.0);
        assert(held.next_state["H"].start_time == t0 && held.next_state["H"].warned);
        assert(held.next_state["F"].zone == Zone::LONG);
        assert(held.next_state["F"].start_time == t0);
    }

    // Duplicate signals: first one wins
    auto dup = transitions.apply({}, {makeSignal("D", Zone::LONG, 1.0, 0.9, 1.2),
                                 makeSignal("D", Zone::SHORT, 1.0, 0.9, 1.2)}, now);
    assert(dup.transitions.size() == 1);
    assert(dup.next_state["D"].zone == Zone::LONG);

    // Empty scan over empty state
    auto empty = transitions.apply({}, {}, now);
    assert(empty.transitions.empty() && empty.next_state.empty() && empty.warnings.empty());

    assert(std::string(engine::transitionKindToString(TransitionKind::EXITED_BY_RANGE)) == "ExitedByRange");

    std::cout << "[TEST] StateTransitionEngine Test PASSED!" << std::endl;
    return 0;
}
