#include "strategy/CooldownTracker.h"
#include "core/state/InMemoryCooldownStore.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace gridradar;

int main() {
    std::cout << "[TEST] Starting CooldownTracker Test..." << std::endl;

    auto store = std::make_shared<core::InMemoryCooldownStore>();
    strategy::CooldownTracker tracker(store);

    // Floors: no extra time at or below them
    assert(std::abs(tracker.cooldownSeconds(1.0, 0.01) - 300.0) < 1e-9);
    assert(std::abs(tracker.cooldownSeconds(0.2, 0.0) - 300.0) < 1e-9);
    // (5 - 1) + (0.03 - 0.01) * 100 = 6 excess units
    assert(std::abs(tracker.cooldownSeconds(5.0, 0.03) - 660.0) < 1e-6);

    // 7% volatility at the dispersion floor: exactly 660 s
    assert(tracker.cooldownSeconds(7.0, 0.01) == 660.0);

    const Timestamp t0 = fromEpochSeconds(1700000000);
    assert(tracker.canTrigger("BTC_USDT_PERP", 7.0, 0.01, t0));
    assert(tracker.tryTrigger("BTC_USDT_PERP", 7.0, 0.01, t0));
    assert(store->lastTrigger("BTC_USDT_PERP") == t0);

    // Inside the window: refused and the stored time is unchanged
    const Timestamp t1 = t0 + std::chrono::seconds(659);
    assert(!tracker.tryTrigger("BTC_USDT_PERP", 7.0, 0.01, t1));
    assert(store->lastTrigger("BTC_USDT_PERP") == t0);

    // Exactly at the boundary is allowed
    const Timestamp t2 = t0 + std::chrono::seconds(660);
    assert(tracker.tryTrigger("BTC_USDT_PERP", 7.0, 0.01, t2));
    assert(store->lastTrigger("BTC_USDT_PERP") == t2);

    // Instruments are independent
    assert(tracker.canTrigger("ETH_USDT_PERP", 7.0, 0.01, t2));

    bool threw = false;
    try {
        strategy::CooldownTracker invalid(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[TEST] CooldownTracker Test PASSED!" << std::endl;
    return 0;
}
