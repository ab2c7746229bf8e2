#include "strategy/GridPlanner.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace gridradar::strategy;

namespace {
bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}
}

int main() {
    std::cout << "[TEST] Starting GridPlanner Test..." << std::endl;

    GridPlanner planner;

    // Wide range with price near the bottom
    PriceRange range{100.0, 120.0};
    auto plan = planner.createPlan(range, 101.0, 0.005);
    assert(plan.has_value());
    assert(near(plan->low, 100.0) && near(plan->high, 120.0));
    assert(plan->grid_count == 17);
    assert(near(plan->cycle_days, 1.9));
    assert(plan->spacing_pct >= 0.35 && plan->spacing_pct <= 1.5);
    assert(std::abs(plan->spacing_pct - 1.108) < 0.001);

    const double vol = GridPlanner::calculateVolatilityPct(range, 101.0);
    assert(std::abs(vol - 19.802) < 0.001);
    assert(near(planner.calculateScore(vol, *plan), 62.5));

    // Narrow range needs too long a cycle
    assert(!planner.createPlan({100.0, 105.0}, 101.0, 0.0).has_value());
    assert(!planner.createPlan({100.0, 101.0}, 100.5, 0.0).has_value());

    // Degenerate input
    assert(!planner.createPlan({100.0, 100.0}, 100.0, 0.01).has_value());
    assert(!planner.createPlan({100.0, 120.0}, 0.0, 0.01).has_value());

    // Spacing clamps
    assert(near(planner.calculateSpacing(1.0), 1.5));
    assert(near(planner.calculateSpacing(200.0), 0.35));
    assert(near(planner.calculateSpacing(30.0), 0.75));
    assert(near(planner.calculateVolFactor(0.0, 0.0), 0.1));

    // Grid count floors: quiet markets halve and clamp at 4, others clamp at 10
    assert(planner.calculateGridCount({100.0, 101.0}, 100.5, 1.5, 0.995) == 4);
    assert(planner.calculateGridCount({100.0, 105.0}, 101.0, 1.5, 4.95) == 10);
    assert(planner.calculateGridCount({1.0, 100.0}, 1.0, 0.35, 9900.0) == 200);

    // Range breach
    assert(!planner.isOutsideRange(range, 99.5));
    assert(planner.isOutsideRange(range, 98.9));
    assert(!planner.isOutsideRange(range, 121.1));
    assert(planner.isOutsideRange(range, 121.3));

    auto widened_low = planner.widenRange(range, 98.0);
    assert(near(widened_low.low, 95.0) && near(widened_low.high, 120.0));
    auto widened_high = planner.widenRange(range, 130.0);
    assert(near(widened_high.low, 100.0) && near(widened_high.high, 130.0));
    auto untouched = planner.widenRange(range, 110.0);
    assert(near(untouched.low, 100.0) && near(untouched.high, 120.0));

    assert(near(roundTo(1.25, 1), 1.3));
    assert(near(roundTo(62.525, 1), 62.5));

    // Bounds hold across price levels, range widths, positions and dispersion
    int plans = 0;
    for (double low : {0.00002, 0.05, 1.0, 100.0, 65000.0}) {
        for (double width_frac : {0.001, 0.01, 0.05, 0.2, 1.0, 4.0}) {
            const PriceRange swept{low, low * (1.0 + width_frac)};
            for (double pos : {0.0, 0.1, 0.5, 0.9, 1.0}) {
                const double price = swept.low + swept.width() * pos;
                for (double sd : {0.0, 0.001, 0.01, 0.05, 0.3}) {
                    const double vol_pct = GridPlanner::calculateVolatilityPct(swept, price);
                    const double spacing = planner.calculateSpacing(planner.calculateVolFactor(vol_pct, sd));
                    assert(spacing >= 0.35 && spacing <= 1.5);
                    const int count = planner.calculateGridCount(swept, price, spacing, vol_pct);
                    assert(count >= 4 && count <= 200);

                    auto swept_plan = planner.createPlan(swept, price, sd);
                    if (!swept_plan) {
                        continue;
                    }
                    plans++;
                    assert(swept_plan->low < swept_plan->high);
                    assert(swept_plan->spacing_pct >= 0.35 && swept_plan->spacing_pct <= 1.5);
                    assert(swept_plan->grid_count >= 4 && swept_plan->grid_count <= 200);
                    assert(swept_plan->cycle_days > 0.0 && swept_plan->cycle_days <= 2.0);
                }
            }
        }
    }
    assert(plans > 0);

    std::cout << "[TEST] GridPlanner Test PASSED!" << std::endl;
    return 0;
}
