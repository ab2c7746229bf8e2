#pragma once

#include "core/contracts/ICooldownStore.h"
#include "strategy/StrategyConfig.h"
#include <memory>
#include <string>

namespace gridradar {
namespace strategy {

// Gates how often one instrument may trigger; the window grows with
// volatility and return dispersion above their floors.
class CooldownTracker {
public:
    CooldownTracker(std::shared_ptr<core::ICooldownStore> store,
                    const CooldownConfig& config = CooldownConfig());

    double cooldownSeconds(double volatility_pct, double std_dev) const;

    // now - last >= cooldown (an instrument that never triggered may trigger)
    bool canTrigger(const std::string& market, double volatility_pct,
                    double std_dev, Timestamp now) const;

    // Records `now` and returns true when permitted, otherwise leaves the store untouched
    bool tryTrigger(const std::string& market, double volatility_pct,
                    double std_dev, Timestamp now);

private:
    std::shared_ptr<core::ICooldownStore> store_;
    CooldownConfig config_;
};

} // namespace strategy
} // namespace gridradar
