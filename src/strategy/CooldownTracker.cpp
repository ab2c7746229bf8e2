#include "strategy/CooldownTracker.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace gridradar {
namespace strategy {

CooldownTracker::CooldownTracker(std::shared_ptr<core::ICooldownStore> store,
                                 const CooldownConfig& config)
    : store_(std::move(store))
    , config_(config)
{
    if (!store_) {
        throw std::invalid_argument("CooldownTracker requires a cooldown store");
    }
}

double CooldownTracker::cooldownSeconds(double volatility_pct, double std_dev) const {
    const double excess = (volatility_pct - config_.volatility_floor_pct) +
                          (std_dev - config_.std_dev_floor) * 100.0;
    return config_.base_seconds + std::max(0.0, excess) * config_.seconds_per_excess_unit;
}

bool CooldownTracker::canTrigger(
    const std::string& market,
    double volatility_pct,
    double std_dev,
    Timestamp now) const
{
    auto last = store_->lastTrigger(market);
    if (!last) {
        return true;
    }
    const double elapsed = std::chrono::duration<double>(now - *last).count();
    return elapsed >= cooldownSeconds(volatility_pct, std_dev);
}

bool CooldownTracker::tryTrigger(
    const std::string& market,
    double volatility_pct,
    double std_dev,
    Timestamp now)
{
    if (!canTrigger(market, volatility_pct, std_dev, now)) {
        LOG_DEBUG("{} suppressed by cooldown ({:.0f}s)", market,
                  cooldownSeconds(volatility_pct, std_dev));
        return false;
    }
    store_->recordTrigger(market, now);
    return true;
}

} // namespace strategy
} // namespace gridradar
