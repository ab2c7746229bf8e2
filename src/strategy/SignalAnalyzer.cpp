#include "strategy/SignalAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <stdexcept>

namespace gridradar {
namespace strategy {

using analytics::TechnicalIndicators;

SignalAnalyzer::SignalAnalyzer(
    std::shared_ptr<network::IMarketDataProvider> provider,
    std::shared_ptr<CooldownTracker> cooldown,
    const SignalAnalyzerConfig& config)
    : provider_(std::move(provider))
    , cooldown_(std::move(cooldown))
    , config_(config)
    , planner_(config.grid)
    , classifier_(config.zone)
{
    if (!provider_ || !cooldown_) {
        throw std::invalid_argument("SignalAnalyzer requires a data provider and a cooldown tracker");
    }
}

SeriesAnalysis SignalAnalyzer::analyzeSeries(
    const std::string& market,
    const PriceSeries& closes,
    Resolution resolution) const
{
    SeriesAnalysis result;
    result.samples = closes.size();
    if (closes.empty()) {
        return result;
    }

    const double price = closes.back();
    auto [min_it, max_it] = std::minmax_element(closes.begin(), closes.end());
    PriceRange range{*min_it, *max_it};
    if (price <= 0.0 || range.width() <= 0.0) {
        return result;
    }

    result.price = price;
    result.range = range;
    result.indicators = computeIndicators(closes, range, price);

    auto zone = classifier_.classify(closes.size(), price, range, result.indicators);
    if (!zone) {
        return result;
    }

    auto plan = planner_.createPlan(range, price, result.indicators.std_dev);
    if (!plan) {
        LOG_DEBUG("{} rejected: cycle estimate out of bounds", market);
        return result;
    }

    GridSignal signal;
    signal.market = market;
    signal.zone = *zone;
    signal.price = price;
    signal.indicators = result.indicators;
    signal.plan = *plan;
    signal.score = planner_.calculateScore(result.indicators.volatility_pct, *plan);
    signal.resolution = resolution;
    result.signal = signal;
    return result;
}

IndicatorSet SignalAnalyzer::computeIndicators(
    const PriceSeries& closes,
    const PriceRange& range,
    double price) const
{
    const auto& cfg = config_.indicators;

    IndicatorSet indicators;
    indicators.rsi = TechnicalIndicators::calculateRSI(closes, cfg.rsi_period);

    auto bands = TechnicalIndicators::calculateBollingerBands(closes, cfg.bollinger_period, cfg.bollinger_k);
    indicators.bollinger_lower = bands.lower;
    indicators.bollinger_upper = bands.upper;

    auto macd = TechnicalIndicators::calculateMACD(closes, cfg.macd_fast, cfg.macd_slow, cfg.macd_signal);
    indicators.macd_line = macd.macd;
    indicators.macd_signal = macd.signal;

    // Dispersion of returns keeps std_dev comparable across price levels
    indicators.std_dev = TechnicalIndicators::calculateRollingStdDev(
        TechnicalIndicators::calculateReturns(closes), cfg.std_dev_period);
    indicators.volatility_pct = GridPlanner::calculateVolatilityPct(range, price);
    return indicators;
}

std::optional<GridSignal> SignalAnalyzer::analyzeMarket(const std::string& market, Timestamp now) {
    auto coarse = analyzeSeries(
        market,
        fetchCloses(market, config_.coarse_interval, config_.coarse_limit),
        Resolution::COARSE);

    if (coarse.indicators.volatility_pct >= config_.vol_threshold_pct) {
        auto fine = analyzeSeries(
            market,
            fetchCloses(market, config_.fine_interval, config_.fine_limit),
            Resolution::FINE);
        return gate(std::move(fine), now);
    }
    return gate(std::move(coarse), now);
}

std::optional<GridSignal> SignalAnalyzer::gate(SeriesAnalysis analysis, Timestamp now) {
    if (!analysis.signal) {
        return std::nullopt;
    }
    GridSignal& signal = *analysis.signal;
    if (!cooldown_->tryTrigger(signal.market, analysis.indicators.volatility_pct,
                               analysis.indicators.std_dev, now)) {
        LOG_DEBUG("{} qualifies but is still cooling down", signal.market);
        signal.cooldown_held = true;
    }
    return signal;
}

PriceSeries SignalAnalyzer::fetchCloses(const std::string& market, const std::string& interval, int limit) {
    try {
        return TechnicalIndicators::extractClosePrices(provider_->getKlines(market, interval, limit));
    } catch (const std::exception& e) {
        LOG_WARN("Klines({}) unavailable for {}: {}", interval, market, e.what());
        return {};
    }
}

} // namespace strategy
} // namespace gridradar
