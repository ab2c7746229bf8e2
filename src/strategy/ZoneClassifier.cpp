#include "strategy/ZoneClassifier.h"

namespace gridradar {
namespace strategy {

ZoneClassifier::ZoneClassifier(const ZoneClassifierConfig& config)
    : config_(config) {}

std::optional<Zone> ZoneClassifier::classify(
    std::size_t sample_count,
    double price,
    const PriceRange& range,
    const IndicatorSet& indicators) const
{
    if (sample_count < static_cast<std::size_t>(config_.min_samples) || price <= 0.0) {
        return std::nullopt;
    }

    auto position = rangePosition(price, range);
    if (!position || isCentered(*position)) {
        return std::nullopt;
    }

    const ZoneVotes votes = countVotes(price, indicators);
    const int required = requiredVotes(config_.voting_policy);

    if (votes.long_votes >= required) return Zone::LONG;
    if (votes.short_votes >= required) return Zone::SHORT;
    return std::nullopt;
}

ZoneVotes ZoneClassifier::countVotes(double price, const IndicatorSet& indicators) const {
    ZoneVotes votes;

    if (indicators.rsi < config_.rsi_oversold) votes.long_votes++;
    if (indicators.rsi > config_.rsi_overbought) votes.short_votes++;

    if (indicators.bollinger_lower && price < *indicators.bollinger_lower) votes.long_votes++;
    if (indicators.bollinger_upper && price > *indicators.bollinger_upper) votes.short_votes++;

    if (indicators.macd_line && indicators.macd_signal) {
        if (*indicators.macd_line > *indicators.macd_signal) votes.long_votes++;
        if (*indicators.macd_line < *indicators.macd_signal) votes.short_votes++;
    }

    return votes;
}

std::optional<double> ZoneClassifier::rangePosition(double price, const PriceRange& range) {
    if (range.width() <= 0.0) {
        return std::nullopt;
    }
    return (price - range.low) / range.width();
}

bool ZoneClassifier::isCentered(double position) const {
    return position >= config_.position_threshold &&
           position <= 1.0 - config_.position_threshold;
}

} // namespace strategy
} // namespace gridradar
