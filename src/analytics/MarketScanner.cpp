#include "analytics/MarketScanner.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace gridradar {
namespace analytics {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Shortest base a leveraged token can have once its suffix is removed ("BTC3L" -> "BTC")
constexpr size_t kMinLeveragedBaseLength = 3;
}

MarketScanner::MarketScanner(std::shared_ptr<network::IMarketDataProvider> provider,
                             const UniverseConfig& config)
    : provider_(std::move(provider))
    , config_(config)
{
    if (!provider_) {
        throw std::invalid_argument("MarketScanner requires a data provider");
    }
}

std::vector<CandidateScore> MarketScanner::rankCandidates() {
    auto tickers = provider_->getTickers();
    LOG_INFO("Tickers received: {}", tickers.size());

    std::vector<CandidateScore> scored;
    for (const auto& ticker : tickers) {
        if (ticker.close < config_.price_min || ticker.notional < config_.volume_min) {
            continue;
        }
        if (!isEligibleSymbol(ticker.symbol)) {
            continue;
        }

        try {
            throttleKlineCall();
            auto candles = provider_->getKlines(ticker.symbol, config_.quick_interval, config_.quick_limit);
            if (candles.empty() || ticker.close <= 0.0) {
                continue;
            }

            double max_high = candles.front().high;
            double min_low = candles.front().low;
            for (const auto& c : candles) {
                max_high = std::max(max_high, c.high);
                min_low = std::min(min_low, c.low);
            }

            CandidateScore candidate;
            candidate.symbol = ticker.symbol;
            candidate.width_pct = (max_high - min_low) / ticker.close * 100.0;
            candidate.notional = ticker.notional;
            candidate.score = quickScore(candidate.width_pct, ticker.notional);
            scored.push_back(candidate);
        } catch (const std::exception& e) {
            LOG_DEBUG("Quick fetch failed for {}: {}", ticker.symbol, e.what());
        }
    }

    std::sort(scored.begin(), scored.end(),
        [](const CandidateScore& a, const CandidateScore& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.symbol > b.symbol;
        });

    if (scored.size() > static_cast<size_t>(std::max(0, config_.top_candidates))) {
        scored.resize(static_cast<size_t>(std::max(0, config_.top_candidates)));
    }
    return scored;
}

std::vector<std::string> MarketScanner::discoverCandidates() {
    auto ranked = rankCandidates();
    std::vector<std::string> symbols;
    symbols.reserve(ranked.size());
    for (const auto& candidate : ranked) {
        symbols.push_back(candidate.symbol);
    }
    LOG_INFO("Candidates selected: {}", symbols.size());
    return symbols;
}

bool MarketScanner::isEligibleSymbol(const std::string& symbol) const {
    const std::string upper = toUpperCopy(symbol);
    const std::string base = upper.substr(0, upper.find('_'));
    if (base.empty()) {
        return false;
    }

    if (config_.wrapped.count(base) || config_.stable.count(base) || config_.excluded.count(base)) {
        return false;
    }

    for (const auto& suffix : config_.leveraged_suffixes) {
        if (endsWith(base, suffix) && base.size() - suffix.size() >= kMinLeveragedBaseLength) {
            return false;
        }
    }
    return true;
}

double MarketScanner::quickScore(double width_pct, double notional) {
    const double log_volume = notional > 0.0 ? std::log10(notional) : 0.0;
    return width_pct / std::max(1.0, log_volume);
}

void MarketScanner::throttleKlineCall() {
    if (config_.request_delay_ms <= 0) {
        return;
    }
    const auto min_gap = std::chrono::milliseconds(config_.request_delay_ms);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = now - last_kline_call_time_;
    if (elapsed < min_gap) {
        std::this_thread::sleep_for(min_gap - elapsed);
    }
    last_kline_call_time_ = std::chrono::steady_clock::now();
}

} // namespace analytics
} // namespace gridradar
