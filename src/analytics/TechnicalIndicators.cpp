#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace gridradar {
namespace analytics {

namespace {
constexpr double kLossEpsilon = 1e-9;
}

// RSI (Wilder's smoothing)
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }
    
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    
    // Seed from the first `period` deltas
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    
    avg_gain /= period;
    avg_loss /= period;
    
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;
        
        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }
    
    double rs = avg_gain / std::max(avg_loss, kLossEpsilon);
    return 100.0 - (100.0 / (1.0 + rs));
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;
    
    if (fast <= 0 || slow <= 0 || signal_period <= 0 ||
        prices.size() < static_cast<size_t>(slow)) {
        return result;
    }
    
    // Both EMAs run over the full series so their indices line up
    auto fast_ema = calculateEMASeries(prices, fast);
    auto slow_ema = calculateEMASeries(prices, slow);
    
    std::vector<double> macd_series;
    macd_series.reserve(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        macd_series.push_back(fast_ema[i] - slow_ema[i]);
    }
    
    auto signal_series = calculateEMASeries(macd_series, signal_period);
    
    result.macd = macd_series.back();
    result.signal = signal_series.back();
    result.histogram = *result.macd - *result.signal;
    return result;
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerBands result;
    
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }
    
    std::vector<double> recent_prices(prices.end() - period, prices.end());
    
    double middle = calculateMean(recent_prices);
    double std_dev = calculateStandardDeviation(recent_prices, middle);
    
    result.middle = middle;
    result.upper = middle + (std_dev * std_dev_mult);
    result.lower = middle - (std_dev * std_dev_mult);
    return result;
}

double TechnicalIndicators::calculateRollingStdDev(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return 0.0;
    }
    std::vector<double> window(values.end() - period, values.end());
    return calculateStandardDeviation(window, calculateMean(window));
}

std::vector<double> TechnicalIndicators::calculateEMASeries(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (prices.empty() || period <= 0) return ema_values;
    
    double multiplier = 2.0 / (period + 1.0);
    ema_values.reserve(prices.size());
    
    double ema = prices.front();
    ema_values.push_back(ema);
    for (size_t i = 1; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }
    
    return ema_values;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;
    
    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }
    
    return sum / period;
}

std::vector<double> TechnicalIndicators::calculateReturns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2) return returns;
    
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        // A zero close would divide by zero; treat it as a flat bar
        returns.push_back(prices[i-1] != 0.0 ? (prices[i] - prices[i-1]) / prices[i-1] : 0.0);
    }
    return returns;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    
    return prices;
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace analytics
} // namespace gridradar
