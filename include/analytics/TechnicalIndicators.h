#pragma once

#include <vector>
#include <optional>
#include "common/Types.h"

namespace gridradar {
namespace analytics {

// Technical indicators over a close series (oldest first).
// Every function is pure; insufficient data yields a neutral or empty result.
class TechnicalIndicators {
public:
    // Wilder-smoothed RSI. 50 when fewer than period+1 samples.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);
    
    struct MACDResult {
        std::optional<double> macd;        // fast EMA - slow EMA
        std::optional<double> signal;      // EMA of the MACD series
        std::optional<double> histogram;   // macd - signal
    };
    // Empty result when fewer than `slow` samples
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);
    
    struct BollingerBands {
        std::optional<double> upper;
        std::optional<double> middle;
        std::optional<double> lower;
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);
    
    // Population standard deviation of the last `period` values, 0 if fewer
    static double calculateRollingStdDev(const std::vector<double>& values, int period = 30);
    
    // EMA series seeded with the first value, alpha = 2/(period+1)
    static std::vector<double> calculateEMASeries(const std::vector<double>& prices, int period);
    
    // Mean of the last `period` values
    static double calculateSMA(const std::vector<double>& prices, int period);
    
    // Close-to-close simple returns (fractional), one shorter than the input
    static std::vector<double> calculateReturns(const std::vector<double>& prices);
    
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    
private:
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double calculateMean(const std::vector<double>& values);
};

} // namespace analytics
} // namespace gridradar
