#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace gridradar {
namespace network {

// Exchange market data. Implementations throw std::runtime_error on failure.
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual std::vector<Ticker> getTickers() = 0;

    // Oldest first; may return fewer than `limit` candles
    virtual std::vector<Candle> getKlines(const std::string& symbol,
                                          const std::string& interval,
                                          int limit) = 0;
};

} // namespace network
} // namespace gridradar
