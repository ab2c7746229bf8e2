#pragma once

#include "network/IHttpClient.h"
#include "network/IMarketDataProvider.h"
#include <memory>
#include <string>

namespace gridradar {
namespace network {

struct PionexClientConfig {
    std::string market_type = "PERP";
    int max_retries = 3;              // attempts on HTTP 429
    int retry_backoff_ms = 3000;
};

// Public Pionex market endpoints (tickers and klines)
class PionexClient : public IMarketDataProvider {
public:
    PionexClient(std::shared_ptr<IHttpClient> http, const PionexClientConfig& config = PionexClientConfig());

    std::vector<Ticker> getTickers() override;
    std::vector<Candle> getKlines(const std::string& symbol,
                                  const std::string& interval,
                                  int limit) override;

    // Accepts both object rows and positional arrays [time, open, high, low, close, volume];
    // the result is sorted oldest first
    static std::vector<Candle> parseKlines(const nlohmann::json& data);
    static std::vector<Ticker> parseTickers(const nlohmann::json& data);

private:
    nlohmann::json requestData(const std::string& endpoint,
                               const std::map<std::string, std::string>& params);

    std::shared_ptr<IHttpClient> http_;
    PionexClientConfig config_;
};

} // namespace network
} // namespace gridradar
