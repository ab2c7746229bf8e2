#include "network/PionexClient.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace gridradar {
namespace network {

namespace {
double getDouble(const nlohmann::json& val) {
    try {
        if (val.is_string()) {
            return std::stod(val.get<std::string>());
        }
        if (val.is_number()) {
            return val.get<double>();
        }
    } catch (const std::exception&) {
    }
    return 0.0;
}

long long getInt64(const nlohmann::json& val) {
    if (val.is_number()) {
        return val.get<long long>();
    }
    if (val.is_string()) {
        try {
            return std::stoll(val.get<std::string>());
        } catch (const std::exception&) {
        }
    }
    return 0;
}
}

PionexClient::PionexClient(std::shared_ptr<IHttpClient> http, const PionexClientConfig& config)
    : http_(std::move(http))
    , config_(config)
{
    if (!http_) {
        throw std::invalid_argument("PionexClient requires an HTTP client");
    }
}

std::vector<Ticker> PionexClient::getTickers() {
    std::map<std::string, std::string> params;
    params["type"] = config_.market_type;

    auto data = requestData("/api/v1/market/tickers", params);
    return parseTickers(data);
}

std::vector<Candle> PionexClient::getKlines(
    const std::string& symbol,
    const std::string& interval,
    int limit)
{
    std::map<std::string, std::string> params;
    params["symbol"] = symbol;
    params["interval"] = interval;
    params["limit"] = std::to_string(limit);
    params["type"] = config_.market_type;

    auto data = requestData("/api/v1/market/klines", params);
    auto candles = parseKlines(data);
    if (candles.empty()) {
        throw std::runtime_error("no klines for " + symbol);
    }
    return candles;
}

std::vector<Ticker> PionexClient::parseTickers(const nlohmann::json& data) {
    std::vector<Ticker> tickers;
    const nlohmann::json* rows = &data;
    if (data.is_object() && data.contains("tickers")) {
        rows = &data["tickers"];
    }
    if (!rows->is_array()) {
        return tickers;
    }

    for (const auto& row : *rows) {
        if (!row.is_object() || !row.contains("symbol")) {
            continue;
        }
        Ticker t;
        t.symbol = row["symbol"].get<std::string>();
        t.close = row.contains("close") ? getDouble(row["close"]) : 0.0;
        t.notional = row.contains("amount") ? getDouble(row["amount"]) : 0.0;
        tickers.push_back(t);
    }
    return tickers;
}

std::vector<Candle> PionexClient::parseKlines(const nlohmann::json& data) {
    std::vector<Candle> candles;
    const nlohmann::json* rows = &data;
    if (data.is_object() && data.contains("klines")) {
        rows = &data["klines"];
    }
    if (!rows->is_array()) {
        return candles;
    }

    for (const auto& row : *rows) {
        Candle c;
        if (row.is_object()) {
            c.timestamp = row.contains("time") ? getInt64(row["time"]) : 0;
            c.open = row.contains("open") ? getDouble(row["open"]) : 0.0;
            c.high = row.contains("high") ? getDouble(row["high"]) : 0.0;
            c.low = row.contains("low") ? getDouble(row["low"]) : 0.0;
            c.close = row.contains("close") ? getDouble(row["close"]) : 0.0;
            c.volume = row.contains("volume") ? getDouble(row["volume"]) : 0.0;
        } else if (row.is_array() && row.size() >= 5) {
            c.timestamp = getInt64(row[0]);
            c.open = getDouble(row[1]);
            c.high = getDouble(row[2]);
            c.low = getDouble(row[3]);
            c.close = getDouble(row[4]);
            c.volume = row.size() > 5 ? getDouble(row[5]) : 0.0;
        } else {
            continue;
        }
        candles.push_back(c);
    }

    std::stable_sort(candles.begin(), candles.end(),
        [](const Candle& a, const Candle& b) { return a.timestamp < b.timestamp; });
    return candles;
}

nlohmann::json PionexClient::requestData(
    const std::string& endpoint,
    const std::map<std::string, std::string>& params)
{
    const int attempts = std::max(1, config_.max_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto response = http_->get(endpoint, params);

        if (response.isRateLimited()) {
            LOG_WARN("Rate limited on {} (attempt {}/{})", endpoint, attempt, attempts);
            if (attempt < attempts) {
                int delay_ms = config_.retry_backoff_ms;
                if (auto retry_after = response.retryAfterSeconds()) {
                    delay_ms = std::max(delay_ms, *retry_after * 1000);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
            continue;
        }
        if (!response.isSuccess()) {
            throw std::runtime_error("Request " + endpoint + " failed (" +
                                     std::to_string(response.status_code) + "): " + response.body);
        }

        auto body = response.json();
        if (body.is_object() && body.value("result", true) == false) {
            throw std::runtime_error("Request " + endpoint + " rejected: " + body.dump());
        }
        if (body.is_object() && body.contains("data")) {
            return body["data"];
        }
        return body;
    }
    throw std::runtime_error("429 rate-limit on " + endpoint);
}

} // namespace network
} // namespace gridradar
