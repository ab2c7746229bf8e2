#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace gridradar {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // lower-case names

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }

    // Delay requested by the server on a 429, when it sent a numeric Retry-After
    std::optional<int> retryAfterSeconds() const {
        auto it = headers.find("retry-after");
        if (it == headers.end()) {
            return std::nullopt;
        }
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    // Throws nlohmann::json::parse_error on a non-JSON body
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// Transport seam: exchange and Telegram clients take this so tests can script replies
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) = 0;

    virtual HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) = 0;
};

} // namespace network
} // namespace gridradar
