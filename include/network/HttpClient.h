#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>

namespace gridradar {
namespace network {

// Unauthenticated libcurl client bound to one base URL. Calls are
// serialized on a single easy handle.
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(std::string base_url,
                        long timeout_seconds = 10,
                        std::string user_agent = "gridradar/1.0");
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Throws std::runtime_error on transport failure; HTTP errors come back as responses
    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {}
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) override;

private:
    HttpResponse perform(const std::string& url,
                         const std::string* post_body,
                         const char* content_type);

    std::string buildUrl(const std::string& endpoint,
                         const std::map<std::string, std::string>& params);

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string base_url_;
    long timeout_seconds_;
    std::string user_agent_;
    CURL* curl_;
    std::mutex mutex_;
};

} // namespace network
} // namespace gridradar
