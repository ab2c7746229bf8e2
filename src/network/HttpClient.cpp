#include "network/HttpClient.h"
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace gridradar {
namespace network {

namespace {
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::string trimHeaderValue(std::string value) {
    value.erase(0, value.find_first_not_of(" \t\r\n"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    return value;
}
}

HttpClient::HttpClient(std::string base_url, long timeout_seconds, std::string user_agent)
    : base_url_(std::move(base_url))
    , timeout_seconds_(timeout_seconds)
    , user_agent_(std::move(user_agent))
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

HttpClient::~HttpClient() {
    curl_easy_cleanup(curl_);
    curl_global_cleanup();
}

HttpResponse HttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params
) {
    std::lock_guard<std::mutex> lock(mutex_);
    return perform(buildUrl(endpoint, query_params), nullptr, nullptr);
}

HttpResponse HttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body
) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string payload = body.dump();
    return perform(base_url_ + endpoint, &payload, "application/json");
}

HttpResponse HttpClient::perform(
    const std::string& url,
    const std::string* post_body,
    const char* content_type
) {
    HttpResponse response;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");

    HeaderList headers(curl_slist_append(nullptr, "Accept: application/json"), &curl_slist_free_all);
    if (content_type) {
        const std::string line = std::string("Content-Type: ") + content_type;
        headers.reset(curl_slist_append(headers.release(), line.c_str()));
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get());

    if (post_body) {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    const CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        // Path left out: Telegram endpoints embed the bot token
        throw std::runtime_error("HTTP request to " + base_url_ + " failed: " + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    return response;
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total_size = size * nitems;
    const std::string line(buffer, total_size);

    const size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = trimHeaderValue(line.substr(colon + 1));
    }
    return total_size;
}

std::string HttpClient::buildUrl(const std::string& endpoint,
                                 const std::map<std::string, std::string>& params) {
    std::string url = base_url_ + endpoint;
    char separator = '?';
    for (const auto& [key, value] : params) {
        char* escaped = curl_easy_escape(curl_, value.c_str(), static_cast<int>(value.size()));
        url += separator;
        url += key + "=" + (escaped ? escaped : value);
        if (escaped) {
            curl_free(escaped);
        }
        separator = '&';
    }
    return url;
}

} // namespace network
} // namespace gridradar
