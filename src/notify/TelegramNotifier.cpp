#include "notify/TelegramNotifier.h"
#include "common/Logger.h"

namespace gridradar {
namespace notify {

TelegramNotifier::TelegramNotifier(std::shared_ptr<network::IHttpClient> http,
                                   std::string bot_token,
                                   std::string chat_id)
    : http_(std::move(http))
    , bot_token_(std::move(bot_token))
    , chat_id_(std::move(chat_id)) {}

bool TelegramNotifier::send(const std::string& text) {
    if (!isConfigured() || !http_) {
        LOG_WARN("Telegram is not configured; alert dropped ({} chars)", text.size());
        return false;
    }

    nlohmann::json body;
    body["chat_id"] = chat_id_;
    body["text"] = text;
    body["parse_mode"] = "Markdown";

    try {
        // The endpoint carries the bot token, so it never goes into a log line
        auto response = http_->post("/bot" + bot_token_ + "/sendMessage", body);
        if (!response.isSuccess()) {
            LOG_ERROR("Telegram error: HTTP {} {}", response.status_code, response.body);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Telegram error: {}", e.what());
        return false;
    }
}

} // namespace notify
} // namespace gridradar
