#pragma once

#include "core/contracts/IAlertSink.h"
#include "network/IHttpClient.h"
#include <memory>
#include <string>

namespace gridradar {
namespace notify {

// Telegram Bot API sendMessage with Markdown parse mode
class TelegramNotifier : public core::IAlertSink {
public:
    TelegramNotifier(std::shared_ptr<network::IHttpClient> http,
                     std::string bot_token,
                     std::string chat_id);

    bool send(const std::string& text) override;

    bool isConfigured() const { return !bot_token_.empty() && !chat_id_.empty(); }

private:
    std::shared_ptr<network::IHttpClient> http_;
    std::string bot_token_;
    std::string chat_id_;
};

} // namespace notify
} // namespace gridradar
