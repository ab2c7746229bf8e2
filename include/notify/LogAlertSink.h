#pragma once

#include "core/contracts/IAlertSink.h"
#include <string>
#include <vector>

namespace gridradar {
namespace notify {

// Log-only sink for dry runs and missing Telegram credentials
class LogAlertSink : public core::IAlertSink {
public:
    bool send(const std::string& text) override;

    const std::vector<std::string>& sent() const { return sent_; }

private:
    std::vector<std::string> sent_;
};

} // namespace notify
} // namespace gridradar
