#include "notify/LogAlertSink.h"
#include "common/Logger.h"

namespace gridradar {
namespace notify {

bool LogAlertSink::send(const std::string& text) {
    LOG_INFO("[alert]\n{}", text);
    sent_.push_back(text);
    return true;
}

} // namespace notify
} // namespace gridradar
