#pragma once

#include <string>

namespace gridradar {
namespace core {

class IAlertSink {
public:
    virtual ~IAlertSink() = default;

    // Delivers one pre-formatted message; false when delivery failed
    virtual bool send(const std::string& text) = 0;
};

} // namespace core
} // namespace gridradar
