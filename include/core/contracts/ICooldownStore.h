#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace gridradar {
namespace core {

class ICooldownStore {
public:
    virtual ~ICooldownStore() = default;

    virtual std::optional<Timestamp> lastTrigger(const std::string& market) const = 0;
    virtual void recordTrigger(const std::string& market, Timestamp when) = 0;
};

} // namespace core
} // namespace gridradar
