#pragma once

#include <map>
#include <string>

#include "core/contracts/ICooldownStore.h"

namespace gridradar {
namespace core {

class InMemoryCooldownStore : public ICooldownStore {
public:
    std::optional<Timestamp> lastTrigger(const std::string& market) const override;
    void recordTrigger(const std::string& market, Timestamp when) override;

    const std::map<std::string, Timestamp>& entries() const { return entries_; }

protected:
    std::map<std::string, Timestamp> entries_;
};

} // namespace core
} // namespace gridradar
