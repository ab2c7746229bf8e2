#include "core/state/InMemoryCooldownStore.h"

namespace gridradar {
namespace core {

std::optional<Timestamp> InMemoryCooldownStore::lastTrigger(const std::string& market) const {
    auto it = entries_.find(market);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryCooldownStore::recordTrigger(const std::string& market, Timestamp when) {
    entries_[market] = when;
}

} // namespace core
} // namespace gridradar
