#pragma once

#include <optional>

#include "core/model/GridState.h"

namespace gridradar {
namespace core {

class IGridStateStore {
public:
    virtual ~IGridStateStore() = default;

    // std::nullopt when nothing was saved yet or the stored data is unreadable
    virtual std::optional<GridStateMap> load() = 0;
    // Replaces the stored mapping as a whole
    virtual bool save(const GridStateMap& state) = 0;
};

} // namespace core
} // namespace gridradar
