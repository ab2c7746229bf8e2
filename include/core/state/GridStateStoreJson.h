#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IGridStateStore.h"

namespace gridradar {
namespace core {

class GridStateStoreJson : public IGridStateStore {
public:
    explicit GridStateStoreJson(std::filesystem::path file_path);

    std::optional<GridStateMap> load() override;
    bool save(const GridStateMap& state) override;

    static nlohmann::json toJson(const GridStateMap& state);
    // Rows with an unknown zone are dropped
    static GridStateMap fromJson(const nlohmann::json& raw);

private:
    std::filesystem::path file_path_;
};

// Writes `text` to `path` through a temporary file and a rename
bool writeFileAtomically(const std::filesystem::path& path, const std::string& text);

} // namespace core
} // namespace gridradar
