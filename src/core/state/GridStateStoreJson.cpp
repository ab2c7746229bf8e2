#include "core/state/GridStateStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace gridradar {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;
}

GridStateStoreJson::GridStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<GridStateMap> GridStateStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("State file {} is malformed: {}", file_path_.string(), e.what());
        return std::nullopt;
    }
    return fromJson(raw);
}

bool GridStateStoreJson::save(const GridStateMap& state) {
    return writeFileAtomically(file_path_, toJson(state).dump(2));
}

nlohmann::json GridStateStoreJson::toJson(const GridStateMap& state) {
    nlohmann::json raw;
    raw["schema_version"] = kSchemaVersion;
    raw["entries"] = nlohmann::json::object();
    for (const auto& [market, entry] : state) {
        nlohmann::json row;
        row["zone"] = zoneToString(entry.zone);
        row["low"] = entry.low;
        row["high"] = entry.high;
        row["start_time"] = toEpochSeconds(entry.start_time);
        row["warned"] = entry.warned;
        row["cycle_days"] = entry.cycle_days;
        raw["entries"][market] = row;
    }
    return raw;
}

GridStateMap GridStateStoreJson::fromJson(const nlohmann::json& raw) {
    GridStateMap state;
    if (!raw.is_object() || !raw.contains("entries") || !raw["entries"].is_object()) {
        return state;
    }

    for (auto& [market, row] : raw["entries"].items()) {
        if (!row.is_object()) {
            continue;
        }
        auto zone = zoneFromString(row.value("zone", std::string()));
        if (!zone) {
            LOG_WARN("Dropping state entry {} with unknown zone", market);
            continue;
        }

        GridStateEntry entry;
        entry.zone = *zone;
        entry.low = row.value("low", 0.0);
        entry.high = row.value("high", 0.0);
        entry.start_time = fromEpochSeconds(row.value("start_time", 0LL));
        entry.warned = row.value("warned", false);
        entry.cycle_days = row.value("cycle_days", 0.0);
        state[market] = entry;
    }
    return state;
}

bool writeFileAtomically(const std::filesystem::path& path, const std::string& text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << text;
        if (!out) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (!ec) {
        return true;
    }

    // Some filesystems refuse rename over an existing file; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        path,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace gridradar
