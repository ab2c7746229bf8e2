#include "core/state/CooldownStoreJson.h"
#include "core/state/GridStateStoreJson.h"
#include "common/Logger.h"

#include <fstream>

#include <nlohmann/json.hpp>

namespace gridradar {
namespace core {

CooldownStoreJson::CooldownStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

bool CooldownStoreJson::load() {
    entries_.clear();
    if (!std::filesystem::exists(file_path_)) {
        return true;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Cooldown file {} is malformed: {}", file_path_.string(), e.what());
        return false;
    }
    if (!raw.is_object()) {
        return false;
    }

    for (auto& [market, value] : raw.items()) {
        if (value.is_number_integer()) {
            entries_[market] = fromEpochSeconds(value.get<long long>());
        }
    }
    return true;
}

bool CooldownStoreJson::save() const {
    nlohmann::json raw = nlohmann::json::object();
    for (const auto& [market, when] : entries_) {
        raw[market] = toEpochSeconds(when);
    }
    return writeFileAtomically(file_path_, raw.dump(2));
}

} // namespace core
} // namespace gridradar
