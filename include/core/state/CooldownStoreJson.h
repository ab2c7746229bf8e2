#pragma once

#include <filesystem>

#include "core/state/InMemoryCooldownStore.h"

namespace gridradar {
namespace core {

// Cooldown map persisted between invocations as {"market": epoch_seconds}
class CooldownStoreJson : public InMemoryCooldownStore {
public:
    explicit CooldownStoreJson(std::filesystem::path file_path);

    // Missing file leaves the store empty and still counts as success
    bool load();
    bool save() const;

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace gridradar
