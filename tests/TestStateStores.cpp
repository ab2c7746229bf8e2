#include "core/state/CooldownStoreJson.h"
#include "core/state/GridStateStoreJson.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace gridradar;

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "gridradar_test_state";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    // Grid state: nothing saved yet
    core::GridStateStoreJson store(dir / "grid_state.json");
    if (store.load().has_value()) {
        std::cerr << "[TEST] load() before save should be empty\n";
        return 1;
    }

    core::GridStateMap state;
    core::GridStateEntry entry;
    entry.zone = Zone::SHORT;
    entry.low = 0.01234;
    entry.high = 0.0156;
    entry.start_time = fromEpochSeconds(1700000123);
    entry.warned = true;
    entry.cycle_days = 1.4;
    state["DOGE_USDT_PERP"] = entry;

    if (!store.save(state)) {
        std::cerr << "[TEST] save() failed\n";
        return 1;
    }
    if (std::filesystem::exists(dir / "grid_state.json.tmp")) {
        std::cerr << "[TEST] temporary file left behind\n";
        return 1;
    }

    auto loaded = store.load();
    if (!loaded || loaded->size() != 1) {
        std::cerr << "[TEST] load() after save should return one entry\n";
        return 1;
    }
    const auto& row = loaded->at("DOGE_USDT_PERP");
    if (row.zone != Zone::SHORT || row.low != 0.01234 || row.high != 0.0156 ||
        row.start_time != entry.start_time || !row.warned || row.cycle_days != 1.4) {
        std::cerr << "[TEST] loaded entry differs from saved entry\n";
        return 1;
    }

    // Saving replaces the whole mapping
    if (!store.save({}) || !store.load() || !store.load()->empty()) {
        std::cerr << "[TEST] empty save should clear the stored mapping\n";
        return 1;
    }

    // Unknown zones are dropped, malformed files read as nothing
    {
        std::ofstream out(dir / "grid_state.json", std::ios::trunc);
        out << R"({"schema_version":1,"entries":{"A":{"zone":"Sideways","low":1,"high":2},)"
            << R"("B":{"zone":"Long","low":1,"high":2,"start_time":5,"warned":false,"cycle_days":0.5}}})";
    }
    auto filtered = store.load();
    if (!filtered || filtered->size() != 1 || filtered->count("B") != 1) {
        std::cerr << "[TEST] unknown zone should be dropped\n";
        return 1;
    }
    {
        std::ofstream out(dir / "grid_state.json", std::ios::trunc);
        out << "{not json";
    }
    if (store.load().has_value()) {
        std::cerr << "[TEST] malformed state file should load as empty\n";
        return 1;
    }

    // Cooldowns
    core::CooldownStoreJson cooldowns(dir / "cooldowns.json");
    if (!cooldowns.load() || !cooldowns.entries().empty()) {
        std::cerr << "[TEST] missing cooldown file should load as empty\n";
        return 1;
    }
    cooldowns.recordTrigger("BTC_USDT_PERP", fromEpochSeconds(1700000000));
    cooldowns.recordTrigger("ETH_USDT_PERP", fromEpochSeconds(1700000600));
    if (!cooldowns.save()) {
        std::cerr << "[TEST] cooldown save() failed\n";
        return 1;
    }

    core::CooldownStoreJson reloaded(dir / "cooldowns.json");
    if (!reloaded.load() || reloaded.entries().size() != 2) {
        std::cerr << "[TEST] cooldown reload should return two entries\n";
        return 1;
    }
    auto last = reloaded.lastTrigger("ETH_USDT_PERP");
    if (!last || toEpochSeconds(*last) != 1700000600) {
        std::cerr << "[TEST] unexpected cooldown timestamp\n";
        return 1;
    }
    if (reloaded.lastTrigger("SOL_USDT_PERP").has_value()) {
        std::cerr << "[TEST] unknown market should have no trigger\n";
        return 1;
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] StateStores PASSED\n";
    return 0;
}
