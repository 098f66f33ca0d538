#include "core/state/ParameterRepositoryJson.h"
#include "engine/RiskParameterStore.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace adaptiverisk;
using engine::RiskParameterStore;
namespace params = engine::params;

namespace {
std::filesystem::path makeTempDir(const std::string& tag) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("adaptiverisk_" + tag + "_" + std::to_string(stamp));
    std::filesystem::create_directories(dir);
    return dir;
}

void testDefaultsAndAudit() {
    RiskParameterStore store;
    assert(store.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD) == 0.95);
    assert(store.get(params::MAX_POSITION_SIZE_PCT) == 10.0);
    assert(store.get(params::MAX_PORTFOLIO_EXPOSURE_PCT) == 80.0);
    assert(store.get(params::DAILY_LOSS_LIMIT_PCT) == 2.0);
    assert(store.get(params::MIN_RISK_REWARD_RATIO) == 2.0);
    assert(store.get(params::LEARNING_AGGRESSION) == 0.5);
    assert(store.all().size() == RiskParameterStore::knownNames().size());

    auto seeded = store.record(params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
    assert(seeded.has_value());
    assert(seeded->change_reason == "Initial system setup");
    assert(!seeded->previous_value.has_value());
    assert(store.history(params::AUTO_TRADE_CONFIDENCE_THRESHOLD).size() == 1);

    auto result = store.set(params::AUTO_TRADE_CONFIDENCE_THRESHOLD, 0.9, "manual review");
    assert(result.ok());
    assert(result.old_value == 0.95);
    assert(result.new_value == 0.9);
    assert(!result.persisted);      // no repository attached
    assert(store.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD) == 0.9);

    auto changed = store.record(params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
    assert(changed->previous_value.has_value() && *changed->previous_value == 0.95);
    assert(changed->change_reason == "manual review");

    const auto trail = store.history(params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
    assert(trail.size() == 2);
    assert(trail.back().old_value.has_value() && *trail.back().old_value == 0.95);
    assert(trail.back().new_value == 0.9);
    assert(trail.back().reason == "manual review");
    assert(trail.back().changed_at >= trail.front().changed_at);
    std::cout << "[TEST] DefaultsAndAudit PASSED\n";
}

void testInvalidValuesRejected() {
    RiskParameterStore store;
    using Status = core::ParameterUpdateStatus;

    assert(store.set(params::AUTO_TRADE_CONFIDENCE_THRESHOLD, 1.5, "x").status == Status::INVALID_PARAMETER_VALUE);
    assert(store.set(params::AUTO_TRADE_CONFIDENCE_THRESHOLD, -0.1, "x").status == Status::INVALID_PARAMETER_VALUE);
    assert(store.set(params::MAX_POSITION_SIZE_PCT, -1.0, "x").status == Status::INVALID_PARAMETER_VALUE);
    assert(store.set(params::DAILY_LOSS_LIMIT_PCT, std::nan(""), "x").status == Status::INVALID_PARAMETER_VALUE);
    assert(store.set(params::MIN_RISK_REWARD_RATIO, std::numeric_limits<double>::infinity(), "x").status
           == Status::INVALID_PARAMETER_VALUE);

    // Rejections leave value and audit trail untouched
    assert(store.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD) == 0.95);
    assert(store.history(params::AUTO_TRADE_CONFIDENCE_THRESHOLD).size() == 1);

    // Boundaries are accepted
    assert(store.set(params::AUTO_TRADE_CONFIDENCE_THRESHOLD, 1.0, "edge").ok());
    assert(store.set(params::MAX_POSITION_SIZE_PCT, 0.0, "edge").ok());

    assert(store.get("no_such_parameter") == 0.0);
    assert(store.set("no_such_parameter", 1.0, "x").status == Status::UNKNOWN_PARAMETER);
    assert(store.update("no_such_parameter", [](double v) { return v; }, "x").status == Status::UNKNOWN_PARAMETER);
    assert(!store.record("no_such_parameter").has_value());
    assert(store.history("no_such_parameter").empty());
    std::cout << "[TEST] InvalidValuesRejected PASSED\n";
}

void testConfiguredDefaults() {
    engine::RiskDefaults defaults;
    defaults.auto_trade_confidence_threshold = 0.9;
    defaults.max_position_size_pct = -5.0;    // invalid, falls back to built-in
    RiskParameterStore store(defaults);
    assert(store.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD) == 0.9);
    assert(store.get(params::MAX_POSITION_SIZE_PCT) == 10.0);
    std::cout << "[TEST] ConfiguredDefaults PASSED\n";
}

void testConcurrentUpdates() {
    RiskParameterStore store;
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&store]() {
            for (int k = 0; k < 50; ++k) {
                auto r = store.update(params::MAX_POSITION_SIZE_PCT,
                                      [](double current) { return current + 1.0; },
                                      "increment");
                assert(r.ok());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    assert(store.get(params::MAX_POSITION_SIZE_PCT) == 410.0);
    assert(store.history(params::MAX_POSITION_SIZE_PCT).size() == 401);
    std::cout << "[TEST] ConcurrentUpdates PASSED\n";
}

void testPersistenceRoundTrip() {
    const auto dir = makeTempDir("params");
    const auto file = dir / "state" / "risk_parameters.json";

    {
        auto repo = std::make_shared<core::ParameterRepositoryJson>(file);
        RiskParameterStore store(engine::RiskDefaults(), repo);
        assert(std::filesystem::exists(file));
        assert(repo->getAllParameters().size() == RiskParameterStore::knownNames().size());

        auto r = store.set(params::AUTO_TRADE_CONFIDENCE_THRESHOLD, 0.85, "calibration");
        assert(r.ok());
        assert(r.persisted);
        assert(repo->getParameter(params::AUTO_TRADE_CONFIDENCE_THRESHOLD).value() == 0.85);
        assert(!repo->getParameter("missing").has_value());
    }

    {
        // Persisted values win over configured defaults
        engine::RiskDefaults defaults;
        defaults.auto_trade_confidence_threshold = 0.99;
        auto repo = std::make_shared<core::ParameterRepositoryJson>(file);
        RiskParameterStore reloaded(defaults, repo);
        assert(reloaded.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD) == 0.85);

        auto record = reloaded.record(params::AUTO_TRADE_CONFIDENCE_THRESHOLD);
        assert(record->previous_value.has_value() && *record->previous_value == 0.95);
        assert(record->change_reason == "calibration");
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] PersistenceRoundTrip PASSED\n";
}

void testCorruptFileFallsBackToDefaults() {
    const auto dir = makeTempDir("corrupt");
    const auto file = dir / "risk_parameters.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }

    auto repo = std::make_shared<core::ParameterRepositoryJson>(file);
    RiskParameterStore store(engine::RiskDefaults(), repo);
    assert(store.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD) == 0.95);
    // Seeding rewrote the file with valid content
    assert(repo->getParameter(params::DAILY_LOSS_LIMIT_PCT).value() == 2.0);

    {
        std::ofstream out(file, std::ios::trunc);
        out << R"({"parameters":{"auto_trade_confidence_threshold":{"value":3.0},"bogus":{"value":1.0}}})";
    }
    RiskParameterStore guarded(engine::RiskDefaults(), std::make_shared<core::ParameterRepositoryJson>(file));
    assert(guarded.get(params::AUTO_TRADE_CONFIDENCE_THRESHOLD) == 0.95);
    assert(guarded.all().count("bogus") == 0);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] CorruptFileFallsBackToDefaults PASSED\n";
}
}

int main() {
    std::cout << "[TEST] Starting RiskParameterStore Test..." << std::endl;
    testDefaultsAndAudit();
    testInvalidValuesRejected();
    testConfiguredDefaults();
    testConcurrentUpdates();
    testPersistenceRoundTrip();
    testCorruptFileFallsBackToDefaults();
    std::cout << "[TEST] RiskParameterStore PASSED" << std::endl;
    return 0;
}
