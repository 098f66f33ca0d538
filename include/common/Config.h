#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace adaptiverisk {

class Config {
public:
    static Config& getInstance();

    // Window labels compare case-insensitively; stored lowercased.
    static std::string normalizeWindowLabel(std::string label);

    // Returns false when the file is missing or unreadable; defaults stay in effect.
    bool load(const std::string& config_path);
    void applyJson(const nlohmann::json& j);

    engine::SimulationConfig getSimulationConfig() const { return simulation_; }
    engine::RiskDefaults getRiskDefaults() const { return risk_defaults_; }
    engine::CalibrationConfig getCalibrationConfig() const { return calibration_; }
    engine::StorageConfig getStorageConfig() const { return storage_; }
    engine::LoggingConfig getLoggingConfig() const { return logging_; }

    double getInitialCapital() const { return simulation_.initial_capital; }
    void setInitialCapital(double v) { simulation_.initial_capital = v; }
    std::string getLogLevel() const { return logging_.level; }

    Config() = default;

private:
    engine::SimulationConfig simulation_;
    engine::RiskDefaults risk_defaults_;
    engine::CalibrationConfig calibration_;
    engine::StorageConfig storage_;
    engine::LoggingConfig logging_;
};

} // namespace adaptiverisk
